/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <folly/Likely.h>

#include "dwio/dorc/common/DorcException.h"
#include "dwio/dorc/common/ExceptionHelper.h"

// Check and raise macros used throughout dorc. Every macro accepts either no
// message, a plain message, or a fmt format string followed by its arguments.

namespace facebook::dorc::detail {

// Out of line so the throwing path stays out of every check site.
template <typename Exception, typename Msg>
[[noreturn]] void dorcCheckFail(const ErrorLocation& location, Msg msg) {
  throw Exception(location, std::string_view{msg});
}

template <typename T>
struct DorcCheckFailStringType;

template <>
struct DorcCheckFailStringType<CompileTimeEmptyString> {
  using type = CompileTimeEmptyString;
};

template <>
struct DorcCheckFailStringType<const char*> {
  using type = const char*;
};

template <>
struct DorcCheckFailStringType<std::string> {
  using type = const std::string&;
};

#define DORC_DECLARE_CHECK_FAIL_TEMPLATES(exceptionType)                    \
  extern template void dorcCheckFail<exceptionType, const char*>(           \
      const ErrorLocation&, const char*);                                   \
  extern template void dorcCheckFail<exceptionType, const std::string&>(    \
      const ErrorLocation&, const std::string&);                            \
  extern template void dorcCheckFail<exceptionType, CompileTimeEmptyString>( \
      const ErrorLocation&, CompileTimeEmptyString)

#define DORC_DEFINE_CHECK_FAIL_TEMPLATES(exceptionType)              \
  template void dorcCheckFail<exceptionType, const char*>(           \
      const ErrorLocation&, const char*);                            \
  template void dorcCheckFail<exceptionType, const std::string&>(    \
      const ErrorLocation&, const std::string&);                     \
  template void dorcCheckFail<exceptionType, CompileTimeEmptyString>( \
      const ErrorLocation&, CompileTimeEmptyString)

DORC_DECLARE_CHECK_FAIL_TEMPLATES(DorcUserError);
DORC_DECLARE_CHECK_FAIL_TEMPLATES(DorcInternalError);

} // namespace facebook::dorc::detail

#define _DORC_THROW_IMPL(exception, exprStr, errorCode, ...)            \
  do {                                                                  \
    static const ::facebook::dorc::ErrorLocation dorcErrorLocation{     \
        __FILE__, __LINE__, __FUNCTION__, exprStr, errorCode};          \
    auto message = ::facebook::dorc::errorMessage(__VA_ARGS__);         \
    ::facebook::dorc::detail::dorcCheckFail<                            \
        exception,                                                      \
        typename ::facebook::dorc::detail::DorcCheckFailStringType<     \
            decltype(message)>::type>(dorcErrorLocation, message);      \
  } while (0)

#define _DORC_CHECK_AND_THROW_IMPL(exprStr, expr, exception, errorCode, ...) \
  if (FOLLY_UNLIKELY(!(expr))) {                                             \
    _DORC_THROW_IMPL(exception, exprStr, errorCode, ##__VA_ARGS__);          \
  }

#define DORC_RAISE_USER_ERROR(code, ...) \
  _DORC_THROW_IMPL(::facebook::dorc::DorcUserError, "", code, ##__VA_ARGS__)

#define DORC_RAISE_INTERNAL_ERROR(code, ...) \
  _DORC_THROW_IMPL(                          \
      ::facebook::dorc::DorcInternalError, "", code, ##__VA_ARGS__)

// Internal invariants. Failure means a bug in dorc.
#define DORC_CHECK(expr, ...)                     \
  _DORC_CHECK_AND_THROW_IMPL(                     \
      #expr,                                      \
      expr,                                       \
      ::facebook::dorc::DorcInternalError,        \
      ::facebook::dorc::error_code::InvalidState, \
      ##__VA_ARGS__)

// Caller supplied arguments or options.
#define DORC_USER_CHECK(expr, ...)                   \
  _DORC_CHECK_AND_THROW_IMPL(                        \
      #expr,                                         \
      expr,                                          \
      ::facebook::dorc::DorcUserError,               \
      ::facebook::dorc::error_code::InvalidArgument, \
      ##__VA_ARGS__)

// The physical schema and the logical type must describe the same tree.
#define DORC_CHECK_SCHEMA(expr, ...)                 \
  _DORC_CHECK_AND_THROW_IMPL(                        \
      #expr,                                         \
      expr,                                          \
      ::facebook::dorc::DorcUserError,               \
      ::facebook::dorc::error_code::MalformedSchema, \
      ##__VA_ARGS__)

#define DORC_USER_FAIL(...) \
  DORC_RAISE_USER_ERROR(    \
      ::facebook::dorc::error_code::InvalidArgument, ##__VA_ARGS__)

// No column writer exists for the schema kind.
#define DORC_UNSUPPORTED_KIND(...) \
  DORC_RAISE_USER_ERROR(           \
      ::facebook::dorc::error_code::UnsupportedKind, ##__VA_ARGS__)

// The schema kind exists, but the selected file encoding cannot store it.
#define DORC_UNSUPPORTED_FOR_ENCODING(...) \
  DORC_RAISE_USER_ERROR(                   \
      ::facebook::dorc::error_code::UnsupportedForEncoding, ##__VA_ARGS__)

#define DORC_UNREACHABLE(...) \
  DORC_RAISE_INTERNAL_ERROR(  \
      ::facebook::dorc::error_code::UnreachableCode, ##__VA_ARGS__)

#define _DORC_CHECK_OP(checkMacro, expr1, expr2, op) \
  checkMacro((expr1)op(expr2), "({} vs. {})", expr1, expr2)

#define DORC_CHECK_EQ(e1, e2) _DORC_CHECK_OP(DORC_CHECK, e1, e2, ==)
#define DORC_CHECK_LT(e1, e2) _DORC_CHECK_OP(DORC_CHECK, e1, e2, <)
#define DORC_USER_CHECK_GT(e1, e2) _DORC_CHECK_OP(DORC_USER_CHECK, e1, e2, >)
#define DORC_CHECK_SCHEMA_EQ(e1, e2) \
  _DORC_CHECK_OP(DORC_CHECK_SCHEMA, e1, e2, ==)
#define DORC_CHECK_SCHEMA_LT(e1, e2) \
  _DORC_CHECK_OP(DORC_CHECK_SCHEMA, e1, e2, <)
