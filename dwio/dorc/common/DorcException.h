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

#include <folly/FixedString.h>
#include <folly/synchronization/CallOnce.h>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include "velox/common/base/VeloxException.h"

namespace facebook::dorc {

namespace error_code {
using namespace folly::string_literals;

// An argument or option supplied by the caller is invalid.
inline constexpr auto InvalidArgument = "INVALID_ARGUMENT"_fs;

// An internal invariant does not hold.
inline constexpr auto InvalidState = "INVALID_STATE"_fs;

// A code path that cannot be taken was taken.
inline constexpr auto UnreachableCode = "UNREACHABLE_CODE"_fs;

// A schema node carries a kind no column writer exists for.
inline constexpr auto UnsupportedKind = "UNSUPPORTED_KIND"_fs;

// A known kind that the active file encoding (ORC or DWRF) cannot store.
inline constexpr auto UnsupportedForEncoding = "UNSUPPORTED_FOR_ENCODING"_fs;

// The physical schema and the logical type disagree in shape, or a schema
// node references an ordinal that does not exist.
inline constexpr auto MalformedSchema = "MALFORMED_SCHEMA"_fs;
} // namespace error_code

// Source position of a failed check. The check macros keep one static
// instance per call site.
struct ErrorLocation {
  const char* file;
  size_t line;
  const char* function;
  // Text of the failed condition. Empty for unconditional raises.
  const char* expression;
  std::string_view errorCode;
};

// Base of all dorc exceptions. Every dorc error is fatal for the operation
// that raised it.
class DorcException : public std::exception {
 public:
  // Renders name, message, code, location, the velox exception context and
  // the stack trace. Symbolization happens on first call.
  const char* what() const noexcept override;

  virtual std::string_view exceptionName() const = 0;

  // "USER" or "INTERNAL".
  virtual std::string_view errorSource() const = 0;

  const ErrorLocation& location() const {
    return location_;
  }

  const std::string& errorCode() const {
    return errorCode_;
  }

  const std::string& errorMessage() const {
    return errorMessage_;
  }

  // Messages of the essential velox exception contexts active on the
  // throwing thread, innermost first, joined by " in ".
  const std::string& context() const {
    return context_;
  }

 protected:
  DorcException(
      const ErrorLocation& location,
      std::string_view errorMessage,
      velox::VeloxException::Type contextType);

 private:
  std::string render() const;

  const ErrorLocation location_;
  const std::string errorCode_;
  const std::string errorMessage_;
  const std::string context_;
  std::vector<uintptr_t> stackFrames_;

  mutable folly::once_flag renderOnce_;
  mutable std::string rendered_;
};

// The caller supplied a schema or options the writer cannot honor.
class DorcUserError final : public DorcException {
 public:
  DorcUserError(const ErrorLocation& location, std::string_view errorMessage)
      : DorcException{
            location,
            errorMessage,
            velox::VeloxException::Type::kUser} {}

  std::string_view exceptionName() const override {
    return "DorcUserError";
  }

  std::string_view errorSource() const override {
    return "USER";
  }
};

// A broken internal invariant, i.e. a bug in dorc.
class DorcInternalError final : public DorcException {
 public:
  DorcInternalError(
      const ErrorLocation& location,
      std::string_view errorMessage)
      : DorcException{
            location,
            errorMessage,
            velox::VeloxException::Type::kSystem} {}

  std::string_view exceptionName() const override {
    return "DorcInternalError";
  }

  std::string_view errorSource() const override {
    return "INTERNAL";
  }
};

} // namespace facebook::dorc
