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
#include "dwio/dorc/common/DorcException.h"

#include <fmt/format.h>
#include <folly/experimental/symbolizer/Symbolizer.h>
#include <glog/logging.h>

namespace facebook::dorc {

namespace {

constexpr size_t kMaxStackFrames = 128;

std::string collectContext(velox::VeloxException::Type contextType) {
  std::string collected;
  for (auto* context = &velox::getExceptionContext(); context != nullptr;
       context = context->parent) {
    // The innermost context is reported even when it is not essential.
    if (context != &velox::getExceptionContext() && !context->isEssential) {
      continue;
    }
    auto message = context->message(contextType);
    if (message.empty()) {
      continue;
    }
    if (!collected.empty()) {
      collected += " in ";
    }
    collected += message;
  }
  return collected;
}

std::vector<uintptr_t> captureStackFrames() {
  std::vector<uintptr_t> frames(kMaxStackFrames);
  auto count = folly::symbolizer::getStackTrace(frames.data(), frames.size());
  if (count < 0) {
    LOG(WARNING) << "Unable to capture the stack of a dorc exception.";
    return {};
  }
  frames.resize(count);
  return frames;
}

} // namespace

DorcException::DorcException(
    const ErrorLocation& location,
    std::string_view errorMessage,
    velox::VeloxException::Type contextType)
    : location_{location},
      errorCode_{location.errorCode},
      errorMessage_{errorMessage},
      context_{collectContext(contextType)},
      stackFrames_{captureStackFrames()} {}

const char* DorcException::what() const noexcept {
  try {
    folly::call_once(renderOnce_, [this] { rendered_ = render(); });
    return rendered_.c_str();
  } catch (const std::exception&) {
    return errorMessage_.c_str();
  }
}

std::string DorcException::render() const {
  auto rendered = fmt::format(
      "{}: {}\n  code: {} ({})\n  at: {} ({}:{})",
      exceptionName(),
      errorMessage_,
      errorCode_,
      errorSource(),
      location_.function,
      location_.file,
      location_.line);
  if (location_.expression != nullptr && *location_.expression != '\0') {
    rendered += fmt::format("\n  check: {}", location_.expression);
  }
  if (!context_.empty()) {
    rendered += fmt::format("\n  context: {}", context_);
  }
  if (!stackFrames_.empty()) {
    std::vector<folly::symbolizer::SymbolizedFrame> symbolized(
        stackFrames_.size());
    folly::symbolizer::Symbolizer symbolizer{
        folly::symbolizer::LocationInfoMode::FAST};
    symbolizer.symbolize(
        stackFrames_.data(), symbolized.data(), symbolized.size());
    folly::symbolizer::StringSymbolizePrinter printer;
    printer.println(symbolized.data(), symbolized.size());
    rendered += "\n  stack:\n";
    rendered += printer.str();
  }
  return rendered;
}

} // namespace facebook::dorc
