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
#include "dwio/dorc/common/Types.h"

#include <folly/String.h>

#include "dwio/dorc/common/Exceptions.h"

namespace facebook::dorc {

std::string toString(CompressionKind kind) {
  switch (kind) {
    case CompressionKind::None:
      return "NONE";
    case CompressionKind::Zlib:
      return "ZLIB";
    case CompressionKind::Snappy:
      return "SNAPPY";
    case CompressionKind::Lz4:
      return "LZ4";
    case CompressionKind::Zstd:
      return "ZSTD";
  }
  return fmt::format(
      "Unknown compression kind: {}", static_cast<uint32_t>(kind));
}

std::string toString(OrcEncoding encoding) {
  switch (encoding) {
    case OrcEncoding::Orc:
      return "ORC";
    case OrcEncoding::Dwrf:
      return "DWRF";
  }
  return fmt::format("Unknown encoding: {}", static_cast<uint32_t>(encoding));
}

CompressionKind compressionKindFromString(std::string_view name) {
  auto normalized = folly::trimWhitespace(name);
  for (auto kind :
       {CompressionKind::None,
        CompressionKind::Zlib,
        CompressionKind::Snappy,
        CompressionKind::Lz4,
        CompressionKind::Zstd}) {
    if (normalized.equals(toString(kind), folly::AsciiCaseInsensitive())) {
      return kind;
    }
  }
  DORC_USER_FAIL("Unknown compression kind: '{}'.", name);
}

OrcEncoding orcEncodingFromString(std::string_view name) {
  auto normalized = folly::trimWhitespace(name);
  for (auto encoding : {OrcEncoding::Orc, OrcEncoding::Dwrf}) {
    if (normalized.equals(toString(encoding), folly::AsciiCaseInsensitive())) {
      return encoding;
    }
  }
  DORC_USER_FAIL("Unknown file encoding: '{}'.", name);
}

} // namespace facebook::dorc
