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
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace facebook::dorc {

// Codec applied to the column streams. The codec itself lives with the stream
// writers; here it is only a setting threaded to every column writer.
enum class CompressionKind : uint8_t {
  None = 0,
  Zlib = 1,
  Snappy = 2,
  Lz4 = 3,
  Zstd = 4,
};

// On-disk dialect. DWRF is the Facebook fork of ORC; it shares the stream
// layout but cannot store DATE, DECIMAL or CHAR columns.
enum class OrcEncoding : uint8_t {
  Orc = 0,
  Dwrf = 1,
};

std::string toString(CompressionKind kind);
std::string toString(OrcEncoding encoding);

// Case insensitive. Throws a user error on unknown names.
CompressionKind compressionKindFromString(std::string_view name);
OrcEncoding orcEncodingFromString(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, CompressionKind kind) {
  return os << toString(kind);
}

inline std::ostream& operator<<(std::ostream& os, OrcEncoding encoding) {
  return os << toString(encoding);
}

} // namespace facebook::dorc

template <>
struct fmt::formatter<facebook::dorc::CompressionKind>
    : fmt::formatter<std::string> {
  auto format(facebook::dorc::CompressionKind kind, format_context& ctx) const {
    return fmt::formatter<std::string>::format(
        facebook::dorc::toString(kind), ctx);
  }
};

template <>
struct fmt::formatter<facebook::dorc::OrcEncoding>
    : fmt::formatter<std::string> {
  auto format(facebook::dorc::OrcEncoding encoding, format_context& ctx)
      const {
    return fmt::formatter<std::string>::format(
        facebook::dorc::toString(encoding), ctx);
  }
};
