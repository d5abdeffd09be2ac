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
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace facebook::dorc {

// Kind of a physical schema node. Numbering follows the Type.Kind enumeration
// of the ORC footer, so values read from a serialized footer can be cast
// directly. Such values may fall outside of the enumerators below.
enum class OrcTypeKind : uint8_t {
  Boolean = 0,
  Byte = 1,
  Short = 2,
  Int = 3,
  Long = 4,
  Float = 5,
  Double = 6,
  String = 7,
  Binary = 8,
  Timestamp = 9,
  List = 10,
  Map = 11,
  Struct = 12,
  Union = 13,
  Decimal = 14,
  Date = 15,
  Varchar = 16,
  Char = 17,
};

std::string toString(OrcTypeKind kind);

inline std::ostream& operator<<(std::ostream& os, OrcTypeKind kind) {
  return os << toString(kind);
}

} // namespace facebook::dorc

template <>
struct fmt::formatter<facebook::dorc::OrcTypeKind>
    : fmt::formatter<std::string> {
  auto format(facebook::dorc::OrcTypeKind kind, format_context& ctx) const {
    return fmt::formatter<std::string>::format(
        facebook::dorc::toString(kind), ctx);
  }
};

namespace facebook::dorc {

// One node of the flattened physical schema. Nodes are addressed by their
// ordinal (position in the flattened vector). Composite nodes reference
// their children by ordinal, in declared order.
class OrcType {
 public:
  explicit OrcType(OrcTypeKind kind);

  // |fieldNames| is either empty or has one entry per child.
  OrcType(
      OrcTypeKind kind,
      std::vector<uint32_t> fieldTypeIndexes,
      std::vector<std::string> fieldNames = {});

  static OrcType decimal(uint8_t precision, uint8_t scale);

  // CHAR(length) or VARCHAR(length).
  static OrcType withLength(OrcTypeKind kind, uint32_t length);

  OrcTypeKind kind() const {
    return kind_;
  }

  size_t fieldCount() const {
    return fieldTypeIndexes_.size();
  }

  uint32_t fieldTypeIndex(size_t field) const;

  const std::vector<uint32_t>& fieldTypeIndexes() const {
    return fieldTypeIndexes_;
  }

  const std::vector<std::string>& fieldNames() const {
    return fieldNames_;
  }

  const std::optional<uint32_t>& length() const {
    return length_;
  }

  const std::optional<uint8_t>& precision() const {
    return precision_;
  }

  const std::optional<uint8_t>& scale() const {
    return scale_;
  }

  // e.g. "STRUCT(children=[1, 2])", "DECIMAL(10, 2)", "INT".
  std::string toString() const;

 private:
  OrcTypeKind kind_;
  std::vector<uint32_t> fieldTypeIndexes_;
  std::vector<std::string> fieldNames_;
  std::optional<uint32_t> length_;
  std::optional<uint8_t> precision_;
  std::optional<uint8_t> scale_;
};

} // namespace facebook::dorc
