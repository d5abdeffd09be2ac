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
#include "dwio/dorc/schema/OrcType.h"

#include <fmt/ranges.h>

#include "dwio/dorc/common/Exceptions.h"

namespace facebook::dorc {

std::string toString(OrcTypeKind kind) {
  switch (kind) {
    case OrcTypeKind::Boolean:
      return "BOOLEAN";
    case OrcTypeKind::Byte:
      return "BYTE";
    case OrcTypeKind::Short:
      return "SHORT";
    case OrcTypeKind::Int:
      return "INT";
    case OrcTypeKind::Long:
      return "LONG";
    case OrcTypeKind::Float:
      return "FLOAT";
    case OrcTypeKind::Double:
      return "DOUBLE";
    case OrcTypeKind::String:
      return "STRING";
    case OrcTypeKind::Binary:
      return "BINARY";
    case OrcTypeKind::Timestamp:
      return "TIMESTAMP";
    case OrcTypeKind::List:
      return "LIST";
    case OrcTypeKind::Map:
      return "MAP";
    case OrcTypeKind::Struct:
      return "STRUCT";
    case OrcTypeKind::Union:
      return "UNION";
    case OrcTypeKind::Decimal:
      return "DECIMAL";
    case OrcTypeKind::Date:
      return "DATE";
    case OrcTypeKind::Varchar:
      return "VARCHAR";
    case OrcTypeKind::Char:
      return "CHAR";
  }
  return fmt::format("UNKNOWN({})", static_cast<uint32_t>(kind));
}

OrcType::OrcType(OrcTypeKind kind) : kind_{kind} {}

OrcType::OrcType(
    OrcTypeKind kind,
    std::vector<uint32_t> fieldTypeIndexes,
    std::vector<std::string> fieldNames)
    : kind_{kind},
      fieldTypeIndexes_{std::move(fieldTypeIndexes)},
      fieldNames_{std::move(fieldNames)} {
  DORC_USER_CHECK(
      fieldNames_.empty() || fieldNames_.size() == fieldTypeIndexes_.size(),
      "Field name count {} does not match field count {} of {} node.",
      fieldNames_.size(),
      fieldTypeIndexes_.size(),
      kind_);
}

OrcType OrcType::decimal(uint8_t precision, uint8_t scale) {
  DORC_USER_CHECK(
      scale <= precision,
      "Decimal scale {} exceeds precision {}.",
      scale,
      precision);
  OrcType type{OrcTypeKind::Decimal};
  type.precision_ = precision;
  type.scale_ = scale;
  return type;
}

OrcType OrcType::withLength(OrcTypeKind kind, uint32_t length) {
  DORC_USER_CHECK(
      kind == OrcTypeKind::Char || kind == OrcTypeKind::Varchar,
      "Only CHAR and VARCHAR carry a length, got {}.",
      kind);
  OrcType type{kind};
  type.length_ = length;
  return type;
}

uint32_t OrcType::fieldTypeIndex(size_t field) const {
  DORC_CHECK_SCHEMA(
      field < fieldTypeIndexes_.size(),
      "Field {} requested from {} node with {} fields.",
      field,
      kind_,
      fieldTypeIndexes_.size());
  return fieldTypeIndexes_[field];
}

std::string OrcType::toString() const {
  if (precision_.has_value()) {
    return fmt::format("{}({}, {})", kind_, *precision_, *scale_);
  }
  if (length_.has_value()) {
    return fmt::format("{}({})", kind_, *length_);
  }
  if (!fieldTypeIndexes_.empty()) {
    return fmt::format(
        "{}(children=[{}])", kind_, fmt::join(fieldTypeIndexes_, ", "));
  }
  return ::facebook::dorc::toString(kind_);
}

} // namespace facebook::dorc
