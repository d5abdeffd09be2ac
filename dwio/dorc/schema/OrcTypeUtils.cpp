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
#include "dwio/dorc/schema/OrcTypeUtils.h"

#include "dwio/dorc/common/Exceptions.h"

namespace facebook::dorc {

namespace {

OrcType createScalarOrcType(const velox::Type& type) {
  switch (type.kind()) {
    case velox::TypeKind::BOOLEAN:
      return OrcType{OrcTypeKind::Boolean};
    case velox::TypeKind::TINYINT:
      return OrcType{OrcTypeKind::Byte};
    case velox::TypeKind::SMALLINT:
      return OrcType{OrcTypeKind::Short};
    case velox::TypeKind::INTEGER:
      return OrcType{type.isDate() ? OrcTypeKind::Date : OrcTypeKind::Int};
    case velox::TypeKind::BIGINT:
      if (type.isDecimal()) {
        auto [precision, scale] = velox::getDecimalPrecisionScale(type);
        return OrcType::decimal(precision, scale);
      }
      return OrcType{OrcTypeKind::Long};
    case velox::TypeKind::HUGEINT:
      if (type.isDecimal()) {
        auto [precision, scale] = velox::getDecimalPrecisionScale(type);
        return OrcType::decimal(precision, scale);
      }
      break;
    case velox::TypeKind::REAL:
      return OrcType{OrcTypeKind::Float};
    case velox::TypeKind::DOUBLE:
      return OrcType{OrcTypeKind::Double};
    case velox::TypeKind::VARCHAR:
      return OrcType{OrcTypeKind::String};
    case velox::TypeKind::VARBINARY:
      return OrcType{OrcTypeKind::Binary};
    case velox::TypeKind::TIMESTAMP:
      return OrcType{OrcTypeKind::Timestamp};
    default:
      break;
  }
  DORC_UNSUPPORTED_KIND("Type {} has no ORC representation.", type.toString());
}

uint32_t appendOrcType(
    const velox::TypePtr& type,
    std::vector<OrcType>& orcTypes) {
  const uint32_t ordinal = orcTypes.size();
  OrcTypeKind kind;
  switch (type->kind()) {
    case velox::TypeKind::ARRAY:
      kind = OrcTypeKind::List;
      break;
    case velox::TypeKind::MAP:
      kind = OrcTypeKind::Map;
      break;
    case velox::TypeKind::ROW:
      kind = OrcTypeKind::Struct;
      break;
    default:
      orcTypes.push_back(createScalarOrcType(*type));
      return ordinal;
  }

  // Reserve the parent slot so children receive the following ordinals.
  orcTypes.emplace_back(kind);
  std::vector<uint32_t> children;
  children.reserve(type->size());
  for (size_t i = 0; i < type->size(); ++i) {
    children.push_back(appendOrcType(type->childAt(i), orcTypes));
  }

  std::vector<std::string> names;
  if (kind == OrcTypeKind::Struct) {
    names = type->asRow().names();
  }
  orcTypes[ordinal] = OrcType{kind, std::move(children), std::move(names)};
  return ordinal;
}

} // namespace

std::vector<OrcType> createOrcTypes(const velox::TypePtr& type) {
  DORC_USER_CHECK(type != nullptr, "Logical type is null.");
  std::vector<OrcType> orcTypes;
  appendOrcType(type, orcTypes);
  return orcTypes;
}

std::vector<uint32_t> collectSubtreeOrdinals(
    const std::vector<OrcType>& orcTypes,
    uint32_t root) {
  std::vector<uint32_t> ordinals;
  std::vector<uint32_t> pending{root};
  while (!pending.empty()) {
    auto ordinal = pending.back();
    pending.pop_back();
    DORC_CHECK_SCHEMA(
        ordinal < orcTypes.size(),
        "Ordinal {} is out of range, schema has {} nodes.",
        ordinal,
        orcTypes.size());
    ordinals.push_back(ordinal);
    DORC_CHECK_SCHEMA(
        ordinals.size() <= orcTypes.size(),
        "Subtree of ordinal {} is not a tree.",
        root);
    const auto& children = orcTypes[ordinal].fieldTypeIndexes();
    // Push in reverse so the first child is visited first.
    pending.insert(pending.end(), children.rbegin(), children.rend());
  }
  return ordinals;
}

} // namespace facebook::dorc
