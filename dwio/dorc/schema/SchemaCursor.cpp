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
#include "dwio/dorc/schema/SchemaCursor.h"

#include <optional>

#include "dwio/dorc/common/Exceptions.h"

namespace facebook::dorc {

namespace {

std::optional<velox::TypeKind> expectedLogicalKind(OrcTypeKind kind) {
  switch (kind) {
    case OrcTypeKind::List:
      return velox::TypeKind::ARRAY;
    case OrcTypeKind::Map:
      return velox::TypeKind::MAP;
    case OrcTypeKind::Struct:
      return velox::TypeKind::ROW;
    default:
      return std::nullopt;
  }
}

bool isCompositeLogicalKind(velox::TypeKind kind) {
  return kind == velox::TypeKind::ARRAY || kind == velox::TypeKind::MAP ||
      kind == velox::TypeKind::ROW;
}

} // namespace

SchemaCursor::SchemaCursor(
    const std::vector<OrcType>& orcTypes,
    uint32_t ordinal,
    velox::TypePtr type)
    : orcTypes_{orcTypes}, ordinal_{ordinal}, type_{std::move(type)} {
  DORC_CHECK_SCHEMA(
      ordinal_ < orcTypes_.size(),
      "Column {} is out of range. Schema has {} nodes.",
      ordinal_,
      orcTypes_.size());
  DORC_USER_CHECK(
      type_ != nullptr, "Column {} has no logical type.", ordinal_);
}

void SchemaCursor::checkAligned() const {
  const auto& node = orcType();
  const auto logicalKind = type_->kind();
  if (auto expected = expectedLogicalKind(node.kind())) {
    DORC_CHECK_SCHEMA(
        logicalKind == *expected,
        "Column {} is {} but its logical type is {}.",
        ordinal_,
        node.kind(),
        type_->toString());
  } else {
    DORC_CHECK_SCHEMA(
        !isCompositeLogicalKind(logicalKind),
        "Column {} is {} but its logical type is {}.",
        ordinal_,
        node.kind(),
        type_->toString());
  }
  DORC_CHECK_SCHEMA(
      node.fieldCount() == type_->size(),
      "Column {} has {} children but its logical type {} has {}.",
      ordinal_,
      node.fieldCount(),
      type_->toString(),
      type_->size());
}

SchemaCursor SchemaCursor::childAt(size_t index) const {
  DORC_CHECK_LT(index, type_->size());
  return SchemaCursor{
      orcTypes_, orcType().fieldTypeIndex(index), type_->childAt(index)};
}

} // namespace facebook::dorc
