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

#include <cstdint>
#include <vector>

#include "dwio/dorc/schema/OrcType.h"
#include "velox/type/Type.h"

namespace facebook::dorc {

// A position in the physical schema paired with the logical type found at
// the same position. Children are always derived from both sides at once so
// the two trees cannot drift apart during a traversal.
class SchemaCursor {
 public:
  // Fails with MALFORMED_SCHEMA when |ordinal| is not a node of |orcTypes|.
  SchemaCursor(
      const std::vector<OrcType>& orcTypes,
      uint32_t ordinal,
      velox::TypePtr type);

  uint32_t ordinal() const {
    return ordinal_;
  }

  const OrcType& orcType() const {
    return orcTypes_[ordinal_];
  }

  const velox::TypePtr& type() const {
    return type_;
  }

  // Fails with MALFORMED_SCHEMA unless both sides have the same shape at this
  // node: LIST over ARRAY, MAP over MAP, STRUCT over ROW, a leaf over a leaf,
  // and the same number of children.
  void checkAligned() const;

  size_t childCount() const {
    return orcType().fieldCount();
  }

  SchemaCursor childAt(size_t index) const;

 private:
  const std::vector<OrcType>& orcTypes_;
  const uint32_t ordinal_;
  const velox::TypePtr type_;
};

} // namespace facebook::dorc
