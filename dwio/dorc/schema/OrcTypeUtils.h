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

#include <vector>

#include "dwio/dorc/schema/OrcType.h"
#include "velox/type/Type.h"

namespace facebook::dorc {

// Flattens a logical type into physical schema nodes, in pre-order. The root
// lands at ordinal 0 and every composite node lists its children's ordinals
// in declared order.
std::vector<OrcType> createOrcTypes(const velox::TypePtr& type);

// Ordinals of |root| and all of its descendants, in pre-order.
std::vector<uint32_t> collectSubtreeOrdinals(
    const std::vector<OrcType>& orcTypes,
    uint32_t root);

} // namespace facebook::dorc
