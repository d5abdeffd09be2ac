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
#include <memory>
#include <vector>

#include "dwio/dorc/schema/OrcType.h"
#include "dwio/dorc/writer/ColumnWriter.h"
#include "dwio/dorc/writer/ColumnWriterOptions.h"
#include "velox/type/Type.h"

namespace facebook::dorc {

// Builds the column writer tree for the schema node |columnIndex| of
// |orcTypes|, whose logical type is |type|. Any node of the schema may serve
// as the root; the nodes outside of its subtree are ignored.
//
// Every node of the subtree gets exactly one writer, children are built in
// declared order, and a writer receives the encryptor of the group its node
// belongs to. Throws DorcUserError with code MALFORMED_SCHEMA,
// UNSUPPORTED_KIND, UNSUPPORTED_FOR_ENCODING or INVALID_ARGUMENT. Nothing is
// returned when any node of the subtree fails.
std::unique_ptr<ColumnWriter> createColumnWriter(
    uint32_t columnIndex,
    const std::vector<OrcType>& orcTypes,
    const velox::TypePtr& type,
    const ColumnWriterOptions& options);

} // namespace facebook::dorc
