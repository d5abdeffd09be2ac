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

#include <optional>

#include "dwio/dorc/common/Types.h"
#include "dwio/dorc/schema/OrcType.h"
#include "dwio/dorc/stats/StatisticsBuilder.h"
#include "dwio/dorc/writer/ColumnWriter.h"

namespace facebook::dorc {

struct ColumnWriterSelector {
  ColumnWriterKind writerKind;
  // Set for the writers parameterized by a statistics builder factory (LONG
  // and SLICE_DIRECT).
  std::optional<StatisticsKind> statisticsKind;

  bool operator==(const ColumnWriterSelector& other) const = default;
};

// Picks the column writer for a schema node kind under the given file
// encoding. Throws UNSUPPORTED_FOR_ENCODING for DATE, DECIMAL and CHAR under
// DWRF, and UNSUPPORTED_KIND for UNION or an unrecognized kind.
ColumnWriterSelector selectColumnWriter(OrcTypeKind kind, OrcEncoding encoding);

} // namespace facebook::dorc
