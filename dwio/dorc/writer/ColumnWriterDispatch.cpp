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
#include "dwio/dorc/writer/ColumnWriterDispatch.h"

#include "dwio/dorc/common/Exceptions.h"

namespace facebook::dorc {

namespace {

// DWRF predates DATE, DECIMAL and CHAR.
void checkDwrfSupports(OrcTypeKind kind, OrcEncoding encoding) {
  if (encoding == OrcEncoding::Dwrf) {
    DORC_UNSUPPORTED_FOR_ENCODING(
        "{} does not support {} type.", encoding, kind);
  }
}

} // namespace

ColumnWriterSelector selectColumnWriter(
    OrcTypeKind kind,
    OrcEncoding encoding) {
  switch (kind) {
    case OrcTypeKind::Boolean:
      return {ColumnWriterKind::Boolean, std::nullopt};
    case OrcTypeKind::Float:
      return {ColumnWriterKind::Float, std::nullopt};
    case OrcTypeKind::Double:
      return {ColumnWriterKind::Double, std::nullopt};
    case OrcTypeKind::Byte:
      return {ColumnWriterKind::Byte, std::nullopt};
    case OrcTypeKind::Date:
      checkDwrfSupports(kind, encoding);
      return {ColumnWriterKind::Long, StatisticsKind::Date};
    case OrcTypeKind::Short:
    case OrcTypeKind::Int:
    case OrcTypeKind::Long:
      return {ColumnWriterKind::Long, StatisticsKind::Integer};
    case OrcTypeKind::Decimal:
      checkDwrfSupports(kind, encoding);
      return {ColumnWriterKind::Decimal, std::nullopt};
    case OrcTypeKind::Timestamp:
      return {ColumnWriterKind::Timestamp, std::nullopt};
    case OrcTypeKind::Binary:
      return {ColumnWriterKind::SliceDirect, StatisticsKind::Binary};
    case OrcTypeKind::Char:
      checkDwrfSupports(kind, encoding);
      [[fallthrough]];
    case OrcTypeKind::Varchar:
    case OrcTypeKind::String:
      return {ColumnWriterKind::SliceDictionary, std::nullopt};
    case OrcTypeKind::List:
      return {ColumnWriterKind::List, std::nullopt};
    case OrcTypeKind::Map:
      return {ColumnWriterKind::Map, std::nullopt};
    case OrcTypeKind::Struct:
      return {ColumnWriterKind::Struct, std::nullopt};
    case OrcTypeKind::Union:
      break;
  }
  DORC_UNSUPPORTED_KIND("Unsupported type: {}.", kind);
}

} // namespace facebook::dorc
