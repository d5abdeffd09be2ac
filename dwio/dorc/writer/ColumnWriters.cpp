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
#include "dwio/dorc/writer/ColumnWriters.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include "dwio/dorc/common/Exceptions.h"
#include "dwio/dorc/schema/SchemaCursor.h"
#include "dwio/dorc/writer/ColumnWriterDispatch.h"
#include "velox/common/base/VeloxException.h"

namespace facebook::dorc {

namespace {

// Names the schema node being built in the context of any exception raised
// below it, e.g. "column 2 (LIST) in column 0 (MAP)".
std::string columnContextMessage(
    velox::VeloxException::Type /* exceptionType */,
    void* arg) {
  const auto* cursor = static_cast<const SchemaCursor*>(arg);
  return fmt::format(
      "column {} ({})", cursor->ordinal(), cursor->orcType().kind());
}

StatisticsBuilderFactory requireStatistics(
    const ColumnWriterSelector& selector) {
  DORC_CHECK(
      selector.statisticsKind.has_value(),
      "{} column writer requires statistics.",
      selector.writerKind);
  return statisticsBuilderFactory(*selector.statisticsKind);
}

std::unique_ptr<ColumnWriter> createColumnWriter(
    const SchemaCursor& cursor,
    const ColumnWriterOptions& options) {
  velox::ExceptionContextSetter columnContext(
      {columnContextMessage, const_cast<SchemaCursor*>(&cursor), true});
  const auto selector =
      selectColumnWriter(cursor.orcType().kind(), options.orcEncoding);
  cursor.checkAligned();

  ColumnWriterParameters parameters{
      .column = cursor.ordinal(),
      .type = cursor.type(),
      .compression = options.compression,
      .bufferSize = options.bufferSize,
      .orcEncoding = options.orcEncoding,
      .encryptor =
          options.encryptionInfo.getEncryptorByNodeId(cursor.ordinal()),
      .metadataWriter = options.metadataWriter,
  };

  switch (selector.writerKind) {
    case ColumnWriterKind::Boolean:
      return std::make_unique<BooleanColumnWriter>(std::move(parameters));
    case ColumnWriterKind::Byte:
      return std::make_unique<ByteColumnWriter>(std::move(parameters));
    case ColumnWriterKind::Float:
      return std::make_unique<FloatColumnWriter>(std::move(parameters));
    case ColumnWriterKind::Double:
      return std::make_unique<DoubleColumnWriter>(std::move(parameters));
    case ColumnWriterKind::Long:
      return std::make_unique<LongColumnWriter>(
          std::move(parameters), requireStatistics(selector));
    case ColumnWriterKind::Decimal:
      return std::make_unique<DecimalColumnWriter>(std::move(parameters));
    case ColumnWriterKind::Timestamp:
      DORC_USER_CHECK(
          options.storageTimeZone != nullptr,
          "Column {} is a timestamp but no storage time zone is configured.",
          cursor.ordinal());
      return std::make_unique<TimestampColumnWriter>(
          std::move(parameters), options.storageTimeZone);
    case ColumnWriterKind::SliceDirect:
      return std::make_unique<SliceDirectColumnWriter>(
          std::move(parameters), requireStatistics(selector));
    case ColumnWriterKind::SliceDictionary:
      return std::make_unique<SliceDictionaryColumnWriter>(
          std::move(parameters), options.stringStatisticsLimit);
    case ColumnWriterKind::List: {
      auto elementWriter = createColumnWriter(cursor.childAt(0), options);
      return std::make_unique<ListColumnWriter>(
          std::move(parameters), std::move(elementWriter));
    }
    case ColumnWriterKind::Map: {
      auto keyWriter = createColumnWriter(cursor.childAt(0), options);
      auto valueWriter = createColumnWriter(cursor.childAt(1), options);
      return std::make_unique<MapColumnWriter>(
          std::move(parameters), std::move(keyWriter), std::move(valueWriter));
    }
    case ColumnWriterKind::Struct: {
      std::vector<std::unique_ptr<ColumnWriter>> fieldWriters;
      fieldWriters.reserve(cursor.childCount());
      for (size_t i = 0; i < cursor.childCount(); ++i) {
        fieldWriters.push_back(createColumnWriter(cursor.childAt(i), options));
      }
      return std::make_unique<StructColumnWriter>(
          std::move(parameters), std::move(fieldWriters));
    }
  }
  DORC_UNREACHABLE("Unknown column writer: {}.", selector.writerKind);
}

} // namespace

std::unique_ptr<ColumnWriter> createColumnWriter(
    uint32_t columnIndex,
    const std::vector<OrcType>& orcTypes,
    const velox::TypePtr& type,
    const ColumnWriterOptions& options) {
  options.validate();
  auto writer =
      createColumnWriter(SchemaCursor{orcTypes, columnIndex, type}, options);
  VLOG(1) << "Created column writers for column " << columnIndex << ":\n"
          << describeColumnWriterTree(*writer);
  return writer;
}

} // namespace facebook::dorc
