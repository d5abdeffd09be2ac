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
#include "dwio/dorc/writer/ColumnWriter.h"

#include <fmt/ranges.h>

#include "dwio/dorc/common/Exceptions.h"
#include "velox/type/tz/TimeZoneMap.h"

namespace facebook::dorc {

std::string toString(ColumnWriterKind kind) {
  switch (kind) {
    case ColumnWriterKind::Boolean:
      return "BOOLEAN";
    case ColumnWriterKind::Byte:
      return "BYTE";
    case ColumnWriterKind::Float:
      return "FLOAT";
    case ColumnWriterKind::Double:
      return "DOUBLE";
    case ColumnWriterKind::Long:
      return "LONG";
    case ColumnWriterKind::Decimal:
      return "DECIMAL";
    case ColumnWriterKind::Timestamp:
      return "TIMESTAMP";
    case ColumnWriterKind::SliceDirect:
      return "SLICE_DIRECT";
    case ColumnWriterKind::SliceDictionary:
      return "SLICE_DICTIONARY";
    case ColumnWriterKind::List:
      return "LIST";
    case ColumnWriterKind::Map:
      return "MAP";
    case ColumnWriterKind::Struct:
      return "STRUCT";
  }
  return fmt::format("UNKNOWN({})", static_cast<uint32_t>(kind));
}

ColumnWriter::ColumnWriter(
    ColumnWriterKind kind,
    ColumnWriterParameters parameters)
    : kind_{kind}, parameters_{std::move(parameters)} {
  DORC_CHECK(parameters_.type != nullptr, "Column writer requires a type.");
  DORC_CHECK(
      parameters_.metadataWriter != nullptr,
      "Column writer requires a metadata writer.");
}

std::vector<const ColumnWriter*> ColumnWriter::getNestedColumnWriters() const {
  std::vector<const ColumnWriter*> nested;
  std::vector<const ColumnWriter*> stack;
  auto pushChildren = [&stack](const ColumnWriter& writer) {
    auto children = writer.children();
    stack.insert(stack.end(), children.rbegin(), children.rend());
  };

  pushChildren(*this);
  while (!stack.empty()) {
    const auto* writer = stack.back();
    stack.pop_back();
    nested.push_back(writer);
    pushChildren(*writer);
  }
  return nested;
}

std::string ColumnWriter::toString() const {
  std::vector<std::string> details{
      fmt::format("column={}", column()),
      fmt::format("type={}", type()->toString()),
      fmt::format("encoding={}", orcEncoding()),
      fmt::format("compression={}", compression()),
      fmt::format("bufferSize={}", bufferSize())};
  appendDetails(details);
  if (encryptor()) {
    details.push_back(fmt::format("encryptor={}", encryptor()->name()));
  }
  return fmt::format("{}({})", kind(), fmt::join(details, ", "));
}

LongColumnWriter::LongColumnWriter(
    ColumnWriterParameters parameters,
    StatisticsBuilderFactory statisticsBuilderFactory)
    : ColumnWriter{ColumnWriterKind::Long, std::move(parameters)},
      statisticsBuilderFactory_{std::move(statisticsBuilderFactory)} {
  DORC_CHECK(
      statisticsBuilderFactory_ != nullptr,
      "Long column writer requires a statistics builder factory.");
}

void LongColumnWriter::appendDetails(std::vector<std::string>& details) const {
  details.push_back(
      fmt::format("statistics={}", statisticsBuilderFactory_()->kind()));
}

DecimalColumnWriter::DecimalColumnWriter(ColumnWriterParameters parameters)
    : ColumnWriter{ColumnWriterKind::Decimal, std::move(parameters)} {}

TimestampColumnWriter::TimestampColumnWriter(
    ColumnWriterParameters parameters,
    const velox::tz::TimeZone* storageTimeZone)
    : ColumnWriter{ColumnWriterKind::Timestamp, std::move(parameters)},
      storageTimeZone_{storageTimeZone} {
  DORC_CHECK(
      storageTimeZone_ != nullptr,
      "Timestamp column writer requires a storage time zone.");
}

void TimestampColumnWriter::appendDetails(
    std::vector<std::string>& details) const {
  details.push_back(fmt::format("timeZone={}", storageTimeZone_->name()));
}

SliceDirectColumnWriter::SliceDirectColumnWriter(
    ColumnWriterParameters parameters,
    StatisticsBuilderFactory statisticsBuilderFactory)
    : ColumnWriter{ColumnWriterKind::SliceDirect, std::move(parameters)},
      statisticsBuilderFactory_{std::move(statisticsBuilderFactory)} {
  DORC_CHECK(
      statisticsBuilderFactory_ != nullptr,
      "Slice direct column writer requires a statistics builder factory.");
}

void SliceDirectColumnWriter::appendDetails(
    std::vector<std::string>& details) const {
  details.push_back(
      fmt::format("statistics={}", statisticsBuilderFactory_()->kind()));
}

SliceDictionaryColumnWriter::SliceDictionaryColumnWriter(
    ColumnWriterParameters parameters,
    uint64_t stringStatisticsLimit)
    : ColumnWriter{ColumnWriterKind::SliceDictionary, std::move(parameters)},
      stringStatisticsLimit_{stringStatisticsLimit} {}

void SliceDictionaryColumnWriter::appendDetails(
    std::vector<std::string>& details) const {
  details.push_back(
      fmt::format("stringStatisticsLimit={}", stringStatisticsLimit_));
}

ListColumnWriter::ListColumnWriter(
    ColumnWriterParameters parameters,
    std::unique_ptr<ColumnWriter> elementWriter)
    : ColumnWriter{ColumnWriterKind::List, std::move(parameters)},
      elementWriter_{std::move(elementWriter)} {
  DORC_CHECK(elementWriter_ != nullptr, "List requires an element writer.");
}

MapColumnWriter::MapColumnWriter(
    ColumnWriterParameters parameters,
    std::unique_ptr<ColumnWriter> keyWriter,
    std::unique_ptr<ColumnWriter> valueWriter)
    : ColumnWriter{ColumnWriterKind::Map, std::move(parameters)},
      keyWriter_{std::move(keyWriter)},
      valueWriter_{std::move(valueWriter)} {
  DORC_CHECK(keyWriter_ != nullptr, "Map requires a key writer.");
  DORC_CHECK(valueWriter_ != nullptr, "Map requires a value writer.");
}

StructColumnWriter::StructColumnWriter(
    ColumnWriterParameters parameters,
    std::vector<std::unique_ptr<ColumnWriter>> fieldWriters)
    : ColumnWriter{ColumnWriterKind::Struct, std::move(parameters)},
      fieldWriters_{std::move(fieldWriters)} {
  for (const auto& fieldWriter : fieldWriters_) {
    DORC_CHECK(fieldWriter != nullptr, "Struct field writer is missing.");
  }
}

const ColumnWriter& StructColumnWriter::fieldWriter(size_t field) const {
  DORC_CHECK_LT(field, fieldWriters_.size());
  return *fieldWriters_[field];
}

std::vector<const ColumnWriter*> StructColumnWriter::children() const {
  std::vector<const ColumnWriter*> children;
  children.reserve(fieldWriters_.size());
  for (const auto& fieldWriter : fieldWriters_) {
    children.push_back(fieldWriter.get());
  }
  return children;
}

namespace {

void describe(
    const ColumnWriter& writer,
    uint32_t depth,
    std::string& description) {
  description.append(depth * 2, ' ');
  description += writer.toString();
  description += '\n';
  for (const auto* child : writer.children()) {
    describe(*child, depth + 1, description);
  }
}

} // namespace

std::string describeColumnWriterTree(const ColumnWriter& root) {
  std::string description;
  describe(root, 0, description);
  return description;
}

} // namespace facebook::dorc
