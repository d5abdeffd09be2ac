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

#include <fmt/format.h>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "dwio/dorc/common/Types.h"
#include "dwio/dorc/encryption/DataEncryptor.h"
#include "dwio/dorc/stats/StatisticsBuilder.h"
#include "dwio/dorc/writer/MetadataWriter.h"
#include "velox/type/Type.h"

namespace facebook::velox::tz {
class TimeZone;
} // namespace facebook::velox::tz

namespace facebook::dorc {

enum class ColumnWriterKind : uint8_t {
  Boolean,
  Byte,
  Float,
  Double,
  // SHORT, INT, LONG and DATE.
  Long,
  Decimal,
  Timestamp,
  // BINARY, written without a dictionary.
  SliceDirect,
  // STRING, VARCHAR and CHAR, dictionary encoded.
  SliceDictionary,
  List,
  Map,
  Struct,
};

std::string toString(ColumnWriterKind kind);

inline std::ostream& operator<<(std::ostream& os, ColumnWriterKind kind) {
  return os << toString(kind);
}

} // namespace facebook::dorc

template <>
struct fmt::formatter<facebook::dorc::ColumnWriterKind>
    : fmt::formatter<std::string> {
  auto format(facebook::dorc::ColumnWriterKind kind, format_context& ctx)
      const {
    return fmt::formatter<std::string>::format(
        facebook::dorc::toString(kind), ctx);
  }
};

namespace facebook::dorc {

// What every column writer receives regardless of its kind: the schema node
// it writes and the file level settings.
struct ColumnWriterParameters {
  uint32_t column;
  velox::TypePtr type;
  CompressionKind compression;
  uint32_t bufferSize;
  OrcEncoding orcEncoding;
  // nullptr when the column is not encrypted.
  std::shared_ptr<DataEncryptor> encryptor;
  std::shared_ptr<MetadataWriter> metadataWriter;
};

// Writer of one schema node. Composite writers own the writers of their
// children. Buffering, encoding and statistics of the written values are
// implemented by the stream layer on top of the parameters captured here.
class ColumnWriter {
 public:
  virtual ~ColumnWriter() = default;

  ColumnWriterKind kind() const {
    return kind_;
  }

  // Ordinal of the schema node.
  uint32_t column() const {
    return parameters_.column;
  }

  const velox::TypePtr& type() const {
    return parameters_.type;
  }

  CompressionKind compression() const {
    return parameters_.compression;
  }

  uint32_t bufferSize() const {
    return parameters_.bufferSize;
  }

  OrcEncoding orcEncoding() const {
    return parameters_.orcEncoding;
  }

  const std::shared_ptr<DataEncryptor>& encryptor() const {
    return parameters_.encryptor;
  }

  const std::shared_ptr<MetadataWriter>& metadataWriter() const {
    return parameters_.metadataWriter;
  }

  // Direct children, in declared order.
  virtual std::vector<const ColumnWriter*> children() const {
    return {};
  }

  // All descendants, in pre-order.
  std::vector<const ColumnWriter*> getNestedColumnWriters() const;

  std::string toString() const;

 protected:
  ColumnWriter(ColumnWriterKind kind, ColumnWriterParameters parameters);

  // Kind specific "key=value" entries for toString().
  virtual void appendDetails(std::vector<std::string>& /* details */) const {}

 private:
  const ColumnWriterKind kind_;
  const ColumnWriterParameters parameters_;
};

// BOOLEAN, BYTE, FLOAT and DOUBLE. Statistics are implied by the kind.
template <ColumnWriterKind KIND>
class ScalarColumnWriter : public ColumnWriter {
  static_assert(
      KIND == ColumnWriterKind::Boolean || KIND == ColumnWriterKind::Byte ||
      KIND == ColumnWriterKind::Float || KIND == ColumnWriterKind::Double);

 public:
  explicit ScalarColumnWriter(ColumnWriterParameters parameters)
      : ColumnWriter{KIND, std::move(parameters)} {}
};

using BooleanColumnWriter = ScalarColumnWriter<ColumnWriterKind::Boolean>;
using ByteColumnWriter = ScalarColumnWriter<ColumnWriterKind::Byte>;
using FloatColumnWriter = ScalarColumnWriter<ColumnWriterKind::Float>;
using DoubleColumnWriter = ScalarColumnWriter<ColumnWriterKind::Double>;

// Integer family. The statistics factory tells integers and dates apart.
class LongColumnWriter : public ColumnWriter {
 public:
  LongColumnWriter(
      ColumnWriterParameters parameters,
      StatisticsBuilderFactory statisticsBuilderFactory);

  const StatisticsBuilderFactory& statisticsBuilderFactory() const {
    return statisticsBuilderFactory_;
  }

 protected:
  void appendDetails(std::vector<std::string>& details) const override;

 private:
  StatisticsBuilderFactory statisticsBuilderFactory_;
};

class DecimalColumnWriter : public ColumnWriter {
 public:
  explicit DecimalColumnWriter(ColumnWriterParameters parameters);
};

class TimestampColumnWriter : public ColumnWriter {
 public:
  TimestampColumnWriter(
      ColumnWriterParameters parameters,
      const velox::tz::TimeZone* storageTimeZone);

  // Zone the wall clock values are stored in. Never null.
  const velox::tz::TimeZone* storageTimeZone() const {
    return storageTimeZone_;
  }

 protected:
  void appendDetails(std::vector<std::string>& details) const override;

 private:
  const velox::tz::TimeZone* storageTimeZone_;
};

// Variable length values written as lengths plus data, without a dictionary.
class SliceDirectColumnWriter : public ColumnWriter {
 public:
  SliceDirectColumnWriter(
      ColumnWriterParameters parameters,
      StatisticsBuilderFactory statisticsBuilderFactory);

  const StatisticsBuilderFactory& statisticsBuilderFactory() const {
    return statisticsBuilderFactory_;
  }

 protected:
  void appendDetails(std::vector<std::string>& details) const override;

 private:
  StatisticsBuilderFactory statisticsBuilderFactory_;
};

// Variable length strings, dictionary encoded while the dictionary pays off.
class SliceDictionaryColumnWriter : public ColumnWriter {
 public:
  SliceDictionaryColumnWriter(
      ColumnWriterParameters parameters,
      uint64_t stringStatisticsLimit);

  // Longest min/max value, in bytes, kept by the string statistics.
  uint64_t stringStatisticsLimit() const {
    return stringStatisticsLimit_;
  }

 protected:
  void appendDetails(std::vector<std::string>& details) const override;

 private:
  uint64_t stringStatisticsLimit_;
};

class ListColumnWriter : public ColumnWriter {
 public:
  ListColumnWriter(
      ColumnWriterParameters parameters,
      std::unique_ptr<ColumnWriter> elementWriter);

  const ColumnWriter& elementWriter() const {
    return *elementWriter_;
  }

  std::vector<const ColumnWriter*> children() const override {
    return {elementWriter_.get()};
  }

 private:
  std::unique_ptr<ColumnWriter> elementWriter_;
};

class MapColumnWriter : public ColumnWriter {
 public:
  MapColumnWriter(
      ColumnWriterParameters parameters,
      std::unique_ptr<ColumnWriter> keyWriter,
      std::unique_ptr<ColumnWriter> valueWriter);

  const ColumnWriter& keyWriter() const {
    return *keyWriter_;
  }

  const ColumnWriter& valueWriter() const {
    return *valueWriter_;
  }

  std::vector<const ColumnWriter*> children() const override {
    return {keyWriter_.get(), valueWriter_.get()};
  }

 private:
  std::unique_ptr<ColumnWriter> keyWriter_;
  std::unique_ptr<ColumnWriter> valueWriter_;
};

class StructColumnWriter : public ColumnWriter {
 public:
  StructColumnWriter(
      ColumnWriterParameters parameters,
      std::vector<std::unique_ptr<ColumnWriter>> fieldWriters);

  size_t fieldCount() const {
    return fieldWriters_.size();
  }

  const ColumnWriter& fieldWriter(size_t field) const;

  std::vector<const ColumnWriter*> children() const override;

 private:
  std::vector<std::unique_ptr<ColumnWriter>> fieldWriters_;
};

// One line per writer, children indented below their parent.
std::string describeColumnWriterTree(const ColumnWriter& root);

} // namespace facebook::dorc
