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

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "dwio/dorc/writer/ColumnWriterOptions.h"

namespace facebook::dorc {

class ColumnWriterOptionBuilder {
 public:
  ColumnWriterOptionBuilder& withCompression(CompressionKind compression) {
    options_.compression = compression;
    return *this;
  }

  ColumnWriterOptionBuilder& withBufferSize(uint32_t bufferSize) {
    options_.bufferSize = bufferSize;
    return *this;
  }

  ColumnWriterOptionBuilder& withOrcEncoding(OrcEncoding orcEncoding) {
    options_.orcEncoding = orcEncoding;
    return *this;
  }

  // Resolves |timeZoneName| (e.g. "UTC" or "America/Los_Angeles") through
  // the velox time zone database.
  ColumnWriterOptionBuilder& withStorageTimeZone(std::string_view timeZoneName);

  ColumnWriterOptionBuilder& withStringStatisticsLimit(
      uint64_t stringStatisticsLimit) {
    options_.stringStatisticsLimit = stringStatisticsLimit;
    return *this;
  }

  ColumnWriterOptionBuilder& withEncryptionInfo(EncryptionInfo encryptionInfo) {
    options_.encryptionInfo = std::move(encryptionInfo);
    return *this;
  }

  ColumnWriterOptionBuilder& withMetadataWriter(
      std::shared_ptr<MetadataWriter> metadataWriter) {
    options_.metadataWriter = std::move(metadataWriter);
    return *this;
  }

  // Applies the table serde parameters. Keys that are absent fall back to
  // the defaults of the corresponding Config entries.
  ColumnWriterOptionBuilder& withSerdeParams(
      const std::map<std::string, std::string>& serdeParams);

  ColumnWriterOptions build() const;

 private:
  ColumnWriterOptions options_;
};

} // namespace facebook::dorc
