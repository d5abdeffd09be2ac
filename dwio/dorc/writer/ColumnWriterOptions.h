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

#include "dwio/dorc/common/Types.h"
#include "dwio/dorc/encryption/EncryptionInfo.h"
#include "dwio/dorc/writer/MetadataWriter.h"

namespace facebook::velox::tz {
class TimeZone;
} // namespace facebook::velox::tz

namespace facebook::dorc {

// File level settings shared by every column writer of a file.
struct ColumnWriterOptions {
  CompressionKind compression = CompressionKind::Zstd;

  // Size of the compression buffer, in bytes.
  uint32_t bufferSize = 256 * 1024;

  OrcEncoding orcEncoding = OrcEncoding::Orc;

  // Zone timestamps are stored in. Required when the schema contains a
  // TIMESTAMP node.
  const velox::tz::TimeZone* storageTimeZone = nullptr;

  // Longest string min/max, in bytes, kept in string statistics.
  uint64_t stringStatisticsLimit = 64;

  EncryptionInfo encryptionInfo;

  std::shared_ptr<MetadataWriter> metadataWriter;

  // Throws DorcUserError on options no file can be written with.
  void validate() const;
};

} // namespace facebook::dorc
