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
#include "dwio/dorc/writer/ColumnWriterOptionBuilder.h"

#include <glog/logging.h>

#include "dwio/dorc/common/Exceptions.h"
#include "dwio/dorc/writer/DorcConfig.h"
#include "velox/type/tz/TimeZoneMap.h"

namespace facebook::dorc {

ColumnWriterOptionBuilder& ColumnWriterOptionBuilder::withStorageTimeZone(
    std::string_view timeZoneName) {
  const auto* timeZone =
      velox::tz::locateZone(timeZoneName, /*failOnError=*/false);
  DORC_USER_CHECK(
      timeZone != nullptr, "Unknown storage time zone: '{}'.", timeZoneName);
  options_.storageTimeZone = timeZone;
  return *this;
}

ColumnWriterOptionBuilder& ColumnWriterOptionBuilder::withSerdeParams(
    const std::map<std::string, std::string>& serdeParams) {
  auto config = Config::fromMap(serdeParams);

  withCompression(config->get(Config::COMPRESSION));
  withBufferSize(config->get(Config::BUFFER_SIZE));
  withOrcEncoding(config->get(Config::ENCODING));
  withStorageTimeZone(config->get(Config::STORAGE_TIME_ZONE));
  withStringStatisticsLimit(config->get(Config::STRING_STATISTICS_LIMIT));

  LOG(INFO) << fmt::format(
      "column writer options from serde params: compression {}, buffer size "
      "{}, encoding {}, storage time zone {}, string statistics limit {}",
      options_.compression,
      options_.bufferSize,
      options_.orcEncoding,
      options_.storageTimeZone->name(),
      options_.stringStatisticsLimit);
  return *this;
}

ColumnWriterOptions ColumnWriterOptionBuilder::build() const {
  options_.validate();
  return options_;
}

} // namespace facebook::dorc
