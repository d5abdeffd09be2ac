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

#include "dwio/dorc/common/Types.h"

#include "velox/common/config/Config.h"

namespace facebook::dorc {

class Config : public velox::common::ConfigBase<Config> {
 public:
  template <typename T>
  using Entry = velox::common::ConfigBase<Config>::Entry<T>;

  static Entry<CompressionKind> COMPRESSION;
  static Entry<uint32_t> BUFFER_SIZE;
  static Entry<OrcEncoding> ENCODING;
  static Entry<std::string> STORAGE_TIME_ZONE;
  static Entry<uint64_t> STRING_STATISTICS_LIMIT;

  static std::shared_ptr<Config> fromMap(
      const std::map<std::string, std::string>& map) {
    auto ret = std::make_shared<Config>();
    ret->configs_.insert(map.cbegin(), map.cend());
    return ret;
  }
};

} // namespace facebook::dorc
