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
#include "dwio/dorc/stats/StatisticsBuilder.h"

#include "dwio/dorc/common/Exceptions.h"

namespace facebook::dorc {

std::string toString(StatisticsKind kind) {
  switch (kind) {
    case StatisticsKind::Integer:
      return "INTEGER";
    case StatisticsKind::Date:
      return "DATE";
    case StatisticsKind::Binary:
      return "BINARY";
  }
  return fmt::format("UNKNOWN({})", static_cast<uint32_t>(kind));
}

StatisticsBuilderFactory statisticsBuilderFactory(StatisticsKind kind) {
  switch (kind) {
    case StatisticsKind::Integer:
      return []() { return std::make_unique<IntegerStatisticsBuilder>(); };
    case StatisticsKind::Date:
      return []() { return std::make_unique<DateStatisticsBuilder>(); };
    case StatisticsKind::Binary:
      return []() { return std::make_unique<BinaryStatisticsBuilder>(); };
  }
  DORC_UNREACHABLE("Unknown statistics kind: {}.", toString(kind));
}

} // namespace facebook::dorc
