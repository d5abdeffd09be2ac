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
#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace facebook::dorc {

enum class StatisticsKind : uint8_t {
  Integer,
  Date,
  Binary,
};

std::string toString(StatisticsKind kind);

inline std::ostream& operator<<(std::ostream& os, StatisticsKind kind) {
  return os << toString(kind);
}

// Per column summary accumulator. Column writers create one builder per row
// group through their StatisticsBuilderFactory and hand the result to the
// metadata writer on flush.
class StatisticsBuilder {
 public:
  virtual ~StatisticsBuilder() = default;

  virtual StatisticsKind kind() const = 0;
};

class IntegerStatisticsBuilder : public StatisticsBuilder {
 public:
  StatisticsKind kind() const override {
    return StatisticsKind::Integer;
  }
};

// Days since epoch. Stored as integers, summarized as DATE statistics.
class DateStatisticsBuilder : public StatisticsBuilder {
 public:
  StatisticsKind kind() const override {
    return StatisticsKind::Date;
  }
};

class BinaryStatisticsBuilder : public StatisticsBuilder {
 public:
  StatisticsKind kind() const override {
    return StatisticsKind::Binary;
  }
};

using StatisticsBuilderFactory =
    std::function<std::unique_ptr<StatisticsBuilder>()>;

StatisticsBuilderFactory statisticsBuilderFactory(StatisticsKind kind);

} // namespace facebook::dorc

template <>
struct fmt::formatter<facebook::dorc::StatisticsKind>
    : fmt::formatter<std::string> {
  auto format(facebook::dorc::StatisticsKind kind, format_context& ctx) const {
    return fmt::formatter<std::string>::format(
        facebook::dorc::toString(kind), ctx);
  }
};
