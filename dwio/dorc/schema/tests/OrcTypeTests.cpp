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
#include <gtest/gtest.h>

#include "dwio/dorc/common/tests/GTestUtils.h"
#include "dwio/dorc/schema/OrcType.h"
#include "dwio/dorc/schema/OrcTypeUtils.h"

using namespace facebook;

namespace {

std::vector<std::string> describe(const std::vector<dorc::OrcType>& orcTypes) {
  std::vector<std::string> result;
  result.reserve(orcTypes.size());
  for (const auto& orcType : orcTypes) {
    result.push_back(orcType.toString());
  }
  return result;
}

} // namespace

TEST(OrcTypeTests, kindToString) {
  EXPECT_EQ("BOOLEAN", dorc::toString(dorc::OrcTypeKind::Boolean));
  EXPECT_EQ("TIMESTAMP", dorc::toString(dorc::OrcTypeKind::Timestamp));
  EXPECT_EQ("UNION", dorc::toString(dorc::OrcTypeKind::Union));
  EXPECT_EQ("CHAR", fmt::format("{}", dorc::OrcTypeKind::Char));
  EXPECT_EQ(
      "UNKNOWN(42)", dorc::toString(static_cast<dorc::OrcTypeKind>(42)));
}

TEST(OrcTypeTests, kindMatchesFooterNumbering) {
  EXPECT_EQ(0, static_cast<int>(dorc::OrcTypeKind::Boolean));
  EXPECT_EQ(9, static_cast<int>(dorc::OrcTypeKind::Timestamp));
  EXPECT_EQ(12, static_cast<int>(dorc::OrcTypeKind::Struct));
  EXPECT_EQ(15, static_cast<int>(dorc::OrcTypeKind::Date));
  EXPECT_EQ(17, static_cast<int>(dorc::OrcTypeKind::Char));
}

TEST(OrcTypeTests, toString) {
  EXPECT_EQ("INT", dorc::OrcType{dorc::OrcTypeKind::Int}.toString());
  EXPECT_EQ(
      "STRUCT(children=[1, 2])",
      (dorc::OrcType{dorc::OrcTypeKind::Struct, {1, 2}, {"a", "b"}})
          .toString());
  EXPECT_EQ("DECIMAL(10, 2)", dorc::OrcType::decimal(10, 2).toString());
  EXPECT_EQ(
      "CHAR(5)",
      dorc::OrcType::withLength(dorc::OrcTypeKind::Char, 5).toString());
}

TEST(OrcTypeTests, invalidNodes) {
  DORC_ASSERT_USER_THROW_CODE(
      (dorc::OrcType{dorc::OrcTypeKind::Struct, {1, 2}, {"a"}}),
      dorc::error_code::InvalidArgument,
      "Field name count 1 does not match field count 2");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::OrcType::decimal(4, 6),
      dorc::error_code::InvalidArgument,
      "Decimal scale 6 exceeds precision 4.");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::OrcType::withLength(dorc::OrcTypeKind::Int, 3),
      dorc::error_code::InvalidArgument,
      "Only CHAR and VARCHAR carry a length");

  dorc::OrcType list{dorc::OrcTypeKind::List, {1}};
  EXPECT_EQ(1, list.fieldTypeIndex(0));
  DORC_ASSERT_USER_THROW_CODE(
      list.fieldTypeIndex(1),
      dorc::error_code::MalformedSchema,
      "Field 1 requested from LIST node with 1 fields.");
}

TEST(OrcTypeTests, createOrcTypesPreOrder) {
  auto type = velox::ROW(
      {{"id", velox::BIGINT()},
       {"tags", velox::ARRAY(velox::VARCHAR())},
       {"attrs",
        velox::MAP(velox::INTEGER(), velox::ROW({{"x", velox::DOUBLE()}}))},
       {"day", velox::DATE()},
       {"price", velox::DECIMAL(12, 3)},
       {"ts", velox::TIMESTAMP()}});

  auto orcTypes = dorc::createOrcTypes(type);
  EXPECT_EQ(
      (std::vector<std::string>{
          "STRUCT(children=[1, 2, 4, 8, 9, 10])",
          "LONG",
          "LIST(children=[3])",
          "STRING",
          "MAP(children=[5, 6])",
          "INT",
          "STRUCT(children=[7])",
          "DOUBLE",
          "DATE",
          "DECIMAL(12, 3)",
          "TIMESTAMP"}),
      describe(orcTypes));
  EXPECT_EQ(
      (std::vector<std::string>{"id", "tags", "attrs", "day", "price", "ts"}),
      orcTypes[0].fieldNames());
  EXPECT_EQ(std::vector<std::string>{"x"}, orcTypes[6].fieldNames());
  EXPECT_TRUE(orcTypes[2].fieldNames().empty());
}

TEST(OrcTypeTests, createOrcTypesScalars) {
  EXPECT_EQ(
      std::vector<std::string>{"BOOLEAN"},
      describe(dorc::createOrcTypes(velox::BOOLEAN())));
  EXPECT_EQ(
      std::vector<std::string>{"BYTE"},
      describe(dorc::createOrcTypes(velox::TINYINT())));
  EXPECT_EQ(
      std::vector<std::string>{"SHORT"},
      describe(dorc::createOrcTypes(velox::SMALLINT())));
  EXPECT_EQ(
      std::vector<std::string>{"FLOAT"},
      describe(dorc::createOrcTypes(velox::REAL())));
  EXPECT_EQ(
      std::vector<std::string>{"BINARY"},
      describe(dorc::createOrcTypes(velox::VARBINARY())));
  EXPECT_EQ(
      std::vector<std::string>{"DECIMAL(30, 10)"},
      describe(dorc::createOrcTypes(velox::DECIMAL(30, 10))));
}

TEST(OrcTypeTests, createOrcTypesUnsupported) {
  DORC_ASSERT_USER_THROW_CODE(
      dorc::createOrcTypes(velox::ROW({{"u", velox::UNKNOWN()}})),
      dorc::error_code::UnsupportedKind,
      "has no ORC representation");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::createOrcTypes(nullptr),
      dorc::error_code::InvalidArgument,
      "Logical type is null.");
}

TEST(OrcTypeTests, collectSubtreeOrdinals) {
  auto orcTypes = dorc::createOrcTypes(velox::ROW(
      {{"a", velox::INTEGER()},
       {"b", velox::MAP(velox::VARCHAR(), velox::ARRAY(velox::BIGINT()))},
       {"c", velox::DOUBLE()}}));

  EXPECT_EQ(
      (std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6}),
      dorc::collectSubtreeOrdinals(orcTypes, 0));
  EXPECT_EQ(
      (std::vector<uint32_t>{2, 3, 4, 5}),
      dorc::collectSubtreeOrdinals(orcTypes, 2));
  EXPECT_EQ(
      std::vector<uint32_t>{6}, dorc::collectSubtreeOrdinals(orcTypes, 6));
  DORC_ASSERT_USER_THROW_CODE(
      dorc::collectSubtreeOrdinals(orcTypes, 7),
      dorc::error_code::MalformedSchema,
      "Ordinal 7 is out of range, schema has 7 nodes.");
}

TEST(OrcTypeTests, collectSubtreeOrdinalsRejectsCycles) {
  std::vector<dorc::OrcType> orcTypes{
      dorc::OrcType{dorc::OrcTypeKind::Struct, {1}},
      dorc::OrcType{dorc::OrcTypeKind::List, {0}}};
  DORC_ASSERT_USER_THROW_CODE(
      dorc::collectSubtreeOrdinals(orcTypes, 0),
      dorc::error_code::MalformedSchema,
      "is not a tree");
}
