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
#include "dwio/dorc/writer/ColumnWriterOptionBuilder.h"
#include "dwio/dorc/writer/DorcConfig.h"
#include "dwio/dorc/writer/tests/WriterTestUtils.h"

using namespace facebook;

TEST(ColumnWriterOptionBuilderTests, configDefaults) {
  auto config = dorc::Config::fromMap({});
  EXPECT_EQ(
      dorc::CompressionKind::Zstd, config->get(dorc::Config::COMPRESSION));
  EXPECT_EQ(256 * 1024, config->get(dorc::Config::BUFFER_SIZE));
  EXPECT_EQ(dorc::OrcEncoding::Orc, config->get(dorc::Config::ENCODING));
  EXPECT_EQ("UTC", config->get(dorc::Config::STORAGE_TIME_ZONE));
  EXPECT_EQ(64, config->get(dorc::Config::STRING_STATISTICS_LIMIT));
}

TEST(ColumnWriterOptionBuilderTests, configOverrides) {
  auto config = dorc::Config::fromMap(
      {{"orc.compress", "snappy"},
       {"orc.compress.size", "65536"},
       {"orc.encoding", "DWRF"},
       {"hive.storage.timezone", "Asia/Tokyo"},
       {"orc.string.statistics.limit", "16"}});
  EXPECT_EQ(
      dorc::CompressionKind::Snappy, config->get(dorc::Config::COMPRESSION));
  EXPECT_EQ(65536, config->get(dorc::Config::BUFFER_SIZE));
  EXPECT_EQ(dorc::OrcEncoding::Dwrf, config->get(dorc::Config::ENCODING));
  EXPECT_EQ("Asia/Tokyo", config->get(dorc::Config::STORAGE_TIME_ZONE));
  EXPECT_EQ(16, config->get(dorc::Config::STRING_STATISTICS_LIMIT));
}

TEST(ColumnWriterOptionBuilderTests, serdeParams) {
  auto metadataWriter = std::make_shared<dorc::testing::TestMetadataWriter>(
      dorc::OrcEncoding::Dwrf);
  auto options =
      dorc::ColumnWriterOptionBuilder{}
          .withSerdeParams(
              {{"orc.compress", "ZLIB"},
               {"orc.compress.size", "8192"},
               {"orc.encoding", "dwrf"},
               {"hive.storage.timezone", "America/New_York"}})
          .withMetadataWriter(metadataWriter)
          .build();

  EXPECT_EQ(dorc::CompressionKind::Zlib, options.compression);
  EXPECT_EQ(8192, options.bufferSize);
  EXPECT_EQ(dorc::OrcEncoding::Dwrf, options.orcEncoding);
  ASSERT_NE(nullptr, options.storageTimeZone);
  EXPECT_EQ("America/New_York", options.storageTimeZone->name());
  EXPECT_EQ(64, options.stringStatisticsLimit);
  EXPECT_EQ(metadataWriter, options.metadataWriter);
  EXPECT_TRUE(options.encryptionInfo.empty());
}

TEST(ColumnWriterOptionBuilderTests, emptySerdeParamsUseDefaults) {
  auto options = dorc::ColumnWriterOptionBuilder{}
                     .withSerdeParams({})
                     .withMetadataWriter(
                         std::make_shared<dorc::testing::TestMetadataWriter>(
                             dorc::OrcEncoding::Orc))
                     .build();
  EXPECT_EQ(dorc::CompressionKind::Zstd, options.compression);
  EXPECT_EQ(256 * 1024, options.bufferSize);
  EXPECT_EQ(dorc::OrcEncoding::Orc, options.orcEncoding);
  ASSERT_NE(nullptr, options.storageTimeZone);
  EXPECT_EQ("UTC", options.storageTimeZone->name());
}

TEST(ColumnWriterOptionBuilderTests, explicitSetters) {
  auto encryptor = std::make_shared<dorc::testing::TestEncryptor>("pii");
  auto options =
      dorc::ColumnWriterOptionBuilder{}
          .withCompression(dorc::CompressionKind::Lz4)
          .withBufferSize(1024)
          .withOrcEncoding(dorc::OrcEncoding::Orc)
          .withStorageTimeZone("Europe/Berlin")
          .withStringStatisticsLimit(32)
          .withEncryptionInfo(
              dorc::EncryptionInfo{{{0, encryptor}}, {"key"}, {{3, 0}}})
          .withMetadataWriter(
              std::make_shared<dorc::testing::TestMetadataWriter>(
                  dorc::OrcEncoding::Orc))
          .build();

  EXPECT_EQ(dorc::CompressionKind::Lz4, options.compression);
  EXPECT_EQ(1024, options.bufferSize);
  EXPECT_EQ("Europe/Berlin", options.storageTimeZone->name());
  EXPECT_EQ(32, options.stringStatisticsLimit);
  EXPECT_EQ(encryptor, options.encryptionInfo.getEncryptorByNodeId(3));
}

TEST(ColumnWriterOptionBuilderTests, invalidValues) {
  DORC_ASSERT_USER_THROW_CODE(
      dorc::ColumnWriterOptionBuilder{}.withSerdeParams(
          {{"orc.compress", "brotli"}}),
      dorc::error_code::InvalidArgument,
      "Unknown compression kind: 'brotli'.");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::ColumnWriterOptionBuilder{}.withStorageTimeZone("Mars/Olympus"),
      dorc::error_code::InvalidArgument,
      "Unknown storage time zone: 'Mars/Olympus'.");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::ColumnWriterOptionBuilder{}.withSerdeParams(
          {{"orc.encoding", "parquet"}}),
      dorc::error_code::InvalidArgument,
      "Unknown file encoding: 'parquet'.");
  EXPECT_ANY_THROW(dorc::ColumnWriterOptionBuilder{}.withSerdeParams(
      {{"orc.compress.size", "big"}}));

  auto metadataWriter = std::make_shared<dorc::testing::TestMetadataWriter>(
      dorc::OrcEncoding::Orc);
  DORC_ASSERT_USER_THROW_CODE(
      dorc::ColumnWriterOptionBuilder{}
          .withBufferSize(0)
          .withMetadataWriter(metadataWriter)
          .build(),
      dorc::error_code::InvalidArgument,
      "(0 vs. 0)");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::ColumnWriterOptionBuilder{}
          .withSerdeParams({{"orc.string.statistics.limit", "0"}})
          .withMetadataWriter(metadataWriter)
          .build(),
      dorc::error_code::InvalidArgument,
      "(0 vs. 0)");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::ColumnWriterOptionBuilder{}.build(),
      dorc::error_code::InvalidArgument,
      "Metadata writer is required.");
  DORC_ASSERT_USER_THROW_CODE(
      dorc::ColumnWriterOptionBuilder{}
          .withOrcEncoding(dorc::OrcEncoding::Dwrf)
          .withMetadataWriter(metadataWriter)
          .build(),
      dorc::error_code::InvalidArgument,
      "Metadata writer encodes ORC but column writers are configured for "
      "DWRF.");
}
