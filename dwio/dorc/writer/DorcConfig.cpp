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
#include "dwio/dorc/writer/DorcConfig.h"

#include <gflags/gflags.h>

DEFINE_string(
    dorc_default_compression,
    "ZSTD",
    "Compression of column streams, one of NONE, ZLIB, SNAPPY, LZ4, ZSTD.");

DEFINE_uint32(
    dorc_default_buffer_size,
    256 * 1024,
    "Size of the column stream compression buffer, in bytes.");

DEFINE_string(
    dorc_default_encoding,
    "ORC",
    "File encoding the column writers target, ORC or DWRF.");

DEFINE_string(
    dorc_default_storage_time_zone,
    "UTC",
    "Time zone timestamp columns are stored in.");

DEFINE_uint64(
    dorc_string_statistics_limit,
    64,
    "Longest string min/max value, in bytes, kept in column statistics.");

namespace facebook::dorc {

/* static */ Config::Entry<CompressionKind> Config::COMPRESSION(
    "orc.compress",
    compressionKindFromString(FLAGS_dorc_default_compression),
    [](const CompressionKind& val) { return toString(val); },
    [](const std::string& /* key */, const std::string& val) {
      return compressionKindFromString(val);
    });

/* static */ Config::Entry<uint32_t> Config::BUFFER_SIZE(
    "orc.compress.size",
    FLAGS_dorc_default_buffer_size);

/* static */ Config::Entry<OrcEncoding> Config::ENCODING(
    "orc.encoding",
    orcEncodingFromString(FLAGS_dorc_default_encoding),
    [](const OrcEncoding& val) { return toString(val); },
    [](const std::string& /* key */, const std::string& val) {
      return orcEncodingFromString(val);
    });

/* static */ Config::Entry<std::string> Config::STORAGE_TIME_ZONE(
    "hive.storage.timezone",
    FLAGS_dorc_default_storage_time_zone);

/* static */ Config::Entry<uint64_t> Config::STRING_STATISTICS_LIMIT(
    "orc.string.statistics.limit",
    FLAGS_dorc_string_statistics_limit);

} // namespace facebook::dorc
