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
#include "dwio/dorc/writer/ColumnWriterOptions.h"

#include "dwio/dorc/common/Exceptions.h"

namespace facebook::dorc {

void ColumnWriterOptions::validate() const {
  DORC_USER_CHECK_GT(bufferSize, 0);
  DORC_USER_CHECK_GT(stringStatisticsLimit, 0);
  DORC_USER_CHECK(metadataWriter != nullptr, "Metadata writer is required.");
  DORC_USER_CHECK(
      metadataWriter->encoding() == orcEncoding,
      "Metadata writer encodes {} but column writers are configured for {}.",
      metadataWriter->encoding(),
      orcEncoding);
}

} // namespace facebook::dorc
