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

#include "dwio/dorc/common/Types.h"

namespace facebook::dorc {

// Serializes stripe footers, row indexes and column statistics produced by
// the column writers. One instance is shared by all column writers of a file.
class MetadataWriter {
 public:
  virtual ~MetadataWriter() = default;

  // Dialect of the metadata this writer emits. Must match the dialect the
  // column writers encode for.
  virtual OrcEncoding encoding() const = 0;
};

} // namespace facebook::dorc
