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

#include <string>
#include <string_view>

namespace facebook::dorc {

// Encryption primitive bound to the data key of one encryption group. Column
// writers holding an encryptor pass their stream bytes through it before the
// streams are written out.
class DataEncryptor {
 public:
  virtual ~DataEncryptor() = default;

  virtual std::string encrypt(std::string_view plaintext) const = 0;

  virtual std::string decrypt(std::string_view ciphertext) const = 0;

  // Name of the key provider / cipher, recorded in the file footer.
  virtual std::string_view name() const = 0;
};

} // namespace facebook::dorc
