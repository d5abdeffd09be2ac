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

#include <folly/container/F14Map.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dwio/dorc/encryption/DataEncryptor.h"
#include "dwio/dorc/schema/OrcType.h"

namespace facebook::dorc {

// Resolves which encryptor, if any, protects a schema node.
//
// DWRF encrypts columns in groups: every group owns one data key (and thus
// one encryptor) and a set of schema nodes. A node belongs to at most one
// group. Nodes that are not listed are written in the clear.
class EncryptionInfo {
 public:
  // No encryption.
  EncryptionInfo() = default;

  EncryptionInfo(
      folly::F14FastMap<uint32_t, std::shared_ptr<DataEncryptor>>
          encryptorsByGroup,
      std::vector<std::string> encryptedKeyMetadatas,
      folly::F14FastMap<uint32_t, uint32_t> nodeToGroup);

  // Expands the root ordinals listed for every group (group id is the
  // position in |groupRoots|) to all ordinals of their subtrees. Fails when
  // two groups cover the same node.
  static folly::F14FastMap<uint32_t, uint32_t> createNodeToGroupMap(
      const std::vector<std::vector<uint32_t>>& groupRoots,
      const std::vector<OrcType>& orcTypes);

  // nullptr when |nodeId| is not encrypted.
  std::shared_ptr<DataEncryptor> getEncryptorByNodeId(uint32_t nodeId) const;

  std::shared_ptr<DataEncryptor> getEncryptorByGroupId(uint32_t groupId) const;

  std::optional<uint32_t> getGroupByNodeId(uint32_t nodeId) const;

  const std::vector<std::string>& encryptedKeyMetadatas() const {
    return encryptedKeyMetadatas_;
  }

  size_t groupCount() const {
    return encryptorsByGroup_.size();
  }

  bool empty() const {
    return nodeToGroup_.empty();
  }

 private:
  folly::F14FastMap<uint32_t, std::shared_ptr<DataEncryptor>>
      encryptorsByGroup_;
  std::vector<std::string> encryptedKeyMetadatas_;
  folly::F14FastMap<uint32_t, uint32_t> nodeToGroup_;
};

} // namespace facebook::dorc
