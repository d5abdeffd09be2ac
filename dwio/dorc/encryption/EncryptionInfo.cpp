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
#include "dwio/dorc/encryption/EncryptionInfo.h"

#include "dwio/dorc/common/Exceptions.h"
#include "dwio/dorc/schema/OrcTypeUtils.h"

namespace facebook::dorc {

EncryptionInfo::EncryptionInfo(
    folly::F14FastMap<uint32_t, std::shared_ptr<DataEncryptor>>
        encryptorsByGroup,
    std::vector<std::string> encryptedKeyMetadatas,
    folly::F14FastMap<uint32_t, uint32_t> nodeToGroup)
    : encryptorsByGroup_{std::move(encryptorsByGroup)},
      encryptedKeyMetadatas_{std::move(encryptedKeyMetadatas)},
      nodeToGroup_{std::move(nodeToGroup)} {
  DORC_USER_CHECK(
      encryptedKeyMetadatas_.size() == encryptorsByGroup_.size(),
      "Got {} encrypted key metadatas for {} encryption groups.",
      encryptedKeyMetadatas_.size(),
      encryptorsByGroup_.size());
  for (const auto& [group, encryptor] : encryptorsByGroup_) {
    DORC_USER_CHECK(
        encryptor != nullptr, "Encryption group {} has no encryptor.", group);
  }
  for (const auto& [node, group] : nodeToGroup_) {
    DORC_USER_CHECK(
        encryptorsByGroup_.contains(group),
        "Node {} references unknown encryption group {}.",
        node,
        group);
  }
}

folly::F14FastMap<uint32_t, uint32_t> EncryptionInfo::createNodeToGroupMap(
    const std::vector<std::vector<uint32_t>>& groupRoots,
    const std::vector<OrcType>& orcTypes) {
  folly::F14FastMap<uint32_t, uint32_t> nodeToGroup;
  for (uint32_t group = 0; group < groupRoots.size(); ++group) {
    for (auto root : groupRoots[group]) {
      for (auto node : collectSubtreeOrdinals(orcTypes, root)) {
        auto [it, inserted] = nodeToGroup.emplace(node, group);
        DORC_USER_CHECK(
            inserted || it->second == group,
            "Node {} is covered by encryption groups {} and {}.",
            node,
            it->second,
            group);
      }
    }
  }
  return nodeToGroup;
}

std::shared_ptr<DataEncryptor> EncryptionInfo::getEncryptorByNodeId(
    uint32_t nodeId) const {
  auto group = getGroupByNodeId(nodeId);
  if (!group.has_value()) {
    return nullptr;
  }
  return getEncryptorByGroupId(*group);
}

std::shared_ptr<DataEncryptor> EncryptionInfo::getEncryptorByGroupId(
    uint32_t groupId) const {
  auto it = encryptorsByGroup_.find(groupId);
  DORC_USER_CHECK(
      it != encryptorsByGroup_.end(), "Unknown encryption group {}.", groupId);
  return it->second;
}

std::optional<uint32_t> EncryptionInfo::getGroupByNodeId(
    uint32_t nodeId) const {
  auto it = nodeToGroup_.find(nodeId);
  if (it == nodeToGroup_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace facebook::dorc
