// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <keeper/core/assert.h>
#include <keeper/crypto/merkle.hpp>
#include <keeper/crypto/merkle_tree.hpp>

#include <utility>

KEEPER_NAMESPACE_BEGIN

MerkleTree::MerkleTree(std::vector<bytes32_t> leaves)
{
    layers_.emplace_back(std::move(leaves));
    while (layers_.back().size() > 1) {
        auto const &prev = layers_.back();
        std::vector<bytes32_t> next;
        next.reserve((prev.size() + 1) / 2);
        for (size_t i = 0; i < prev.size(); i += 2) {
            if (i + 1 < prev.size()) {
                next.push_back(hash_pair(prev[i], prev[i + 1]));
            }
            else {
                next.push_back(prev[i]);
            }
        }
        layers_.emplace_back(std::move(next));
    }
}

bytes32_t MerkleTree::root() const
{
    if (layers_.back().empty()) {
        return {};
    }
    return layers_.back().front();
}

std::vector<bytes32_t> MerkleTree::proof(size_t index) const
{
    KEEPER_ASSERT(index < size());
    std::vector<bytes32_t> proof;
    for (size_t level = 0; level + 1 < layers_.size(); ++level) {
        auto const &layer = layers_[level];
        size_t const sibling = index ^ 1;
        if (sibling < layer.size()) {
            proof.push_back(layer[sibling]);
        }
        index /= 2;
    }
    return proof;
}

KEEPER_NAMESPACE_END
