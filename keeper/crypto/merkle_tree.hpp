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

#pragma once

#include <keeper/core/bytes.hpp>
#include <keeper/core/config.hpp>

#include <cstddef>
#include <vector>

KEEPER_NAMESPACE_BEGIN

// Sorted pair keccak256 tree over a list of leaves. Leaves are paired left to
// right on each level, an unpaired last node is carried up unchanged. Proofs
// verify with verify_proof().
class MerkleTree
{
    std::vector<std::vector<bytes32_t>> layers_;

public:
    explicit MerkleTree(std::vector<bytes32_t> leaves);

    size_t size() const noexcept
    {
        return layers_.front().size();
    }

    // zero for an empty tree
    bytes32_t root() const;

    std::vector<bytes32_t> proof(size_t index) const;
};

KEEPER_NAMESPACE_END
