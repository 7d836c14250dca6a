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

#include <keeper/core/bytes.hpp>
#include <keeper/crypto/merkle.hpp>
#include <keeper/crypto/merkle_tree.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace keeper;
using namespace evmc::literals;

namespace
{
    std::vector<bytes32_t> make_leaves(size_t const n)
    {
        std::vector<bytes32_t> leaves;
        for (uint64_t i = 0; i < n; ++i) {
            bytes32_t const word{i};
            leaves.push_back(keccak256_bytes(word));
        }
        return leaves;
    }
}

TEST(Merkle, hash_pair_is_commutative)
{
    auto const a = keccak256_bytes(to_byte_string_view("a"));
    auto const b = keccak256_bytes(to_byte_string_view("b"));
    EXPECT_EQ(hash_pair(a, b), hash_pair(b, a));
    EXPECT_NE(hash_pair(a, b), hash_pair(a, a));
}

TEST(Merkle, single_leaf_tree)
{
    auto const leaves = make_leaves(1);
    MerkleTree const tree{leaves};
    EXPECT_EQ(tree.root(), leaves[0]);
    EXPECT_TRUE(tree.proof(0).empty());
    EXPECT_TRUE(verify_proof({}, tree.root(), leaves[0]));
}

TEST(Merkle, empty_tree)
{
    MerkleTree const tree{std::vector<bytes32_t>{}};
    EXPECT_EQ(tree.size(), 0);
    EXPECT_EQ(tree.root(), bytes32_t{});
}

TEST(Merkle, two_leaves)
{
    auto const leaves = make_leaves(2);
    MerkleTree const tree{leaves};
    EXPECT_EQ(tree.root(), hash_pair(leaves[0], leaves[1]));
    EXPECT_EQ(tree.proof(0), std::vector<bytes32_t>{leaves[1]});
    EXPECT_EQ(tree.proof(1), std::vector<bytes32_t>{leaves[0]});
}

TEST(Merkle, every_proof_verifies)
{
    for (size_t n : {3, 4, 5, 7, 8, 13}) {
        auto const leaves = make_leaves(n);
        MerkleTree const tree{leaves};
        for (size_t i = 0; i < n; ++i) {
            auto const proof = tree.proof(i);
            EXPECT_TRUE(verify_proof(proof, tree.root(), leaves[i]))
                << "n=" << n << " i=" << i;
            EXPECT_EQ(process_proof(proof, leaves[i]), tree.root());
        }
    }
}

TEST(Merkle, tampered_proof_fails)
{
    auto const leaves = make_leaves(5);
    MerkleTree const tree{leaves};
    auto proof = tree.proof(2);
    ASSERT_FALSE(proof.empty());

    EXPECT_FALSE(verify_proof(proof, tree.root(), leaves[3]));

    proof[0].bytes[0] ^= 1;
    EXPECT_FALSE(verify_proof(proof, tree.root(), leaves[2]));

    proof = tree.proof(2);
    proof.pop_back();
    EXPECT_FALSE(verify_proof(proof, tree.root(), leaves[2]));
}
