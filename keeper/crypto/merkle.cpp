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

#include <keeper/core/byte_string.hpp>
#include <keeper/core/keccak.hpp>
#include <keeper/crypto/merkle.hpp>

#include <cstring>

KEEPER_NAMESPACE_BEGIN

bytes32_t hash_pair(bytes32_t const &a, bytes32_t const &b)
{
    unsigned char buf[2 * sizeof(bytes32_t)];
    bool const a_first = a < b;
    std::memcpy(buf, (a_first ? a : b).bytes, sizeof(bytes32_t));
    std::memcpy(
        buf + sizeof(bytes32_t), (a_first ? b : a).bytes, sizeof(bytes32_t));
    return to_bytes(keccak256(buf));
}

bytes32_t
process_proof(std::span<bytes32_t const> const proof, bytes32_t const &leaf)
{
    bytes32_t computed = leaf;
    for (auto const &sibling : proof) {
        computed = hash_pair(computed, sibling);
    }
    return computed;
}

bool verify_proof(
    std::span<bytes32_t const> const proof, bytes32_t const &root,
    bytes32_t const &leaf)
{
    return process_proof(proof, leaf) == root;
}

KEEPER_NAMESPACE_END
