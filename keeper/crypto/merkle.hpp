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

#include <span>

KEEPER_NAMESPACE_BEGIN

// Commutative keccak256 of two nodes, the smaller one hashed first
bytes32_t hash_pair(bytes32_t const &a, bytes32_t const &b);

// Root obtained by folding the proof into leaf
bytes32_t
process_proof(std::span<bytes32_t const> proof, bytes32_t const &leaf);

bool verify_proof(
    std::span<bytes32_t const> proof, bytes32_t const &root,
    bytes32_t const &leaf);

KEEPER_NAMESPACE_END
