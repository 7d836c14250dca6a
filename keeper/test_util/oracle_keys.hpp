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

#include <keeper/core/address.hpp>
#include <keeper/core/byte_string.hpp>
#include <keeper/core/bytes.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace keeper::test
{
    struct OracleKey
    {
        bytes32_t secret;
        Address address;
    };

    OracleKey make_oracle_key(uint64_t seed);

    // n keys ordered by increasing address
    std::vector<OracleKey> make_oracle_keys(size_t n);

    // r || s || v, v in {27, 28}
    byte_string_fixed<65>
    sign_digest(bytes32_t const &digest, bytes32_t const &secret);

    // Concatenated signatures of every key, in key order
    byte_string
    sign_all(bytes32_t const &digest, std::span<OracleKey const> keys);
}
