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

#include <bit>
#include <span>
#include <string_view>

#include <cthash/sha3/common.hpp>

// cthash only provides sha3 and not keccak. this function modifies the suffix
// in the trait to return keccaked values
namespace cthash
{
    struct keccak_config
    {
        static constexpr size_t digest_length_bit = 256u;
        static constexpr size_t capacity_bit = 512u;
        static constexpr size_t rate_bit = 1600u - capacity_bit;

        // domain bit = 0x01
        static constexpr auto suffix = keccak_suffix(0, 0x00);
    };

    static_assert(
        keccak_config::rate_bit + keccak_config::capacity_bit == 1600u);

    using keccak_256 = keccak_hasher<keccak_config>;
}

KEEPER_NAMESPACE_BEGIN

// keccak256 of a string known at compile time, e.g. an event signature or an
// EIP-712 type string
consteval bytes32_t keccak256_literal(std::string_view const s)
{
    auto const h = cthash::keccak_256{}.update(std::span{s}).final();
    return std::bit_cast<bytes32_t>(h);
}

consteval bytes32_t abi_encode_event_signature(std::string_view const event)
{
    return keccak256_literal(event);
}

KEEPER_NAMESPACE_END
