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

#include <keeper/abi/big_endian.hpp>
#include <keeper/core/address.hpp>
#include <keeper/core/byte_string.hpp>
#include <keeper/core/bytes.hpp>
#include <keeper/core/config.hpp>
#include <keeper/core/int.hpp>
#include <keeper/core/unaligned.hpp>

#include <cstddef>

KEEPER_NAMESPACE_BEGIN

// Helpers for encoding values the way solidity `abi.encode()` does. Only the
// static (single word) types are needed: event payloads, merkle leaves and
// EIP-712 struct hashes.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
constexpr bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    unaligned_store(&output.bytes[12], address);
    return output;
}

template <BigEndianType I>
constexpr bytes32_t abi_encode_uint(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    unaligned_store(&output.bytes[offset], i);
    return output;
}

// x is a two's complement word; any intN below 256 bits must already be sign
// extended, which is how they are stored everywhere in this library
constexpr bytes32_t abi_encode_int(uint256_t const &x)
{
    return abi_encode_uint(u256_be{x});
}

constexpr bytes32_t abi_encode_bool(bool const b)
{
    u64_be as_int = b ? 1 : 0;
    return abi_encode_uint(as_int);
}

// Head-only tuple encoder, every member is a static type
class AbiEncoder
{
    byte_string head_;

public:
    AbiEncoder &add_address(Address const &address)
    {
        head_ += abi_encode_address(address);
        return *this;
    }

    template <BigEndianType I>
    AbiEncoder &add_uint(I const &i)
    {
        head_ += abi_encode_uint(i);
        return *this;
    }

    AbiEncoder &add_int(uint256_t const &i)
    {
        head_ += abi_encode_int(i);
        return *this;
    }

    AbiEncoder &add_bytes32(bytes32_t const &b)
    {
        head_ += b;
        return *this;
    }

    byte_string encode_final()
    {
        return std::move(head_);
    }
};

KEEPER_NAMESPACE_END
