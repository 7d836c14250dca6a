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

#include <keeper/core/config.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

KEEPER_NAMESPACE_BEGIN

using uint128_t = ::intx::uint128;

static_assert(sizeof(uint128_t) == 16);
static_assert(alignof(uint128_t) == 8);

using uint256_t = ::intx::uint256;

static_assert(sizeof(uint256_t) == 32);
static_assert(alignof(uint256_t) == 8);

using uint512_t = ::intx::uint512;

static_assert(sizeof(uint512_t) == 64);
static_assert(alignof(uint512_t) == 8);

template <class T>
concept unsigned_integral =
    std::unsigned_integral<T> || std::same_as<uint128_t, T> ||
    std::same_as<uint256_t, T> || std::same_as<uint512_t, T>;

inline constexpr uint128_t UINT128_MAX = std::numeric_limits<uint128_t>::max();

inline constexpr uint256_t UINT256_MAX = std::numeric_limits<uint256_t>::max();

inline constexpr uint512_t UINT512_MAX = std::numeric_limits<uint512_t>::max();

using ::intx::to_big_endian;

//////////////////////////////////////////////////////////////
// Signed values are carried as two's complement uint256_t, the
// same representation the EVM uses for int256 words.
//////////////////////////////////////////////////////////////

[[nodiscard]] constexpr bool is_negative(uint256_t const &x) noexcept
{
    return (x >> 255) != 0;
}

[[nodiscard]] constexpr uint256_t abs_value(uint256_t const &x) noexcept
{
    return is_negative(x) ? -x : x;
}

[[nodiscard]] constexpr uint256_t from_int64(int64_t const v) noexcept
{
    if (v < 0) {
        return -uint256_t{static_cast<uint64_t>(-(v + 1))} - 1;
    }
    return uint256_t{static_cast<uint64_t>(v)};
}

// True if x, read as two's complement, is representable as intBits
template <unsigned Bits>
    requires(Bits > 0 && Bits <= 256)
[[nodiscard]] constexpr bool fits_signed(uint256_t const &x) noexcept
{
    if constexpr (Bits == 256) {
        return true;
    }
    else {
        uint256_t const half = uint256_t{1} << (Bits - 1);
        return (x + half) < (half << 1);
    }
}

template <unsigned Bits>
    requires(Bits > 0 && Bits <= 256)
[[nodiscard]] constexpr bool fits_unsigned(uint256_t const &x) noexcept
{
    if constexpr (Bits == 256) {
        return true;
    }
    else {
        return (x >> Bits) == 0;
    }
}

inline std::string to_signed_string(uint256_t const &x)
{
    if (is_negative(x)) {
        return "-" + intx::to_string(-x);
    }
    return intx::to_string(x);
}

// Parses an optionally negative decimal or 0x-prefixed hex number; throws
// std::invalid_argument or std::out_of_range on malformed input
inline uint256_t from_signed_string(std::string_view s)
{
    if (!s.empty() && s.front() == '-') {
        s.remove_prefix(1);
        auto const magnitude = intx::from_string<uint256_t>(std::string{s});
        if (magnitude > (uint256_t{1} << 255)) {
            throw std::out_of_range{"signed value out of range"};
        }
        return -magnitude;
    }
    return intx::from_string<uint256_t>(std::string{s});
}

KEEPER_NAMESPACE_END
