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

#include <keeper/config/json_util.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

KEEPER_NAMESPACE_BEGIN

Address parse_address(std::string_view const s)
{
    auto const address = evmc::from_hex<Address>(s);
    if (!address.has_value()) {
        throw std::invalid_argument{"invalid address: " + std::string{s}};
    }
    return *address;
}

bytes32_t parse_bytes32(std::string_view const s)
{
    auto const bytes = evmc::from_hex<bytes32_t>(s);
    if (!bytes.has_value()) {
        throw std::invalid_argument{"invalid bytes32: " + std::string{s}};
    }
    return *bytes;
}

byte_string parse_hex(std::string_view const s)
{
    auto bytes = evmc::from_hex(s);
    if (!bytes.has_value()) {
        throw std::invalid_argument{"invalid hex: " + std::string{s}};
    }
    return std::move(*bytes);
}

uint256_t parse_uint256(nlohmann::json const &j)
{
    if (j.is_number_unsigned()) {
        return uint256_t{j.get<uint64_t>()};
    }
    if (j.is_number_integer()) {
        auto const v = j.get<int64_t>();
        if (v < 0) {
            throw std::invalid_argument{
                "expected unsigned value: " + std::to_string(v)};
        }
        return uint256_t{static_cast<uint64_t>(v)};
    }
    auto const s = j.get<std::string>();
    if (!s.empty() && s.front() == '-') {
        throw std::invalid_argument{"expected unsigned value: " + s};
    }
    return from_signed_string(s);
}

uint256_t parse_int256(nlohmann::json const &j)
{
    if (j.is_number_unsigned()) {
        return uint256_t{j.get<uint64_t>()};
    }
    if (j.is_number_integer()) {
        return from_int64(j.get<int64_t>());
    }
    return from_signed_string(j.get<std::string>());
}

uint64_t parse_uint64(nlohmann::json const &j)
{
    uint256_t const v = parse_uint256(j);
    if (v > std::numeric_limits<uint64_t>::max()) {
        throw std::invalid_argument{"value exceeds uint64"};
    }
    return static_cast<uint64_t>(v);
}

KEEPER_NAMESPACE_END
