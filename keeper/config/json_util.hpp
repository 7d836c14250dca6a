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
#include <keeper/core/config.hpp>
#include <keeper/core/int.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>

KEEPER_NAMESPACE_BEGIN

// Field parsers shared by the config and replay loaders. Malformed input
// throws std::invalid_argument (or a nlohmann::json exception for a value of
// the wrong json type).

Address parse_address(std::string_view);

bytes32_t parse_bytes32(std::string_view);

byte_string parse_hex(std::string_view);

// json number or decimal / 0x hex string
uint256_t parse_uint256(nlohmann::json const &);

// as parse_uint256, a leading '-' yields the two's complement value
uint256_t parse_int256(nlohmann::json const &);

uint64_t parse_uint64(nlohmann::json const &);

KEEPER_NAMESPACE_END
