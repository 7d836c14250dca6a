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
#include <keeper/core/bytes.hpp>
#include <keeper/core/config.hpp>
#include <keeper/core/int.hpp>

#include <string>

KEEPER_NAMESPACE_BEGIN

// https://eips.ethereum.org/EIPS/eip-712
struct Eip712Domain
{
    std::string name;
    std::string version;
    uint256_t chain_id;
    Address verifying_contract;
};

bytes32_t domain_separator(Eip712Domain const &);

// keccak256("\x19\x01" || domain_separator || struct_hash)
bytes32_t typed_data_hash(
    bytes32_t const &domain_separator, bytes32_t const &struct_hash);

KEEPER_NAMESPACE_END
