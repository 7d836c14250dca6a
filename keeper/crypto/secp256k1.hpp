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

#include <secp256k1.h>

#include <cstddef>
#include <optional>

KEEPER_NAMESPACE_BEGIN

// r || s || v, v in {27, 28}
inline constexpr size_t SIGNATURE_SIZE = 65;

// Upper bound of the lower half of the curve order; signatures with s above
// it are malleable duplicates and are rejected
inline constexpr uint256_t SECP256K1_HALF_ORDER = intx::from_string<uint256_t>(
    "0x7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0");

Address address_from_secpkey(byte_string_fixed<65> const &);

// Per thread context with the flags silkpre recovery expects
secp256k1_context *get_secp_context();

// Recovers the address that produced a 65 byte signature over digest. Returns
// nullopt for a malformed, malleable or unrecoverable signature.
std::optional<Address>
recover_signer(bytes32_t const &digest, byte_string_view signature);

KEEPER_NAMESPACE_END
