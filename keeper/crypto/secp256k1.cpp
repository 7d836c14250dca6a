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

#include <keeper/core/assert.h>
#include <keeper/core/keccak.hpp>
#include <keeper/crypto/secp256k1.hpp>

#include <silkpre/ecdsa.h>

#include <intx/intx.hpp>

#include <secp256k1.h>

#include <algorithm>
#include <cstdint>
#include <memory>

KEEPER_NAMESPACE_BEGIN

Address address_from_secpkey(byte_string_fixed<65> const &serialized_pubkey)
{
    Address eth_address{};
    KEEPER_ASSERT(serialized_pubkey[0] == 4);
    byte_string_view view{serialized_pubkey.data() + 1, 64};
    auto const hash = keccak256(view);
    std::copy_n(hash.bytes + 12, sizeof(Address), eth_address.bytes);
    return eth_address;
}

secp256k1_context *get_secp_context()
{
    thread_local std::unique_ptr<
        secp256k1_context,
        decltype(&secp256k1_context_destroy)> const
        secp_context(
            secp256k1_context_create(SILKPRE_SECP256K1_CONTEXT_FLAGS),
            &secp256k1_context_destroy);
    return secp_context.get();
}

std::optional<Address>
recover_signer(bytes32_t const &digest, byte_string_view const signature)
{
    if (signature.size() != SIGNATURE_SIZE) {
        return std::nullopt;
    }

    uint8_t const v = signature[64];
    if (v != 27 && v != 28) {
        return std::nullopt;
    }

    auto const r = intx::be::unsafe::load<uint256_t>(signature.data());
    auto const s = intx::be::unsafe::load<uint256_t>(signature.data() + 32);
    if (r == 0 || s == 0 || s > SECP256K1_HALF_ORDER) {
        return std::nullopt;
    }

    Address result;

    if (!silkpre_recover_address(
            result.bytes,
            digest.bytes,
            signature.data(),
            v == 28,
            get_secp_context())) {
        return std::nullopt;
    }

    return result;
}

KEEPER_NAMESPACE_END
