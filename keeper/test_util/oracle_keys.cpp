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
#include <keeper/crypto/secp256k1.hpp>
#include <keeper/test_util/oracle_keys.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <algorithm>
#include <memory>

namespace keeper::test
{
    namespace
    {
        secp256k1_context const *signing_context()
        {
            static std::unique_ptr<
                secp256k1_context,
                decltype(&secp256k1_context_destroy)> const
                context(
                    secp256k1_context_create(
                        SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY),
                    &secp256k1_context_destroy);
            return context.get();
        }
    }

    OracleKey make_oracle_key(uint64_t const seed)
    {
        bytes32_t const secret{0x1000 + seed};
        secp256k1_pubkey public_key;
        KEEPER_ASSERT(
            1 == secp256k1_ec_pubkey_create(
                     signing_context(), &public_key, secret.bytes));

        byte_string_fixed<65> serialized;
        size_t size = serialized.size();
        KEEPER_ASSERT(
            1 == secp256k1_ec_pubkey_serialize(
                     signing_context(),
                     serialized.data(),
                     &size,
                     &public_key,
                     SECP256K1_EC_UNCOMPRESSED));
        KEEPER_ASSERT(size == 65);
        return OracleKey{
            .secret = secret, .address = address_from_secpkey(serialized)};
    }

    std::vector<OracleKey> make_oracle_keys(size_t const n)
    {
        std::vector<OracleKey> keys;
        for (size_t i = 0; i < n; ++i) {
            keys.push_back(make_oracle_key(i));
        }
        std::ranges::sort(keys, [](OracleKey const &a, OracleKey const &b) {
            return a.address < b.address;
        });
        return keys;
    }

    byte_string_fixed<65>
    sign_digest(bytes32_t const &digest, bytes32_t const &secret)
    {
        secp256k1_ecdsa_recoverable_signature sig;
        KEEPER_ASSERT(
            1 == secp256k1_ecdsa_sign_recoverable(
                     signing_context(),
                     &sig,
                     digest.bytes,
                     secret.bytes,
                     secp256k1_nonce_function_default,
                     nullptr));

        byte_string_fixed<65> serialized;
        int recid = 0;
        KEEPER_ASSERT(
            1 == secp256k1_ecdsa_recoverable_signature_serialize_compact(
                     signing_context(), serialized.data(), &recid, &sig));
        serialized[64] = static_cast<unsigned char>(27 + recid);
        return serialized;
    }

    byte_string
    sign_all(bytes32_t const &digest, std::span<OracleKey const> const keys)
    {
        byte_string signatures;
        for (auto const &key : keys) {
            auto const sig = sign_digest(digest, key.secret);
            signatures.append(sig.data(), sig.size());
        }
        return signatures;
    }
}
