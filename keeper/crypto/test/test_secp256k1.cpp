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

#include <keeper/core/bytes.hpp>
#include <keeper/crypto/secp256k1.hpp>
#include <keeper/test_util/oracle_keys.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>

using namespace keeper;
using namespace keeper::test;
using namespace evmc::literals;

namespace
{
    constexpr uint256_t SECP256K1_ORDER = intx::from_string<uint256_t>(
        "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");

    constexpr bytes32_t DIGEST =
        0x5cd2e8a4b3f0d9c1a7e6b5f4c3d2e1f0a9b8c7d6e5f4a3b2c1d0e9f8a7b6c5d4_bytes32;
}

TEST(Secp256k1, address_from_generator_point)
{
    // public key of secret key 1
    auto const pubkey = evmc::from_hex(
        "0479be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
        "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8");
    ASSERT_TRUE(pubkey.has_value());
    ASSERT_EQ(pubkey->size(), 65);
    byte_string_fixed<65> serialized;
    std::copy_n(pubkey->data(), 65, serialized.data());
    EXPECT_EQ(
        address_from_secpkey(serialized),
        0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf_address);
}

TEST(Secp256k1, recover_signer)
{
    auto const key = make_oracle_key(7);
    auto const sig = sign_digest(DIGEST, key.secret);
    auto const signer = recover_signer(DIGEST, to_byte_string_view(sig));
    ASSERT_TRUE(signer.has_value());
    EXPECT_EQ(*signer, key.address);

    // a different digest recovers some other address
    auto const other =
        recover_signer(0x01_bytes32, to_byte_string_view(sig));
    EXPECT_NE(other, std::optional{key.address});
}

TEST(Secp256k1, context_is_reused_per_thread)
{
    auto *const context = get_secp_context();
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(get_secp_context(), context);

    // recovery goes through the same context
    auto const key = make_oracle_key(3);
    auto const sig = sign_digest(DIGEST, key.secret);
    EXPECT_EQ(
        recover_signer(DIGEST, to_byte_string_view(sig)),
        std::optional{key.address});
    EXPECT_EQ(get_secp_context(), context);
}

TEST(Secp256k1, rejects_bad_recovery_id)
{
    auto const key = make_oracle_key(7);
    auto sig = sign_digest(DIGEST, key.secret);
    for (unsigned char const v : {0, 1, 26, 29, 255}) {
        sig[64] = v;
        EXPECT_FALSE(
            recover_signer(DIGEST, to_byte_string_view(sig)).has_value());
    }
}

TEST(Secp256k1, rejects_wrong_length)
{
    auto const key = make_oracle_key(7);
    auto const sig = sign_digest(DIGEST, key.secret);
    EXPECT_FALSE(
        recover_signer(DIGEST, byte_string_view{sig.data(), 64}).has_value());
    EXPECT_FALSE(recover_signer(DIGEST, {}).has_value());
}

TEST(Secp256k1, rejects_high_s)
{
    auto const key = make_oracle_key(7);
    auto sig = sign_digest(DIGEST, key.secret);

    auto const s = intx::be::unsafe::load<uint256_t>(sig.data() + 32);
    ASSERT_LE(s, SECP256K1_HALF_ORDER);

    // (r, n - s) with the flipped parity is the malleable twin
    intx::be::unsafe::store(sig.data() + 32, SECP256K1_ORDER - s);
    sig[64] = sig[64] == 27 ? 28 : 27;
    EXPECT_FALSE(recover_signer(DIGEST, to_byte_string_view(sig)).has_value());
}

TEST(Secp256k1, rejects_zero_r)
{
    auto const key = make_oracle_key(7);
    auto sig = sign_digest(DIGEST, key.secret);
    std::fill_n(sig.data(), 32, 0);
    EXPECT_FALSE(recover_signer(DIGEST, to_byte_string_view(sig)).has_value());
}
