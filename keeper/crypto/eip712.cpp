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

#include <keeper/abi/abi_encode.hpp>
#include <keeper/abi/abi_signatures.hpp>
#include <keeper/abi/big_endian.hpp>
#include <keeper/core/byte_string.hpp>
#include <keeper/core/keccak.hpp>
#include <keeper/crypto/eip712.hpp>

KEEPER_NAMESPACE_BEGIN

bytes32_t domain_separator(Eip712Domain const &domain)
{
    constexpr bytes32_t type_hash = keccak256_literal(
        "EIP712Domain(string name,string version,uint256 chainId,address "
        "verifyingContract)");

    auto const encoded =
        AbiEncoder{}
            .add_bytes32(type_hash)
            .add_bytes32(keccak256_bytes(to_byte_string_view(domain.name)))
            .add_bytes32(keccak256_bytes(to_byte_string_view(domain.version)))
            .add_uint(u256_be{domain.chain_id})
            .add_address(domain.verifying_contract)
            .encode_final();
    return keccak256_bytes(encoded);
}

bytes32_t typed_data_hash(
    bytes32_t const &domain_separator, bytes32_t const &struct_hash)
{
    byte_string buf{0x19, 0x01};
    buf += domain_separator;
    buf += struct_hash;
    return keccak256_bytes(buf);
}

KEEPER_NAMESPACE_END
