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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

KEEPER_NAMESPACE_BEGIN

enum class KeeperError
{
    Success = 0,
    AccessDenied,
    InvalidRoot,
    NotEnoughSignatures,
    InvalidSigner,
    TooEarlyUpdate,
    FutureTimestamp,
    InvalidProof,
    InvalidAmount,
    InvalidAvgRewardPerSecond,
    InvalidOracles,
    OracleExists,
    UnknownOracle,
    VaultExists,
};

KEEPER_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<keeper::KeeperError>
    : quick_status_code_from_enum_defaults<keeper::KeeperError>
{
    static constexpr auto const domain_name = "Keeper Error";
    static constexpr auto const domain_uuid =
        "8e2b9f47-1c3a-4d6e-b5f0-92a7c4e1d853";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
