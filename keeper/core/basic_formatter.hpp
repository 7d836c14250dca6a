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

#include <quill/Fmt.h>
#include <quill/bundled/fmt/format.h>

#include <cstdint>
#include <span>

namespace fmt = fmtquill::v10;

KEEPER_NAMESPACE_BEGIN

struct BasicFormatter
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }
};

// 0x-prefixed lowercase hex, used for addresses, words and log data
struct HexFormatter : public BasicFormatter
{
    template <typename FormatContext>
    static auto
    format_hex(std::span<uint8_t const> const bytes, FormatContext &ctx)
    {
        return fmt::format_to(
            ctx.out(), "0x{:02x}", fmt::join(std::as_bytes(bytes), ""));
    }
};

KEEPER_NAMESPACE_END
