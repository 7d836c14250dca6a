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

#include <ankerl/unordered_dense.h>

KEEPER_NAMESPACE_BEGIN

template <
    class Key, class T, class Hash = ankerl::unordered_dense::hash<Key>,
    class KeyEqual = std::equal_to<Key>>
using Map = ankerl::unordered_dense::segmented_map<Key, T, Hash, KeyEqual>;

template <
    class Key, class Hash = ankerl::unordered_dense::hash<Key>,
    class KeyEqual = std::equal_to<Key>>
using Set = ankerl::unordered_dense::segmented_set<Key, Hash, KeyEqual>;

KEEPER_NAMESPACE_END
