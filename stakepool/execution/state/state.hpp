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

#include <stakepool/core/bytes.hpp>
#include <stakepool/core/config.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/log.hpp>
#include <stakepool/execution/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <vector>

STAKEPOOL_NAMESPACE_BEGIN

// In-memory contract storage and event log with nested versions. Every write
// goes to the newest open version; `pop_reject()` drops everything written
// since the matching `push()`, `pop_accept()` folds it into the parent.
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    using Storage = Map<bytes32_t, VersionStack<bytes32_t>>;

    Map<Address, Storage> storage_{};

    VersionStack<std::vector<Log>> logs_{{}};

    unsigned version_{0};

public:
    State() = default;
    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    unsigned version() const noexcept;

    void push();

    void pop_accept();

    void pop_reject();

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    // number of non-zero slots held by an account at the newest version
    size_t storage_size(Address const &) const;

    std::vector<Log> const &logs() const;

    void store_log(Log const &);
};

STAKEPOOL_NAMESPACE_END
