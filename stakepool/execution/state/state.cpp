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

#include <stakepool/core/assert.h>
#include <stakepool/core/bytes.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/log.hpp>
#include <stakepool/execution/state/state.hpp>

#include <cstddef>
#include <utility>
#include <vector>

STAKEPOOL_NAMESPACE_BEGIN

unsigned State::version() const noexcept
{
    return version_;
}

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    STAKEPOOL_ASSERT(version_);

    for (auto &it : storage_) {
        for (auto &slot : it.second) {
            slot.second.pop_accept(version_);
        }
    }

    logs_.pop_accept(version_);

    --version_;
}

void State::pop_reject()
{
    STAKEPOOL_ASSERT(version_);

    std::vector<Address> account_removals;

    for (auto &it : storage_) {
        auto &storage = it.second;
        std::vector<bytes32_t> removals;
        for (auto &slot : storage) {
            if (slot.second.pop_reject(version_)) {
                removals.push_back(slot.first);
            }
        }
        while (removals.size()) {
            storage.erase(removals.back());
            removals.pop_back();
        }
        if (storage.empty()) {
            account_removals.push_back(it.first);
        }
    }

    logs_.pop_reject(version_);

    while (account_removals.size()) {
        storage_.erase(account_removals.back());
        account_removals.pop_back();
    }

    --version_;
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const account = storage_.find(address);
    if (account == storage_.end()) {
        return {};
    }
    auto const slot = account->second.find(key);
    if (slot == account->second.end()) {
        return {};
    }
    return slot->second.recent();
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &storage = storage_[address];
    auto it = storage.find(key);
    if (it == storage.end()) {
        if (version_ == 0) {
            storage.try_emplace(key, value, 0u);
            return;
        }
        // slot never written: the zero word is the value every open version
        // below this one observes
        it = storage.try_emplace(key, bytes32_t{}, 0u).first;
    }
    it->second.current(version_) = value;
}

size_t State::storage_size(Address const &address) const
{
    auto const account = storage_.find(address);
    if (account == storage_.end()) {
        return 0;
    }
    size_t n = 0;
    for (auto const &slot : account->second) {
        n += slot.second.recent() != bytes32_t{};
    }
    return n;
}

std::vector<Log> const &State::logs() const
{
    return logs_.recent();
}

void State::store_log(Log const &log)
{
    auto &logs = logs_.current(version_);
    logs.push_back(log);
}

STAKEPOOL_NAMESPACE_END
