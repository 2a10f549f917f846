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

#include <stakepool/core/assert.h>
#include <stakepool/core/config.hpp>

#include <cstddef>
#include <utility>
#include <vector>

STAKEPOOL_NAMESPACE_BEGIN

// Copy-on-write history of one value across nested State versions. Entries
// are ordered by strictly increasing version; the last entry is what the
// newest version that wrote the value observes. A version only gets its own
// entry once it writes.
template <class T>
class VersionStack
{
    struct Entry
    {
        unsigned version;
        T value;
    };

    std::vector<Entry> entries_{};

    Entry &top()
    {
        STAKEPOOL_ASSERT(!entries_.empty());
        return entries_.back();
    }

    Entry const &top() const
    {
        STAKEPOOL_ASSERT(!entries_.empty());
        return entries_.back();
    }

public:
    VersionStack(T value, unsigned const version = 0)
    {
        entries_.push_back({version, std::move(value)});
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    size_t size() const
    {
        return entries_.size();
    }

    unsigned version() const
    {
        return top().version;
    }

    T const &recent() const
    {
        return top().value;
    }

    // Writable value at `version`, copied from the latest entry the first
    // time `version` writes.
    T &current(unsigned const version)
    {
        if (top().version < version) {
            T copy = top().value;
            entries_.push_back({version, std::move(copy)});
        }
        return top().value;
    }

    // Hands the entry written at `version` down to `version - 1`, replacing
    // the parent's entry when the parent has one.
    void pop_accept(unsigned const version)
    {
        STAKEPOOL_ASSERT(version > 0);
        if (top().version != version) {
            return;
        }
        size_t const n = entries_.size();
        if (n > 1 && entries_[n - 2].version == version - 1) {
            entries_[n - 2].value = std::move(entries_[n - 1].value);
            entries_.pop_back();
        }
        else {
            top().version = version - 1;
        }
    }

    // Drops the entry written at `version`. Returns true when the value has
    // no entry left, i.e. it did not exist before `version`.
    bool pop_reject(unsigned const version)
    {
        STAKEPOOL_ASSERT(version > 0);
        if (top().version == version) {
            entries_.pop_back();
        }
        return entries_.empty();
    }
};

STAKEPOOL_NAMESPACE_END
