//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/fields.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <algorithm>
#include <iterator>

namespace httpext {

auto
fields::
find(core::string_view name) const noexcept ->
    iterator
{
    return std::find_if(
        v_.begin(), v_.end(),
        [name](value_type const& f)
        {
            return grammar::ci_is_equal(f.name, name);
        });
}

std::size_t
fields::
count(core::string_view name) const noexcept
{
    return static_cast<std::size_t>(std::count_if(
        v_.begin(), v_.end(),
        [name](value_type const& f)
        {
            return grammar::ci_is_equal(f.name, name);
        }));
}

core::string_view
fields::
value_or(
    core::string_view name,
    core::string_view s) const noexcept
{
    auto it = find(name);
    if(it == v_.end())
        return s;
    return it->value;
}

void
fields::
set(
    core::string_view name,
    core::string_view value)
{
    auto it = std::find_if(
        v_.begin(), v_.end(),
        [name](value_type const& f)
        {
            return grammar::ci_is_equal(f.name, name);
        });
    if(it == v_.end())
    {
        v_.push_back({ name, value });
        return;
    }
    it->value = value;
    // remove duplicates after the first
    v_.erase(std::remove_if(
        std::next(it), v_.end(),
        [name](value_type const& f)
        {
            return grammar::ci_is_equal(f.name, name);
        }), v_.end());
}

void
fields::
append(
    core::string_view name,
    core::string_view value)
{
    v_.push_back({ name, value });
}

std::size_t
fields::
erase(core::string_view name) noexcept
{
    auto const n = v_.size();
    v_.erase(std::remove_if(
        v_.begin(), v_.end(),
        [name](value_type const& f)
        {
            return grammar::ci_is_equal(f.name, name);
        }), v_.end());
    return n - v_.size();
}

} // httpext
