//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_FIELDS_HPP
#define HTTPEXT_FIELDS_HPP

#include <httpext/detail/config.hpp>
#include <httpext/field.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace httpext {

/** A container of HTTP fields.

    Fields are kept in insertion order. Names
    are compared without regard to case.

    @par Thread Safety
    Distinct objects: Safe.
    Shared objects: Unsafe.
*/
class fields
{
public:
    /// A single field.
    struct value_type
    {
        std::string name;
        std::string value;
    };

    using iterator =
        std::vector<value_type>::const_iterator;

    fields() = default;

    /// Return the number of fields.
    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    /// Return true if there are no fields.
    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    iterator
    end() const noexcept
    {
        return v_.end();
    }

    /** Return the first field with a matching name.

        @return An iterator to the field,
        or `end()` if none exists.
    */
    HTTPEXT_DECL
    iterator
    find(core::string_view name) const noexcept;

    iterator
    find(field id) const noexcept
    {
        return find(to_string(id));
    }

    /// Return true if a field with the name exists.
    bool
    exists(core::string_view name) const noexcept
    {
        return find(name) != end();
    }

    bool
    exists(field id) const noexcept
    {
        return exists(to_string(id));
    }

    /// Return the number of fields with the name.
    HTTPEXT_DECL
    std::size_t
    count(core::string_view name) const noexcept;

    std::size_t
    count(field id) const noexcept
    {
        return count(to_string(id));
    }

    /** Return the value of the first matching field.

        @return The value, or `s` if no field
        with the name exists.
    */
    HTTPEXT_DECL
    core::string_view
    value_or(
        core::string_view name,
        core::string_view s) const noexcept;

    core::string_view
    value_or(
        field id,
        core::string_view s) const noexcept
    {
        return value_or(to_string(id), s);
    }

    /** Set a field value.

        The first field with a matching name has
        its value replaced and any others with the
        same name are removed. If there is none,
        the field is appended.
    */
    HTTPEXT_DECL
    void
    set(
        core::string_view name,
        core::string_view value);

    void
    set(
        field id,
        core::string_view value)
    {
        set(to_string(id), value);
    }

    /// Append a field, keeping existing fields of the same name.
    HTTPEXT_DECL
    void
    append(
        core::string_view name,
        core::string_view value);

    void
    append(
        field id,
        core::string_view value)
    {
        append(to_string(id), value);
    }

    /** Remove all fields with the name.

        @return The number of fields removed.
    */
    HTTPEXT_DECL
    std::size_t
    erase(core::string_view name) noexcept;

    std::size_t
    erase(field id) noexcept
    {
        return erase(to_string(id));
    }

    /// Remove all fields.
    void
    clear() noexcept
    {
        v_.clear();
    }

private:
    std::vector<value_type> v_;
};

} // httpext

#endif
