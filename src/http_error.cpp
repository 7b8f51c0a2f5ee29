//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/http_error.hpp>
#include <httpext/error.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <utility>

namespace httpext {

http_error::
http_error(
    unsigned status,
    core::string_view id,
    core::string_view message)
    : status_(status)
    , id_(id)
    , message_(message)
{
}

http_error
http_error::
with_detail(json::value detail) const
{
    http_error e(*this);
    e.detail_ = std::move(detail);
    return e;
}

std::string
http_error::
to_string() const
{
    std::string s(message_);
    if(has_detail())
    {
        s.append(" (");
        s.append(json::serialize(detail_));
        s.push_back(')');
    }
    s.append(" <HTTP ");
    s.append(std::to_string(status_));
    s.push_back(':');
    s.append(id_);
    s.push_back('>');
    return s;
}

bool
http_error::
equal(http_error const& other) const noexcept
{
    return
        id_ == other.id_ &&
        status_ == other.status_ &&
        message_ == other.message_;
}

json::value
http_error::
to_json() const
{
    json::object obj;
    obj.emplace("id", id_);
    obj.emplace("message", message_);
    if(has_detail())
        obj.emplace("detail", detail_);
    return obj;
}

//------------------------------------------------

http_error
to_http_error(system::error_code const& ec)
{
    if(ec == condition::range_not_satisfiable)
        return http_error(
            416, "range_not_satisfiable", ec.message());
    return http_error(
        400, "bad_range", ec.message());
}

} // httpext
