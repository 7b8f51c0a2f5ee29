//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/server/cors.hpp>
#include <algorithm>

namespace httpext {

namespace {

void
append_all(
    std::vector<std::string>& v,
    std::initializer_list<core::string_view> init)
{
    for(auto s : init)
        v.emplace_back(s);
}

std::string
join(std::vector<std::string> const& v)
{
    std::string s;
    for(auto const& e : v)
    {
        if(! s.empty())
            s.append(", ");
        s.append(e);
    }
    return s;
}

} // (anon)

void
cors_policy::
allow_origins(
    std::initializer_list<core::string_view> init)
{
    allow_all_origins_ = false;
    append_all(origins_, init);
}

void
cors_policy::
allow_all_origins() noexcept
{
    allow_all_origins_ = true;
    origins_.clear();
}

void
cors_policy::
allow_methods(
    std::initializer_list<core::string_view> init)
{
    allow_all_methods_ = false;
    append_all(methods_, init);
}

void
cors_policy::
allow_all_methods() noexcept
{
    allow_all_methods_ = true;
    methods_.clear();
}

void
cors_policy::
allow_headers(
    std::initializer_list<core::string_view> init)
{
    allow_all_headers_ = false;
    append_all(allow_headers_, init);
}

void
cors_policy::
allow_all_headers() noexcept
{
    allow_all_headers_ = true;
    allow_headers_.clear();
}

void
cors_policy::
expose_headers(
    std::initializer_list<core::string_view> init)
{
    append_all(expose_headers_, init);
}

bool
cors_policy::
origin_allowed(
    core::string_view origin) const noexcept
{
    if(allow_all_origins_)
        return true;
    return std::any_of(
        origins_.begin(),
        origins_.end(),
        [origin](std::string const& s)
        {
            return core::string_view(s) == origin;
        });
}

void
cors_policy::
write_headers(
    request const& req,
    response& res) const
{
    // Access-Control-Allow-Origin
    if(allow_all_origins_)
    {
        res.headers.set(
            field::access_control_allow_origin, "*");
    }
    else
    {
        if(origins_.size() > 1)
            res.headers.set(field::vary,
                to_string(field::origin));
        auto origin = req.headers.value_or(
            field::origin, "");
        if(origin_allowed(origin))
            res.headers.set(
                field::access_control_allow_origin,
                origin);
        else
            res.headers.set(
                field::access_control_allow_origin,
                "null");
    }

    // Access-Control-Expose-Headers
    if(! expose_headers_.empty())
        res.headers.set(
            field::access_control_expose_headers,
            join(expose_headers_));

    // Access-Control-Max-Age
    res.headers.set(
        field::access_control_max_age,
        std::to_string(max_age.count()));

    // Access-Control-Allow-Credentials
    res.headers.set(
        field::access_control_allow_credentials,
        allow_credentials ? "true" : "false");

    // Access-Control-Allow-Methods
    if(allow_all_methods_)
        res.headers.set(
            field::access_control_allow_methods, "*");
    else if(! methods_.empty())
        res.headers.set(
            field::access_control_allow_methods,
            join(methods_));

    // Access-Control-Allow-Headers
    if(allow_all_headers_)
        res.headers.set(
            field::access_control_allow_headers, "*");
    else if(! allow_headers_.empty())
        res.headers.set(
            field::access_control_allow_headers,
            join(allow_headers_));
}

} // httpext
