//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_HPP
#define HTTPEXT_HPP

#include <httpext/content_range.hpp>
#include <httpext/error.hpp>
#include <httpext/field.hpp>
#include <httpext/fields.hpp>
#include <httpext/http_error.hpp>

#include <httpext/rfc/range_rule.hpp>

#include <httpext/server/cors.hpp>
#include <httpext/server/middleware.hpp>
#include <httpext/server/route_params.hpp>

#endif
