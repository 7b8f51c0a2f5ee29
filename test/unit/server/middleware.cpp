//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <httpext/server/middleware.hpp>

#include <httpext/content_range.hpp>
#include <httpext/http_error.hpp>
#include <httpext/server/cors.hpp>
#include <boost/json/serialize.hpp>

#include "test_suite.hpp"

#include <string>
#include <vector>

namespace httpext {

struct middleware_test
{
    void
    test_order()
    {
        middleware_set ms;
        BOOST_TEST(ms.empty());

        std::vector<int> checks;
        ms.use_handler([&](route_params&)
        {
            checks.push_back(0);
        });
        ms.use_handler([&](route_params&)
        {
            checks.push_back(1);
        });
        ms.use([&](handler next) -> handler
        {
            return [&checks, next](route_params& rp)
            {
                checks.push_back(2);
                next(rp);
            };
        });
        BOOST_TEST(! ms.empty());

        handler h = ms.apply([&](route_params&)
        {
            checks.push_back(3);
        });
        route_params rp;
        h(rp);
        BOOST_TEST((checks == std::vector<int>{ 0, 1, 2, 3 }));

        // apply can be called again
        checks.clear();
        ms.apply([&](route_params&)
        {
            checks.push_back(4);
        })(rp);
        BOOST_TEST((checks == std::vector<int>{ 0, 1, 2, 4 }));
    }

    void
    test_empty()
    {
        middleware_set ms;
        int n = 0;
        handler h = ms.apply([&](route_params&)
        {
            ++n;
        });
        route_params rp;
        h(rp);
        BOOST_TEST_EQ(n, 1);
    }

    void
    test_short_circuit()
    {
        middleware_set ms;
        ms.use([](handler next) -> handler
        {
            return [next](route_params& rp)
            {
                if(rp.req.method != "GET")
                {
                    rp.res.status = 405;
                    return;
                }
                next(rp);
            };
        });
        bool called = false;
        handler h = ms.apply([&](route_params&)
        {
            called = true;
        });

        route_params rp;
        rp.req.method = "POST";
        h(rp);
        BOOST_TEST(! called);
        BOOST_TEST_EQ(rp.res.status, 405u);
    }

    // A handler serving a collection of 200
    // items, honoring the Range field.
    static
    void
    serve(route_params& rp)
    {
        auto const size = 200;
        auto s = rp.req.headers.value_or(field::range, "");
        if(s.empty())
            return;

        system::error_code ec;
        auto rv = parse_range(s);
        if(rv.has_value())
        {
            auto sv = rv->set_total(size);
            if(sv.has_value())
            {
                rp.res.status = 206;
                rp.res.headers.set(
                    field::content_range, rv->format().value());
                return;
            }
            ec = sv.error();
        }
        else
        {
            ec = rv.error();
        }
        http_error e = to_http_error(ec);
        rp.res.status = e.status();
        rp.res.body = json::serialize(e.to_json());
    }

    void
    test_serve_range()
    {
        cors_policy policy;
        policy.allow_all_origins();
        policy.expose_headers({ "Content-Range" });

        middleware_set ms;
        ms.use_handler(policy);
        handler h = ms.apply(&serve);

        {
            route_params rp;
            rp.req.method = "GET";
            rp.req.headers.set(field::range, "items=-50");
            h(rp);
            BOOST_TEST_EQ(rp.res.status, 206u);
            BOOST_TEST_EQ(rp.res.headers.value_or(
                field::content_range, ""), "items 150-199/200");
            BOOST_TEST_EQ(rp.res.headers.value_or(
                field::access_control_allow_origin, ""), "*");
            BOOST_TEST_EQ(rp.res.headers.value_or(
                field::access_control_expose_headers, ""), "Content-Range");
        }
        {
            route_params rp;
            rp.req.headers.set(field::range, "items=300-");
            h(rp);
            BOOST_TEST_EQ(rp.res.status, 416u);
            BOOST_TEST(! rp.res.headers.exists(field::content_range));
        }
        {
            route_params rp;
            rp.req.headers.set(field::range, "items=0-10,20-30");
            h(rp);
            BOOST_TEST_EQ(rp.res.status, 400u);
            BOOST_TEST_EQ(rp.res.body,
                R"({"id":"bad_range","message":"first index in range must be <= last index"})");
        }
    }

    void
    run()
    {
        test_order();
        test_empty();
        test_short_circuit();
        test_serve_range();
    }
};

TEST_SUITE(
    middleware_test,
    "httpext.server.middleware");

} // httpext
