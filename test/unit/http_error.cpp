//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <httpext/http_error.hpp>

#include <httpext/content_range.hpp>
#include <httpext/error.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>

#include "test_suite.hpp"

namespace httpext {

struct http_error_test
{
    void
    test_construct()
    {
        core::string_view const msg =
            "These aren't the errors you're looking for.";
        http_error e(404, "err_not_found", msg);

        BOOST_TEST_EQ(e.status(), 404u);
        BOOST_TEST_EQ(e.id(), "err_not_found");
        BOOST_TEST_EQ(e.message(), msg);
        BOOST_TEST(! e.has_detail());
        BOOST_TEST(e.detail().is_null());
    }

    void
    test_detail()
    {
        http_error const e(
            404, "err_missing_sanity", "Missing sanity.");
        auto e2 = e.with_detail(
            "Likely time of loss: when you started developing software.");

        BOOST_TEST(e.equal(e2));
        BOOST_TEST(e == e2);
        BOOST_TEST(e2.has_detail());
        BOOST_TEST(e2.detail().is_string());
        BOOST_TEST_EQ(e2.detail().get_string(),
            "Likely time of loss: when you started developing software.");

        // the original is unchanged
        BOOST_TEST(! e.has_detail());

        BOOST_TEST(! (e == http_error(
            404, "err_other", "Missing sanity.")));
        BOOST_TEST(! (e == http_error(
            500, "err_missing_sanity", "Missing sanity.")));
        BOOST_TEST(! (e == http_error(
            404, "err_missing_sanity", "Other.")));
    }

    void
    test_to_string()
    {
        http_error const e(
            500, "err_missing_server", "Missing server.");
        BOOST_TEST_EQ(e.to_string(),
            "Missing server. <HTTP 500:err_missing_server>");
        BOOST_TEST_EQ(e.with_detail(42).to_string(),
            "Missing server. (42) <HTTP 500:err_missing_server>");
        BOOST_TEST_EQ(e.with_detail(
            json::parse(R"({"host":"db1"})")).to_string(),
            R"(Missing server. ({"host":"db1"}) <HTTP 500:err_missing_server>)");
    }

    void
    test_json()
    {
        http_error const e(
            500, "err_missing_server", "Missing server.");

        json::value jv = e.to_json();
        BOOST_TEST(jv.is_object());
        BOOST_TEST_EQ(jv.as_object().size(), 2u);
        BOOST_TEST_EQ(json::serialize(jv),
            R"({"id":"err_missing_server","message":"Missing server."})");

        jv = json::value_from(e.with_detail(
            json::parse(R"(["a","b"])")));
        BOOST_TEST_EQ(json::serialize(jv),
            R"({"id":"err_missing_server","message":"Missing server.","detail":["a","b"]})");
    }

    void
    test_range_errors()
    {
        {
            auto rv = parse_range("bytes=500-");
            BOOST_TEST(rv.has_value());
            auto cv = rv->constrain(100);
            BOOST_TEST(cv.has_error());
            http_error e = to_http_error(cv.error());
            BOOST_TEST_EQ(e.status(), 416u);
            BOOST_TEST_EQ(e.id(), "range_not_satisfiable");
            BOOST_TEST_EQ(e.message(), cv.error().message());
        }
        {
            auto rv = parse_range("bytes=9-1");
            BOOST_TEST(rv.has_error());
            http_error e = to_http_error(rv.error());
            BOOST_TEST_EQ(e.status(), 400u);
            BOOST_TEST_EQ(e.id(), "bad_range");
            BOOST_TEST_EQ(e.message(),
                "first index in range must be <= last index");
        }
        {
            http_error e = to_http_error(
                error::range_unsatisfiable_zero_length);
            BOOST_TEST_EQ(e.status(), 416u);
        }
    }

    void
    run()
    {
        test_construct();
        test_detail();
        test_to_string();
        test_json();
        test_range_errors();
    }
};

TEST_SUITE(
    http_error_test,
    "httpext.http_error");

} // httpext
