//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <httpext/fields.hpp>

#include "test_suite.hpp"

namespace httpext {

struct fields_test
{
    void
    test_set()
    {
        fields f;
        BOOST_TEST(f.empty());

        f.set(field::vary, "Origin");
        BOOST_TEST_EQ(f.size(), 1u);
        BOOST_TEST_EQ(f.value_or(field::vary, ""), "Origin");

        // names are case-insensitive
        f.set("VARY", "Accept");
        BOOST_TEST_EQ(f.size(), 1u);
        BOOST_TEST_EQ(f.value_or("vary", ""), "Accept");
        BOOST_TEST_EQ(f.begin()->name, "Vary");

        // set collapses duplicates
        f.append(field::vary, "Origin");
        BOOST_TEST_EQ(f.count(field::vary), 2u);
        f.set(field::vary, "Range");
        BOOST_TEST_EQ(f.count(field::vary), 1u);
        BOOST_TEST_EQ(f.value_or(field::vary, ""), "Range");
    }

    void
    test_find()
    {
        fields f;
        f.append("X-One", "1");
        f.append(field::range, "bytes=0-1");
        f.append("x-one", "2");

        BOOST_TEST(f.exists("x-ONE"));
        BOOST_TEST(f.exists(field::range));
        BOOST_TEST(! f.exists(field::origin));
        BOOST_TEST(f.find(field::origin) == f.end());
        BOOST_TEST_EQ(f.find("X-One")->value, "1");
        BOOST_TEST_EQ(f.count("X-One"), 2u);
        BOOST_TEST_EQ(f.value_or(field::origin, "none"), "none");

        BOOST_TEST_EQ(f.erase("X-ONE"), 2u);
        BOOST_TEST_EQ(f.erase(field::origin), 0u);
        BOOST_TEST_EQ(f.size(), 1u);

        f.clear();
        BOOST_TEST(f.empty());
    }

    void
    run()
    {
        test_set();
        test_find();
    }
};

TEST_SUITE(
    fields_test,
    "httpext.fields");

} // httpext
