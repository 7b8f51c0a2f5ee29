//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_DETAIL_CONFIG_HPP
#define HTTPEXT_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>
#include <stdint.h>

namespace httpext {

//------------------------------------------------

# if (defined(HTTPEXT_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(HTTPEXT_STATIC_LINK)
#  if defined(HTTPEXT_SOURCE)
#   define HTTPEXT_DECL        BOOST_SYMBOL_EXPORT
#  else
#   define HTTPEXT_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  HTTPEXT_DECL
#  define HTTPEXT_DECL
# endif

#if defined(__MINGW32__)
    #define HTTPEXT_SYMBOL_VISIBLE HTTPEXT_DECL
#else
    #define HTTPEXT_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef HTTPEXT_NO_SOURCE_LOCATION
# define HTTPEXT_RETURN_EC(ev) return (ev)
#else
# define HTTPEXT_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // httpext

// lift the libraries we build on into our namespace
namespace boost {
namespace core {}
namespace json {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace httpext {
namespace core = ::boost::core;
namespace json = ::boost::json;
namespace system = ::boost::system;
namespace grammar = ::boost::urls::grammar;
} // httpext

#endif
