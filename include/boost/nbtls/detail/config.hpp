//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_DETAIL_CONFIG_HPP
#define BOOST_NBTLS_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

#if defined(BOOST_NBTLS_DOCS)
# define BOOST_NBTLS_DECL
#else
# if (defined(BOOST_NBTLS_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_NBTLS_STATIC_LINK)
#  if defined(BOOST_NBTLS_SOURCE)
#   define BOOST_NBTLS_DECL BOOST_SYMBOL_EXPORT
#   define BOOST_NBTLS_BUILD_DLL
#  else
#   define BOOST_NBTLS_DECL BOOST_SYMBOL_IMPORT
#  endif
# endif

# ifndef BOOST_NBTLS_DECL
#  define BOOST_NBTLS_DECL
# endif
#endif

#endif
