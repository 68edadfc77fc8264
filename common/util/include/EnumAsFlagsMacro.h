/**
 * @file EnumAsFlagsMacro.h
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * Gives strongly-typed enums used as bit fields (bundle processing flags,
 * block processing flags, segment flags) the bitwise operators,
 * a flag test helper and the ostream operator.
 */

#ifndef _BP7_ENUM_AS_FLAGS_MACRO_H
#define _BP7_ENUM_AS_FLAGS_MACRO_H 1
#include <cstdint>
#include <type_traits>
#include <boost/config.hpp>
#include <ostream>

#define _ENUM_UNDERLYING(ENUMTYPE, value) (static_cast<std::underlying_type<ENUMTYPE>::type>(value))

//static_assert(true, "") requires a semicolon after the macro (-Wpedantic)
#define MAKE_ENUM_SUPPORT_FLAG_OPERATORS(ENUMTYPE) \
BOOST_FORCEINLINE ENUMTYPE operator | (ENUMTYPE a, ENUMTYPE b) { return static_cast<ENUMTYPE>(_ENUM_UNDERLYING(ENUMTYPE, a) | _ENUM_UNDERLYING(ENUMTYPE, b)); } \
BOOST_FORCEINLINE ENUMTYPE operator & (ENUMTYPE a, ENUMTYPE b) { return static_cast<ENUMTYPE>(_ENUM_UNDERLYING(ENUMTYPE, a) & _ENUM_UNDERLYING(ENUMTYPE, b)); } \
BOOST_FORCEINLINE ENUMTYPE operator ^ (ENUMTYPE a, ENUMTYPE b) { return static_cast<ENUMTYPE>(_ENUM_UNDERLYING(ENUMTYPE, a) ^ _ENUM_UNDERLYING(ENUMTYPE, b)); } \
BOOST_FORCEINLINE ENUMTYPE operator ~ (ENUMTYPE a) { return static_cast<ENUMTYPE>(~_ENUM_UNDERLYING(ENUMTYPE, a)); } \
BOOST_FORCEINLINE ENUMTYPE & operator |= (ENUMTYPE & a, ENUMTYPE b) { a = a | b; return a; } \
BOOST_FORCEINLINE ENUMTYPE & operator &= (ENUMTYPE & a, ENUMTYPE b) { a = a & b; return a; } \
BOOST_FORCEINLINE ENUMTYPE & operator ^= (ENUMTYPE & a, ENUMTYPE b) { a = a ^ b; return a; } \
BOOST_FORCEINLINE bool HasFlag(ENUMTYPE value, ENUMTYPE flag) { return (_ENUM_UNDERLYING(ENUMTYPE, value) & _ENUM_UNDERLYING(ENUMTYPE, flag)) == _ENUM_UNDERLYING(ENUMTYPE, flag); } \
static_assert(true, "")

#define MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(ENUMTYPE) \
BOOST_FORCEINLINE std::ostream& operator<<(std::ostream& os, const ENUMTYPE & a) { os << std::hex << "0x" << static_cast<uint64_t>(_ENUM_UNDERLYING(ENUMTYPE, a)) << std::dec; return os; } \
static_assert(true, "")

#endif //_BP7_ENUM_AS_FLAGS_MACRO_H
