/**
 * @file Bp7Version.hpp
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
 * Defines the current BP7 node version.
 * It is based off of boost/version.hpp
 */

#ifndef BP7_VERSION_HPP
#define BP7_VERSION_HPP


 //  BP7_VERSION % 100 is the patch level
 //  BP7_VERSION / 100 % 1000 is the minor version
 //  BP7_VERSION / 100000 is the major version
 //  00.000.00 where MAJOR_MINOR_PATCH

#define BP7_VERSION 100000

#define BP7_VERSION_PATCH (BP7_VERSION % 100)
#define BP7_VERSION_MINOR ((BP7_VERSION / 100) % 1000)
#define BP7_VERSION_MAJOR (BP7_VERSION / 100000)

#endif
