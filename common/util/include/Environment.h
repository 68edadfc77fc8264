/**
 * @file Environment.h
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
 * This Environment static class is a utility used to get system environmental variables,
 * including BP7_SOURCE_ROOT.
 */

#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H 1

#include <cstdlib>
#include <string>
#include <boost/filesystem.hpp>
#include "bp7_util_export.h"

class BP7_UTIL_EXPORT Environment {
protected:
    Environment() = delete;
public:
    static std::string GetValue(const std::string & variableName);
    /// BP7_SOURCE_ROOT if set, otherwise the source directory the library was configured from.
    static boost::filesystem::path GetPathBp7SourceRoot();
    static boost::filesystem::path GetPathConfigFiles();
};

#endif /* ENVIRONMENT_H */
