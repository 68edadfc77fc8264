/**
 * @file Environment.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <Environment.h>

#ifndef INSTALL_DATA_DIR
#warning "INSTALL_DATA_DIR not set, using /usr/local/share"
#define INSTALL_DATA_DIR /usr/local/share
#endif
#ifndef BP7_SOURCE_ROOT_DIR
#define BP7_SOURCE_ROOT_DIR .
#endif
#define str_(s) #s
#define str(s) str_(s)

static const std::string InstallDataDir{str(INSTALL_DATA_DIR)};
static const std::string ConfiguredSourceRootDir{str(BP7_SOURCE_ROOT_DIR)};

std::string Environment::GetValue(const std::string & variableName) {
    std::string value = "";
    if (const char * const variableValue = std::getenv(variableName.c_str())) {
        value = variableValue;
    }
    return value;
}

boost::filesystem::path Environment::GetPathBp7SourceRoot() {
    const std::string bp7SourceRoot = Environment::GetValue("BP7_SOURCE_ROOT");
    if (bp7SourceRoot.empty()) {
        return boost::filesystem::path(ConfiguredSourceRootDir);
    }
    return boost::filesystem::path(bp7SourceRoot);
}

boost::filesystem::path Environment::GetPathConfigFiles() {
    if (const char * const s = std::getenv("BP7_SOURCE_ROOT")) {
        return boost::filesystem::path(s) / "config_files";
    } else {
        return boost::filesystem::path(InstallDataDir) / "bp7" / "config_files";
    }
}
