/**
 * @file Bp7ErrorCodes.h
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
 * Error codes shared by the codec, bundle, convergence layer and agent libraries.
 * Functions that can fail return a bool and report the reason through a
 * BP7_ERROR_CODE out parameter.
 */

#ifndef BP7_ERROR_CODES_H
#define BP7_ERROR_CODES_H 1

#include <cstdint>
#include <ostream>
#include "bp7_util_export.h"

enum class BP7_ERROR_CODE : uint8_t {
    NONE = 0,
    //encoding
    MALFORMED_ENCODING,
    TRUNCATED_INPUT,
    //integrity
    CRC_MISMATCH,
    MALFORMED_BLOCK,
    //protocol
    CONTACT_HEADER_MISMATCH,
    SESSION_NOT_ESTABLISHED,
    KEEPALIVE_TIMEOUT,
    CONNECTION_LOST,
    //application
    INVALID_ARGUMENT,
    INVALID_EID,
    //consistency
    INCONSISTENT_FRAGMENTS,
    INCOMPLETE
};

BP7_UTIL_EXPORT const char * Bp7ErrorCodeToString(BP7_ERROR_CODE errorCode);
BP7_UTIL_EXPORT std::ostream& operator<<(std::ostream& os, const BP7_ERROR_CODE errorCode);

#endif //BP7_ERROR_CODES_H
