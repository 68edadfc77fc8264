/**
 * @file Bp7ErrorCodes.cpp
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

#include "Bp7ErrorCodes.h"

static const char * const errorCodeStrings[static_cast<unsigned int>(BP7_ERROR_CODE::INCOMPLETE) + 1] = {
    "NONE",
    "MALFORMED_ENCODING",
    "TRUNCATED_INPUT",
    "CRC_MISMATCH",
    "MALFORMED_BLOCK",
    "CONTACT_HEADER_MISMATCH",
    "SESSION_NOT_ESTABLISHED",
    "KEEPALIVE_TIMEOUT",
    "CONNECTION_LOST",
    "INVALID_ARGUMENT",
    "INVALID_EID",
    "INCONSISTENT_FRAGMENTS",
    "INCOMPLETE"
};

const char * Bp7ErrorCodeToString(BP7_ERROR_CODE errorCode) {
    const unsigned int index = static_cast<unsigned int>(errorCode);
    if (index > static_cast<unsigned int>(BP7_ERROR_CODE::INCOMPLETE)) {
        return "UNKNOWN_ERROR_CODE";
    }
    return errorCodeStrings[index];
}

std::ostream& operator<<(std::ostream& os, const BP7_ERROR_CODE errorCode) {
    os << Bp7ErrorCodeToString(errorCode);
    return os;
}
