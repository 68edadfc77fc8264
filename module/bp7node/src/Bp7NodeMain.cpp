/**
 * @file Bp7NodeMain.cpp
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

#include "Bp7NodeRunner.h"
#include "Logger.h"

int main(int argc, const char* argv[]) {

    bp7::Logger::initializeWithProcess(bp7::Logger::Process::bp7node);
    Bp7NodeRunner runner;
    volatile bool running;
    if (!runner.Run(argc, argv, running, true)) {
        return 1;
    }
    LOG_INFO(bp7::Logger::SubProcess::none) << "bundles received main: " << runner.m_totalBundlesReceived;
    return 0;

}
