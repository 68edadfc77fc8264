/**
 * @file Bp7NodeRunner.h
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
 * This Bp7NodeRunner class is used for launching a BundleProtocolAgent into its own process.
 * The Bp7NodeRunner provides a blocking Run function which loads the node configuration,
 * applies the command line overrides, starts the agent, optionally sends one bundle,
 * and logs every bundle delivered to this node.
 * Bp7NodeRunner also provides a signal handler listener to capture Ctrl+C (SIGINT) events
 * for clean termination.
 */

#ifndef _BP7_NODE_RUNNER_H
#define _BP7_NODE_RUNNER_H 1

#include <stdint.h>
#include "BundleProtocolAgent.h"


class Bp7NodeRunner {
public:
    Bp7NodeRunner();
    ~Bp7NodeRunner();
    bool Run(int argc, const char* const argv[], volatile bool & running, bool useSignalHandler);

    uint64_t m_totalBundlesReceived;
    BundleProtocolAgentStats m_finalStats;

private:
    void MonitorExitKeypressThreadFunction();

    volatile bool m_runningFromSigHandler;
};


#endif //_BP7_NODE_RUNNER_H
