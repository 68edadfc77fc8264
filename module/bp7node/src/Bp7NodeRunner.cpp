/**
 * @file Bp7NodeRunner.cpp
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
#include "SignalHandler.h"
#include "Environment.h"
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>
#include <boost/bind/bind.hpp>
#include "Logger.h"

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::none;

void Bp7NodeRunner::MonitorExitKeypressThreadFunction() {
    LOG_INFO(subprocess) << "Keyboard Interrupt.. exiting";
    m_runningFromSigHandler = false; //do this first
}

Bp7NodeRunner::Bp7NodeRunner() : m_totalBundlesReceived(0), m_runningFromSigHandler(false) {}
Bp7NodeRunner::~Bp7NodeRunner() {}


bool Bp7NodeRunner::Run(int argc, const char* const argv[], volatile bool & running, bool useSignalHandler) {
    //scope to ensure clean exit before return
    {
        running = true;
        m_runningFromSigHandler = true;
        SignalHandler sigHandler(boost::bind(&Bp7NodeRunner::MonitorExitKeypressThreadFunction, this));
        NodeConfig_ptr nodeConfigPtr;
        std::string sendToEidUri;
        std::string sendMessage;
        uint64_t sendLifetimeMilliseconds;

        boost::program_options::options_description desc("Allowed options");
        try {
            desc.add_options()
                ("help", "Produce help message.")
                ("config-file", boost::program_options::value<boost::filesystem::path>()->default_value(Environment::GetPathConfigFiles() / "node1.json"), "Node Configuration File.")
                ("node-id", boost::program_options::value<std::string>()->default_value(""), "Override the node id of the config file (e.g. ipn:1.0).")
                ("port", boost::program_options::value<uint16_t>(), "Override the TCPCL listen port of the config file (0 => do not listen).")
                ("send-to", boost::program_options::value<std::string>()->default_value(""), "Once started, send one bundle to this endpoint.")
                ("send-message", boost::program_options::value<std::string>()->default_value("Hello, DTN!"), "Payload of the bundle sent with --send-to.")
                ("lifetime-ms", boost::program_options::value<uint64_t>()->default_value(0), "Lifetime of the bundle sent with --send-to (0 => config file default).")
                ;

            boost::program_options::variables_map vm;
            boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc, boost::program_options::command_line_style::unix_style | boost::program_options::command_line_style::case_insensitive), vm);
            boost::program_options::notify(vm);

            if (vm.count("help")) {
                LOG_INFO(subprocess) << desc;
                return false;
            }

            const boost::filesystem::path configFileName = vm["config-file"].as<boost::filesystem::path>();
            nodeConfigPtr = NodeConfig::CreateFromJsonFilePath(configFileName);
            if (!nodeConfigPtr) {
                LOG_ERROR(subprocess) << "error loading node config file: " << configFileName;
                return false;
            }
            const std::string nodeIdOverride = vm["node-id"].as<std::string>();
            if (!nodeIdOverride.empty()) {
                nodeConfigPtr->m_nodeId = nodeIdOverride;
            }
            if (vm.count("port")) {
                nodeConfigPtr->m_listenPort = vm["port"].as<uint16_t>();
            }
            sendToEidUri = vm["send-to"].as<std::string>();
            sendMessage = vm["send-message"].as<std::string>();
            sendLifetimeMilliseconds = vm["lifetime-ms"].as<uint64_t>();
            if (sendLifetimeMilliseconds == 0) {
                sendLifetimeMilliseconds = nodeConfigPtr->m_defaultLifetimeMilliseconds;
            }
        }
        catch (boost::bad_any_cast & e) {
            LOG_ERROR(subprocess) << "invalid data error: " << e.what();
            LOG_ERROR(subprocess) << desc;
            return false;
        }
        catch (std::exception& e) {
            LOG_ERROR(subprocess) << "error: " << e.what();
            return false;
        }

        LOG_INFO(subprocess) << "starting bp7node version " << bp7::Logger::GetBp7VersionAsString()
            << " as " << nodeConfigPtr->m_nodeId << " (" << nodeConfigPtr->m_nodeConfigName << ")";
        BundleProtocolAgent bpa(*nodeConfigPtr);
        BP7_ERROR_CODE errorCode;
        if (!bpa.Start(errorCode)) {
            LOG_ERROR(subprocess) << "unable to start the bundle protocol agent: " << errorCode;
            return false;
        }

        if (!sendToEidUri.empty()) {
            const std::vector<uint8_t> payload(sendMessage.begin(), sendMessage.end());
            Bpv7BundleId bundleId;
            if (bpa.Send(sendToEidUri, payload, static_cast<int64_t>(sendLifetimeMilliseconds), bundleId, errorCode,
                BPV7_BUNDLEFLAG::DELIVERY_STATUS_REPORTS_REQUESTED))
            {
                LOG_INFO(subprocess) << "sent bundle " << bundleId << " to " << sendToEidUri << ", status " << bpa.Status(bundleId);
            }
            else {
                LOG_ERROR(subprocess) << "unable to send to " << sendToEidUri << ": " << errorCode;
            }
        }

        if (useSignalHandler) {
            sigHandler.Start(false);
        }
        LOG_INFO(subprocess) << "bp7node up and running";
        while (running && m_runningFromSigHandler) {
            Bpv7Bundle bundle;
            if (bpa.Receive(bundle, boost::posix_time::milliseconds(250))) {
                ++m_totalBundlesReceived;
                const Bpv7CanonicalBlock * payloadBlock = bundle.GetPayloadBlock();
                const std::string payloadAsString = (payloadBlock) ?
                    std::string(payloadBlock->m_blockTypeSpecificData.begin(), payloadBlock->m_blockTypeSpecificData.end()) : std::string();
                LOG_INFO(subprocess) << "received bundle " << bundle.GetBundleId() << " for "
                    << bundle.m_primaryBlock.m_destinationEid << " with " << bundle.GetPayloadLength()
                    << " byte payload: " << payloadAsString;
            }
            if (useSignalHandler) {
                sigHandler.PollOnce();
            }
        }

        LOG_INFO(subprocess) << "Bp7NodeRunner::Run: exiting cleanly..";
        bpa.Stop();
        m_finalStats = bpa.GetStats();
    }
    LOG_INFO(subprocess) << "Bp7NodeRunner::Run: exited cleanly";
    return true;

}
