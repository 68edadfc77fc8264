/**
 * @file SignalHandler.cpp
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

#include "SignalHandler.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <signal.h>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::none;

SignalHandler::SignalHandler(boost::function<void () > handleSignalFunction) :
    m_ioService(),
    m_signals(m_ioService),
    m_handleSignalFunction(handleSignalFunction)
{
    m_signals.add(SIGINT);
    m_signals.add(SIGTERM);
#if defined(SIGQUIT)
    m_signals.add(SIGQUIT);
#endif // defined(SIGQUIT)
}

SignalHandler::~SignalHandler() {
    m_ioService.stop();
    if (m_ioServiceThreadPtr) {
        m_ioServiceThreadPtr->join();
        m_ioServiceThreadPtr.reset();
    }
}

void SignalHandler::Start(bool useDedicatedThread) {
    m_signals.async_wait(boost::bind(&SignalHandler::HandleSignal, this,
        boost::asio::placeholders::error, boost::asio::placeholders::signal_number));
    if (useDedicatedThread) {
        m_ioServiceThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService));
    }
}

bool SignalHandler::PollOnce() {
    return (m_ioService.poll_one() > 0);
}

void SignalHandler::HandleSignal(const boost::system::error_code& error, int signalNumber) {
    if (error) {
        return; //operation aborted during destruction
    }
    LOG_INFO(subprocess) << "received signal " << signalNumber;
    if (m_handleSignalFunction) {
        m_handleSignalFunction();
    }
}
