/**
 * @file SignalHandler.h
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
 * This SignalHandler class captures CTRL-C style events (SIGINT, SIGTERM and,
 * where available, SIGQUIT) and calls a user supplied function when one arrives.
 * The bp7node process uses it to begin an orderly shutdown of its sessions.
 */

#ifndef SIGNAL_HANDLER_H
#define SIGNAL_HANDLER_H 1
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include <memory>
#include "bp7_util_export.h"

class SignalHandler {
private:
    SignalHandler();
public:
    /**
     * Register the signals to listen for.
     * @param handleSignalFunction Invoked once from the signal thread when a signal arrives.
     */
    BP7_UTIL_EXPORT SignalHandler(boost::function<void() > handleSignalFunction);

    BP7_UTIL_EXPORT ~SignalHandler();

    /** Start listening.
     *
     * @param useDedicatedThread Run the listener on its own thread, otherwise the caller must PollOnce().
     */
    BP7_UTIL_EXPORT void Start(bool useDedicatedThread = true);

    /** Poll for a pending signal (only when not using a dedicated thread).
     *
     * @return True if a signal was handled since the last call.
     */
    BP7_UTIL_EXPORT bool PollOnce();

private:
    BP7_UTIL_EXPORT void HandleSignal(const boost::system::error_code& error, int signalNumber);

private:
    boost::asio::io_service m_ioService;
    boost::asio::signal_set m_signals;
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    boost::function<void() > m_handleSignalFunction;
};
#endif //SIGNAL_HANDLER_H
