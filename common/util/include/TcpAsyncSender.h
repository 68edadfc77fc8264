/**
 * @file TcpAsyncSender.h
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
 * The TcpAsyncSender class, in conjunction with its data (struct TcpAsyncSenderElement),
 * provides an ordered asynchronous send queue for a TCP socket.  It ensures that
 * every boost::asio::async_write fully completes before the next one starts,
 * that no other writes occur during the write, and that the data remains valid
 * for the duration of the write.  According to:
 * https://www.boost.org/doc/libs/1_75_0/doc/html/boost_asio/reference/async_write/overload1.html
 *
 * The program must ensure that the stream performs no other write
 * operations (such as async_write, the stream's async_write_some function, or any other composed operations
 * that perform writes) until this operation completes.
 */

#ifndef _TCP_ASYNC_SENDER_H
#define _TCP_ASYNC_SENDER_H 1

#include <cstdint>
#include <vector>
#include <queue>
#include <memory>
#include <boost/asio.hpp>
#include <boost/function.hpp>
#include "bp7_util_export.h"

struct TcpAsyncSenderElement {
    typedef boost::function<void(const boost::system::error_code& error, std::size_t bytes_transferred, TcpAsyncSenderElement * elPtr)> OnSuccessfulSendCallbackByIoServiceThread_t;
    BP7_UTIL_EXPORT TcpAsyncSenderElement();
    BP7_UTIL_EXPORT ~TcpAsyncSenderElement();

    BP7_UTIL_EXPORT void DoCallback(const boost::system::error_code& error, std::size_t bytes_transferred);

    std::vector<boost::asio::const_buffer> m_constBufferVec;
    std::vector<std::vector<uint8_t> > m_underlyingDataVecHeaders;
    std::vector<uint8_t> m_underlyingDataVecBundle;
    OnSuccessfulSendCallbackByIoServiceThread_t * m_onSuccessfulSendCallbackByIoServiceThreadPtr;
};

class TcpAsyncSender {
private:
    TcpAsyncSender();
public:
    typedef boost::function<void(const boost::system::error_code& error, std::size_t numElementsDiscarded)> OnSendErrorCallback_t;

    BP7_UTIL_EXPORT TcpAsyncSender(std::shared_ptr<boost::asio::ip::tcp::socket> & tcpSocketPtr, boost::asio::io_service & ioServiceRef);

    BP7_UTIL_EXPORT ~TcpAsyncSender();

    BP7_UTIL_EXPORT void AsyncSend_NotThreadSafe(TcpAsyncSenderElement * senderElementNeedingDeleted);
    BP7_UTIL_EXPORT void AsyncSend_ThreadSafe(TcpAsyncSenderElement * senderElementNeedingDeleted);

    BP7_UTIL_EXPORT void SetOnSendErrorCallback(const OnSendErrorCallback_t& callback);
    BP7_UTIL_EXPORT std::size_t GetNumQueuedElements() const;
    BP7_UTIL_EXPORT bool SendErrorOccurred() const;
private:
    BP7_UTIL_EXPORT void HandleTcpSend(const boost::system::error_code& error, std::size_t bytes_transferred);


    boost::asio::io_service & m_ioServiceRef;
    std::shared_ptr<boost::asio::ip::tcp::socket> m_tcpSocketPtr;
    std::queue<std::unique_ptr<TcpAsyncSenderElement> > m_queueTcpAsyncSenderElements;

    volatile bool m_writeInProgress;
    volatile bool m_sendErrorOccurred;

    OnSendErrorCallback_t m_onSendErrorCallback;
};

#endif //_TCP_ASYNC_SENDER_H
