/**
 * @file TcpAsyncSender.cpp
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

#include "TcpAsyncSender.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::tcpcl;

TcpAsyncSenderElement::TcpAsyncSenderElement() : m_onSuccessfulSendCallbackByIoServiceThreadPtr(NULL) {}
TcpAsyncSenderElement::~TcpAsyncSenderElement() {}

void TcpAsyncSenderElement::DoCallback(const boost::system::error_code& error, std::size_t bytes_transferred) {
    if(m_onSuccessfulSendCallbackByIoServiceThreadPtr && (*m_onSuccessfulSendCallbackByIoServiceThreadPtr)) {
        (*m_onSuccessfulSendCallbackByIoServiceThreadPtr)(error, bytes_transferred, this);
    }
}


TcpAsyncSender::TcpAsyncSender(std::shared_ptr<boost::asio::ip::tcp::socket> & tcpSocketPtr, boost::asio::io_service & ioServiceRef) :
    m_ioServiceRef(ioServiceRef),
    m_tcpSocketPtr(tcpSocketPtr),
    m_writeInProgress(false),
    m_sendErrorOccurred(false)
{

}

TcpAsyncSender::~TcpAsyncSender() {

}

void TcpAsyncSender::AsyncSend_NotThreadSafe(TcpAsyncSenderElement * senderElementNeedingDeleted) {
    std::unique_ptr<TcpAsyncSenderElement> elUniquePtr(senderElementNeedingDeleted);
    if (m_sendErrorOccurred) {
        //prevent data from being queued on a dead socket
        LOG_DEBUG(subprocess) << "TcpAsyncSender: discarding element queued after a send error";
        return;
    }
    m_queueTcpAsyncSenderElements.push(std::move(elUniquePtr));
    if (!m_writeInProgress) {
        m_writeInProgress = true;
        boost::asio::async_write(*m_tcpSocketPtr, senderElementNeedingDeleted->m_constBufferVec,
            boost::bind(&TcpAsyncSender::HandleTcpSend, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::bytes_transferred));
    }
}

void TcpAsyncSender::AsyncSend_ThreadSafe(TcpAsyncSenderElement * senderElementNeedingDeleted) {
    boost::asio::post(m_ioServiceRef, boost::bind(&TcpAsyncSender::AsyncSend_NotThreadSafe, this, senderElementNeedingDeleted));
}


void TcpAsyncSender::HandleTcpSend(const boost::system::error_code& error, std::size_t bytes_transferred) {
    std::unique_ptr<TcpAsyncSenderElement> elPtr = std::move(m_queueTcpAsyncSenderElements.front());
    m_queueTcpAsyncSenderElements.pop();
    elPtr->DoCallback(error, bytes_transferred);
    if (error) {
        m_sendErrorOccurred = true;
        m_writeInProgress = false;
        if (error != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << "TcpAsyncSender::HandleTcpSend: " << error.message();
        }
        //empty the queue
        const std::size_t numElementsDiscarded = m_queueTcpAsyncSenderElements.size() + 1;
        while (!m_queueTcpAsyncSenderElements.empty()) {
            m_queueTcpAsyncSenderElements.pop();
        }
        if (m_onSendErrorCallback) {
            m_onSendErrorCallback(error, numElementsDiscarded);
        }
    }
    else if (m_queueTcpAsyncSenderElements.empty()) {
        m_writeInProgress = false;
    }
    else {
        boost::asio::async_write(*m_tcpSocketPtr, m_queueTcpAsyncSenderElements.front()->m_constBufferVec,
            boost::bind(&TcpAsyncSender::HandleTcpSend, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::bytes_transferred));
    }
}

void TcpAsyncSender::SetOnSendErrorCallback(const OnSendErrorCallback_t& callback) {
    m_onSendErrorCallback = callback;
}

std::size_t TcpAsyncSender::GetNumQueuedElements() const {
    return m_queueTcpAsyncSenderElements.size();
}

bool TcpAsyncSender::SendErrorOccurred() const {
    return m_sendErrorOccurred;
}
