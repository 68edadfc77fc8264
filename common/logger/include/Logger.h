/**
 * @file Logger.h
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
 * Process wide Boost.Log front end.  Every source file declares a
 * static constexpr bp7::Logger::SubProcess named subprocess and logs through
 * the LOG_* macros, which route records to the sinks selected at compile time
 * (LOG_TO_CONSOLE, LOG_TO_PROCESS_FILE, LOG_TO_SUBPROCESS_FILES, LOG_TO_ERROR_FILE).
 */

#ifndef _BP7_LOG_H
#define _BP7_LOG_H 1

#include <cstddef>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <string>
#include <memory>
#include <atomic>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/value_ref.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include "log_lib_export.h"

namespace bp7 {

/**
 * Log levels. These match the Boost trivial level definitions
 */
#define LOG_LEVEL_TRACE 0
#define LOG_LEVEL_DEBUG 1
#define LOG_LEVEL_INFO 2
#define LOG_LEVEL_WARNING 3
#define LOG_LEVEL_ERROR 4
#define LOG_LEVEL_FATAL 5

#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

/**
 * _NO_OP_STREAM_LOGGER discards a streaming expression. The "else"
 * branch is never taken so the compiler optimizes it out.
 */
#define _NO_OP_STREAM_LOGGER if (true) {} else std::cout

#if LOG_LEVEL > LOG_LEVEL_TRACE
    #define LOG_TRACE(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_TRACE(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::trace)
#endif

#if LOG_LEVEL > LOG_LEVEL_DEBUG
    #define LOG_DEBUG(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_DEBUG(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::debug)
#endif

#if LOG_LEVEL > LOG_LEVEL_INFO
    #define LOG_INFO(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_INFO(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::info)
#endif

#if LOG_LEVEL > LOG_LEVEL_WARNING
    #define LOG_WARNING(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_WARNING(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::warning)
#endif

#if LOG_LEVEL > LOG_LEVEL_ERROR
    #define LOG_ERROR(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_ERROR(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::error)
#endif

#if LOG_LEVEL > LOG_LEVEL_FATAL
    #define LOG_FATAL(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_FATAL(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::fatal)
#endif

#define _LOG_INTERNAL(subprocess, lvl)\
    bp7::Logger::ensureInitialized();\
    BOOST_LOG_STREAM_CHANNEL_SEV(bp7::Logger::m_severityChannelLogger, subprocess, lvl)\
        << boost::log::add_value("File", __FILE__)\
        << boost::log::add_value("Line", __LINE__)

typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend> sink_t;

/**
 * @brief Singleton that owns the Boost.Log sinks of the process.
 */
class Logger
{
public:
    /**
     * Gets the version from Bp7Version.hpp as a "MAJOR.MINOR.PATCH" string.
     */
    LOG_LIB_EXPORT static const std::string& GetBp7VersionAsString();

    /**
     * Initializes the logger if it hasn't been created yet. Called from
     * the LOG_* macros.
     */
    LOG_LIB_EXPORT static void ensureInitialized() noexcept;

    /**
     * Processes that use the logger. New executables must be added here
     * and to the process_strings table.
     */
    enum class Process {
        bp7node,
        unittest,
        none
    };

    /**
     * Library level channels. New libraries must be added here
     * and to the subprocess_strings table.
     */
    enum class SubProcess {
        codec,
        bundle,
        tcpcl,
        bpa,
        config,
        unittest,
        none
    };

    LOG_LIB_EXPORT static std::string toString(Logger::Process process);
    LOG_LIB_EXPORT static std::string toString(Logger::SubProcess subProcess);

    typedef boost::log::attributes::constant<Logger::Process> process_attr_t;
    LOG_LIB_EXPORT static Logger::process_attr_t process_attr;

    /**
     * Initializes the logger with the process identifier stamped on all messages
     * and logs the version banner.
     */
    LOG_LIB_EXPORT static void initializeWithProcess(Logger::Process process);

    typedef boost::log::sources::severity_channel_logger_mt<
        boost::log::trivial::severity_level,
        Logger::SubProcess
    > severity_channel_logger_t; //mt for multithreaded
    LOG_LIB_EXPORT static Logger::severity_channel_logger_t m_severityChannelLogger;

    LOG_LIB_EXPORT ~Logger();

private:
    LOG_LIB_EXPORT Logger();
    Logger(Logger const&) = delete;
    Logger& operator=(Logger const&) = delete;

    LOG_LIB_EXPORT void init();
    LOG_LIB_EXPORT void registerAttributes();
    LOG_LIB_EXPORT void createFileSinkForProcess(Logger::Process process);
    LOG_LIB_EXPORT void createFileSinkForSubProcess(Logger::SubProcess subprocess);
    LOG_LIB_EXPORT void createFileSinkForLevel(boost::log::trivial::severity_level level);
    LOG_LIB_EXPORT void createStdoutSink();
    LOG_LIB_EXPORT Logger::Process getProcessAttributeVal();

    LOG_LIB_EXPORT static boost::log::formatter consoleFormatter();
    LOG_LIB_EXPORT static boost::log::formatter levelFileFormatter();
    LOG_LIB_EXPORT static boost::log::formatter processFileFormatter();

    static std::unique_ptr<Logger> logger_; //singleton instance
    static boost::mutex mutexSingletonInstance_;
    static std::atomic<bool> loggerSingletonFullyInitialized_;
};

} //namespace bp7

#endif //_BP7_LOG_H
