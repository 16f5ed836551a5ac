/******************************************************************************
 *
 *    This file is part of the bioskel project
 *    Copyright (C) 2026 bioskel contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/
/** @file logger.h
 * @brief Process-wide logger with pluggable listeners.
 */

#ifndef __BIOSKEL_LOGGER_H
#define __BIOSKEL_LOGGER_H

#include <cstdarg>
#include <set>
#include <string>

namespace BioSkel {

/** @brief Receives formatted log lines from the Logger.
 * Implementations decide where the text ends up (stderr, file, console). */
class LogListener {
public:
    virtual ~LogListener() {}

    virtual void logMessage(int level, const std::string &msg) = 0;
};

/** @brief Logger. One instance is expected per process; it registers itself
 * as the global instance on construction so that the LOG_* macros can reach
 * it without passing it around. Without a live instance, the macros are
 * no-ops. */
class Logger {
public:
    enum LogLevel {
        LOG_LEVEL_FATAL = 0,
        LOG_LEVEL_ERROR,
        LOG_LEVEL_INFO,
        LOG_LEVEL_DEBUG,
        LOG_LEVEL_VERBOSE
    };

    Logger();
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    /// printf-style log entry point. Messages above the current level are dropped.
    void log(LogLevel level, const char *fmt, ...);
    void vlog(LogLevel level, const char *fmt, va_list args);

    void registerLogListener(LogListener *listener);
    void unregisterLogListener(LogListener *listener);

    void setLogLevel(LogLevel level) { mLogLevel = level; }
    LogLevel getLogLevel() const { return mLogLevel; }

    /// Human readable level tag ("INFO", "ERROR", ...)
    static const char *levelName(int level);

    /// The currently registered process logger, or nullptr
    static Logger *getSingletonPtr() { return msSingleton; }

private:
    void dispatch(int level, const std::string &msg);

    typedef std::set<LogListener *> LogListenerSet;

    LogListenerSet mListeners;
    LogLevel mLogLevel;

    static Logger *msSingleton;
};

} // namespace BioSkel

#define BIOSKEL_LOG(level, ...)                                              \
    do {                                                                     \
        if (::BioSkel::Logger *lg_ = ::BioSkel::Logger::getSingletonPtr())   \
            lg_->log(level, __VA_ARGS__);                                    \
    } while (0)

#define LOG_FATAL(...)   BIOSKEL_LOG(::BioSkel::Logger::LOG_LEVEL_FATAL, __VA_ARGS__)
#define LOG_ERROR(...)   BIOSKEL_LOG(::BioSkel::Logger::LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_INFO(...)    BIOSKEL_LOG(::BioSkel::Logger::LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_DEBUG(...)   BIOSKEL_LOG(::BioSkel::Logger::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_VERBOSE(...) BIOSKEL_LOG(::BioSkel::Logger::LOG_LEVEL_VERBOSE, __VA_ARGS__)

#endif
