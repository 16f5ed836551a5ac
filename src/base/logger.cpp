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

#include "logger.h"

#include <cstdio>
#include <vector>

namespace BioSkel {

Logger *Logger::msSingleton = nullptr;

/*----------------------------------------------------*/
/*---------------------- Logger ----------------------*/
/*----------------------------------------------------*/
Logger::Logger() : mLogLevel(LOG_LEVEL_INFO) {
    // newest instance becomes the global one
    msSingleton = this;
}

//------------------------------------------------------
Logger::~Logger() {
    mListeners.clear();
    if (msSingleton == this)
        msSingleton = nullptr;
}

//------------------------------------------------------
void Logger::log(LogLevel level, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, fmt, args);
    va_end(args);
}

//------------------------------------------------------
void Logger::vlog(LogLevel level, const char *fmt, va_list args) {
    if (level > mLogLevel || mListeners.empty())
        return;

    char stackBuf[512];
    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(stackBuf, sizeof(stackBuf), fmt, copy);
    va_end(copy);

    if (needed < 0)
        return;

    if (static_cast<size_t>(needed) < sizeof(stackBuf)) {
        dispatch(level, std::string(stackBuf, static_cast<size_t>(needed)));
        return;
    }

    std::vector<char> heapBuf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(heapBuf.data(), heapBuf.size(), fmt, args);
    dispatch(level, std::string(heapBuf.data(), static_cast<size_t>(needed)));
}

//------------------------------------------------------
void Logger::registerLogListener(LogListener *listener) {
    if (listener)
        mListeners.insert(listener);
}

//------------------------------------------------------
void Logger::unregisterLogListener(LogListener *listener) {
    mListeners.erase(listener);
}

//------------------------------------------------------
const char *Logger::levelName(int level) {
    switch (level) {
    case LOG_LEVEL_FATAL:   return "FATAL";
    case LOG_LEVEL_ERROR:   return "ERROR";
    case LOG_LEVEL_INFO:    return "INFO";
    case LOG_LEVEL_DEBUG:   return "DEBUG";
    case LOG_LEVEL_VERBOSE: return "VERBOSE";
    default:                return "?";
    }
}

//------------------------------------------------------
void Logger::dispatch(int level, const std::string &msg) {
    for (LogListener *listener : mListeners)
        listener->logMessage(level, msg);
}

} // namespace BioSkel
