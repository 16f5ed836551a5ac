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
/** @file stdlog.h
 * @brief LogListener writing to stderr.
 */

#ifndef __BIOSKEL_STDLOG_H
#define __BIOSKEL_STDLOG_H

#include "logger.h"

namespace BioSkel {

/// Writes each log line to stderr, prefixed with its level tag
class StdLog : public LogListener {
public:
    StdLog() {}
    virtual ~StdLog() {}

    virtual void logMessage(int level, const std::string &msg) override;
};

} // namespace BioSkel

#endif
