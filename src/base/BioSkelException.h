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
/** @file BioSkelException.h
 * @brief Exception type raised on broken load-time invariants.
 */

#ifndef __BIOSKEL_EXCEPTION_H
#define __BIOSKEL_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace BioSkel {

/** @brief Basic exception. Carries a description and the throwing location
 * (usually "Class::method"). Thrown only while building static data, never
 * from the per-frame path. */
class BasicException : public std::runtime_error {
public:
    BasicException(const std::string &desc, const std::string &src);
    virtual ~BasicException() {}

    const std::string &getDescription() const { return mDescription; }
    const std::string &getSource() const { return mSource; }

    /// "description (source)", same text as what()
    std::string getDetails() const;

private:
    std::string mDescription;
    std::string mSource;
};

} // namespace BioSkel

#define BIOSKEL_EXCEPT(desc, src) throw ::BioSkel::BasicException((desc), (src))

#endif
