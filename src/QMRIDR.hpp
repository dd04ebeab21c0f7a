///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file QMRIDR.hpp
 * \brief Top level include file of the QMRIDR library

\verbatim
Copyright (C) 2021 NumGeom Group at Stony Brook University

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published
by the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
\endverbatim

 */

#ifndef _QMRIDR_HPP
#define _QMRIDR_HPP

#include <string>

#include "qmridr/macros.hpp"
#include "qmridr/version.h"

#include "qmridr/Options.h"
#include "qmridr/ksp/FQMRIDR.hpp"

namespace qmridr {

/// \brief get the version string representation during runtime
/// \return string representation of version
/// \ingroup itr
inline std::string version() {
  using std::to_string;
  return to_string(QMRIDR_GLOBAL_VERSION) + "." +
         to_string(QMRIDR_MAJOR_VERSION) + "." +
         to_string(QMRIDR_MINOR_VERSION);
}

}  // namespace qmridr

#endif  // _QMRIDR_HPP
