///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/version.h
 * \brief QMRIDR version header

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

#ifndef _QMRIDR_VERSION_H
#define _QMRIDR_VERSION_H

/// \def QMRIDR_GLOBAL_VERSION
/// \brief QMRIDR global version
/// \ingroup itr

/// \def QMRIDR_MAJOR_VERSION
/// \brief QMRIDR major version
/// \ingroup itr

/// \def QMRIDR_MINOR_VERSION
/// \brief QMRIDR minor version
/// \ingroup itr

#define QMRIDR_GLOBAL_VERSION 0
#define QMRIDR_MAJOR_VERSION 1
#define QMRIDR_MINOR_VERSION 0

#endif /* _QMRIDR_VERSION_H */
