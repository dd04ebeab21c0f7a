///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/macros.hpp
 * \brief Useful preprocessing macros

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

#ifndef _QMRIDR_MACROS_HPP
#define _QMRIDR_MACROS_HPP

/*!
 * \addtogroup macros
 * @{
 */

// Hey! Don't define this for compiling for applications!
#ifdef ONLY_FOR_DOXYGEN

/// \def QMRIDR_THROW
/// \brief let QMRIDR use C++ exceptions intead of \a abort
/// \note default value is off
#  define QMRIDR_THROW

/// \def QMRIDR_LOG_PLAIN_PREFIX
/// \brief drop the ASCII color code in the logging
/// \note default value is off
#  define QMRIDR_LOG_PLAIN_PREFIX

/// \def QMRIDR_DEBUG
/// \brief enable internal assertions, see \ref qmridr_assert
/// \note default value is off
#  define QMRIDR_DEBUG

/// \def QMRIDR_FC
/// \brief Fortran name mangling for BLAS and LAPACK, see
///        \ref qmridr/small_scale/config.hpp
#  define QMRIDR_FC 2

/// \def QMRIDR_LAPACK_INT
/// \brief integer type of the linked BLAS and LAPACK libraries
/// \note default is \a int
#  define QMRIDR_LAPACK_INT int

#endif  // ONLY_FOR_DOXYGEN

/// \def QMRIDR_GRAM_REFRESH
/// \brief number of column replacements allowed in the Gram LU factorization
///        before it is recomputed from scratch, counted relatively to the
///        shadow space dimension
/// \note default is -1, i.e. \a proj_dim-1 updates
///
/// A non-negative value sets an absolute upper bound on the number of updates,
/// which is then capped by \a proj_dim-1.
#ifndef QMRIDR_GRAM_REFRESH
#  define QMRIDR_GRAM_REFRESH -1
#endif  // QMRIDR_GRAM_REFRESH

/*!
 * @}
 */

#endif  // _QMRIDR_MACROS_HPP
