///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/small_scale/config.hpp
 * \brief Fortran name mangling and integer type of BLAS/LAPACK

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

#ifndef _QMRIDR_SMALLSCALE_CONFIG_HPP
#define _QMRIDR_SMALLSCALE_CONFIG_HPP

/*
 * Fortran name mangling of the linked BLAS and LAPACK symbols, selected by
 * predefining QMRIDR_FC to one of
 *  1: lower
 *  2: lower_ (default)
 *  3: lower__
 *  4: UPPER
 *  5: UPPER_
 *  6: UPPER__
 */

#ifndef QMRIDR_FC
#  ifdef F77_GLOBAL /* cblas */
#    define QMRIDR_FC F77_GLOBAL
#  elif defined(LAPACK_GLOBAL) /* lapacke */
#    define QMRIDR_FC LAPACK_GLOBAL
#  else
#    define QMRIDR_FC(__l, __U) __l##_
#  endif
#elif QMRIDR_FC == 1
#  undef QMRIDR_FC
#  define QMRIDR_FC(__l, __U) __l
#elif QMRIDR_FC == 2
#  undef QMRIDR_FC
#  define QMRIDR_FC(__l, __U) __l##_
#elif QMRIDR_FC == 3
#  undef QMRIDR_FC
#  define QMRIDR_FC(__l, __U) __l##__
#elif QMRIDR_FC == 4
#  undef QMRIDR_FC
#  define QMRIDR_FC(__l, __U) __U
#elif QMRIDR_FC == 5
#  undef QMRIDR_FC
#  define QMRIDR_FC(__l, __U) __U##_
#elif QMRIDR_FC == 6
#  undef QMRIDR_FC
#  define QMRIDR_FC(__l, __U) __U##__
#else
#  error "Unknown QMRIDR_FC option, must be in (1,2,3,4,5,6)"
#endif

#ifndef QMRIDR_LAPACK_INT
#  ifdef OPENBLAS_CONFIG_H
#    ifdef OPENBLAS_USE64BITINT
#      define QMRIDR_LAPACK_INT BLASLONG
#    else
#      define QMRIDR_LAPACK_INT int
#    endif
#  elif defined(lapack_int)
#    define QMRIDR_LAPACK_INT lapack_int
#  else
#    define QMRIDR_LAPACK_INT int
#  endif
#endif /* QMRIDR_LAPACK_INT */

/*!
 * \typedef qmridr_lapack_int
 * \brief lapack integer type
 * \ingroup sss
 */
typedef QMRIDR_LAPACK_INT qmridr_lapack_int;

#endif /* _QMRIDR_SMALLSCALE_CONFIG_HPP */
