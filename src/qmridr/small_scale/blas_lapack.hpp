///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/small_scale/blas_lapack.hpp
 * \brief Fortran BLAS and LAPACK routines used by the solver
 *
 * The routines are declared here with \ref QMRIDR_FC mangling and exposed
 * as type-overloaded wrappers in \a qmridr::internal for the four standard
 * precisions (\a s, \a d, \a c, and \a z). The complex buffers are passed
 * as \a void* since \a std::complex is layout compatible with Fortran
 * \a COMPLEX.

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

#ifndef _QMRIDR_SMALLSCALE_BLAS_LAPACK_HPP
#define _QMRIDR_SMALLSCALE_BLAS_LAPACK_HPP

#include <complex>

#include "qmridr/small_scale/config.hpp"

#ifndef DOXYGEN_SHOULD_SKIP_THIS
extern "C" {

// LU with partial pivoting

void QMRIDR_FC(dgetrf, DGETRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               double *, qmridr_lapack_int *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(sgetrf, SGETRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               float *, qmridr_lapack_int *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(zgetrf, ZGETRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               void *, qmridr_lapack_int *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(cgetrf, CGETRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               void *, qmridr_lapack_int *,
                               qmridr_lapack_int *, qmridr_lapack_int *);

// solve with LU factors

void QMRIDR_FC(dgetrs, DGETRS)(char *, qmridr_lapack_int *,
                               qmridr_lapack_int *, double *,
                               qmridr_lapack_int *, qmridr_lapack_int *,
                               double *, qmridr_lapack_int *,
                               qmridr_lapack_int *);
void QMRIDR_FC(sgetrs, SGETRS)(char *, qmridr_lapack_int *,
                               qmridr_lapack_int *, float *,
                               qmridr_lapack_int *, qmridr_lapack_int *,
                               float *, qmridr_lapack_int *,
                               qmridr_lapack_int *);
void QMRIDR_FC(zgetrs, ZGETRS)(char *, qmridr_lapack_int *,
                               qmridr_lapack_int *, void *,
                               qmridr_lapack_int *, qmridr_lapack_int *,
                               void *, qmridr_lapack_int *,
                               qmridr_lapack_int *);
void QMRIDR_FC(cgetrs, CGETRS)(char *, qmridr_lapack_int *,
                               qmridr_lapack_int *, void *,
                               qmridr_lapack_int *, qmridr_lapack_int *,
                               void *, qmridr_lapack_int *,
                               qmridr_lapack_int *);

// Householder QR

void QMRIDR_FC(dgeqrf, DGEQRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               double *, qmridr_lapack_int *, double *,
                               double *, qmridr_lapack_int *,
                               qmridr_lapack_int *);
void QMRIDR_FC(sgeqrf, SGEQRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               float *, qmridr_lapack_int *, float *, float *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(zgeqrf, ZGEQRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               void *, qmridr_lapack_int *, void *, void *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(cgeqrf, CGEQRF)(qmridr_lapack_int *, qmridr_lapack_int *,
                               void *, qmridr_lapack_int *, void *, void *,
                               qmridr_lapack_int *, qmridr_lapack_int *);

// form the explicit Q factor

void QMRIDR_FC(dorgqr, DORGQR)(qmridr_lapack_int *, qmridr_lapack_int *,
                               qmridr_lapack_int *, double *,
                               qmridr_lapack_int *, double *, double *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(sorgqr, SORGQR)(qmridr_lapack_int *, qmridr_lapack_int *,
                               qmridr_lapack_int *, float *,
                               qmridr_lapack_int *, float *, float *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(zungqr, ZUNGQR)(qmridr_lapack_int *, qmridr_lapack_int *,
                               qmridr_lapack_int *, void *,
                               qmridr_lapack_int *, void *, void *,
                               qmridr_lapack_int *, qmridr_lapack_int *);
void QMRIDR_FC(cungqr, CUNGQR)(qmridr_lapack_int *, qmridr_lapack_int *,
                               qmridr_lapack_int *, void *,
                               qmridr_lapack_int *, void *, void *,
                               qmridr_lapack_int *, qmridr_lapack_int *);

// matrix-vector

void QMRIDR_FC(dgemv, DGEMV)(char *, qmridr_lapack_int *, qmridr_lapack_int *,
                             double *, double *, qmridr_lapack_int *,
                             double *, qmridr_lapack_int *, double *,
                             double *, qmridr_lapack_int *);
void QMRIDR_FC(sgemv, SGEMV)(char *, qmridr_lapack_int *, qmridr_lapack_int *,
                             float *, float *, qmridr_lapack_int *, float *,
                             qmridr_lapack_int *, float *, float *,
                             qmridr_lapack_int *);
void QMRIDR_FC(zgemv, ZGEMV)(char *, qmridr_lapack_int *, qmridr_lapack_int *,
                             void *, void *, qmridr_lapack_int *, void *,
                             qmridr_lapack_int *, void *, void *,
                             qmridr_lapack_int *);
void QMRIDR_FC(cgemv, CGEMV)(char *, qmridr_lapack_int *, qmridr_lapack_int *,
                             void *, void *, qmridr_lapack_int *, void *,
                             qmridr_lapack_int *, void *, void *,
                             qmridr_lapack_int *);
}
#endif  // DOXYGEN_SHOULD_SKIP_THIS

namespace qmridr {
namespace internal {

/*!
 * \addtogroup sss
 * @{
 */

#ifndef DOXYGEN_SHOULD_SKIP_THIS

// The Fortran interfaces take every argument by pointer, the casts below only
// drop the const qualifiers of the by-value arguments.
#  define _QMRIDR_INT(__v) const_cast<qmridr_lapack_int *>(&__v)
#  define _QMRIDR_CHR(__v) const_cast<char *>(&__v)

// generate getrf, getrs, geqrf, Q-forming and gemv for a given precision,
// __F is the Fortran prefix, __Q is the name of the Q-forming routine
#  define _QMRIDR_DEFINE_KERNELS(__f, __F, __q, __Q, __T, __BUF)              \
    inline qmridr_lapack_int getrf(                                          \
        const qmridr_lapack_int m, const qmridr_lapack_int n, __T *a,         \
        const qmridr_lapack_int lda, qmridr_lapack_int *ipiv) {               \
      qmridr_lapack_int info;                                                \
      QMRIDR_FC(__f##getrf, __F##GETRF)                                      \
      (_QMRIDR_INT(m), _QMRIDR_INT(n), (__BUF *)a, _QMRIDR_INT(lda), ipiv,    \
       &info);                                                               \
      return info;                                                           \
    }                                                                        \
    inline qmridr_lapack_int getrs(                                          \
        const char tran, const qmridr_lapack_int n,                          \
        const qmridr_lapack_int nrhs, const __T *a,                          \
        const qmridr_lapack_int lda, const qmridr_lapack_int *ipiv, __T *b,  \
        const qmridr_lapack_int ldb) {                                       \
      qmridr_lapack_int info;                                                \
      QMRIDR_FC(__f##getrs, __F##GETRS)                                      \
      (_QMRIDR_CHR(tran), _QMRIDR_INT(n), _QMRIDR_INT(nrhs),                 \
       (__BUF *)const_cast<__T *>(a), _QMRIDR_INT(lda),                      \
       const_cast<qmridr_lapack_int *>(ipiv), (__BUF *)b, _QMRIDR_INT(ldb),  \
       &info);                                                               \
      return info;                                                           \
    }                                                                        \
    inline qmridr_lapack_int geqrf(                                          \
        const qmridr_lapack_int m, const qmridr_lapack_int n, __T *a,         \
        const qmridr_lapack_int lda, __T *tau, __T *work,                    \
        const qmridr_lapack_int lwork) {                                     \
      qmridr_lapack_int info;                                                \
      QMRIDR_FC(__f##geqrf, __F##GEQRF)                                      \
      (_QMRIDR_INT(m), _QMRIDR_INT(n), (__BUF *)a, _QMRIDR_INT(lda),          \
       (__BUF *)tau, (__BUF *)work, _QMRIDR_INT(lwork), &info);              \
      return info;                                                           \
    }                                                                        \
    inline qmridr_lapack_int orgqr(                                          \
        const qmridr_lapack_int m, const qmridr_lapack_int n,                \
        const qmridr_lapack_int k, __T *a, const qmridr_lapack_int lda,      \
        const __T *tau, __T *work, const qmridr_lapack_int lwork) {          \
      qmridr_lapack_int info;                                                \
      QMRIDR_FC(__f##__q, __F##__Q)                                          \
      (_QMRIDR_INT(m), _QMRIDR_INT(n), _QMRIDR_INT(k), (__BUF *)a,           \
       _QMRIDR_INT(lda), (__BUF *)const_cast<__T *>(tau), (__BUF *)work,     \
       _QMRIDR_INT(lwork), &info);                                           \
      return info;                                                           \
    }                                                                        \
    inline void gemv(const char trans, const qmridr_lapack_int m,            \
                     const qmridr_lapack_int n, const __T alpha,             \
                     const __T *a, const qmridr_lapack_int lda,              \
                     const __T *x, const __T beta, __T *y) {                 \
      qmridr_lapack_int inc(1);                                              \
      QMRIDR_FC(__f##gemv, __F##GEMV)                                        \
      (_QMRIDR_CHR(trans), _QMRIDR_INT(m), _QMRIDR_INT(n),                   \
       (__BUF *)const_cast<__T *>(&alpha), (__BUF *)const_cast<__T *>(a),    \
       _QMRIDR_INT(lda), (__BUF *)const_cast<__T *>(x), &inc,                \
       (__BUF *)const_cast<__T *>(&beta), (__BUF *)y, &inc);                 \
    }

_QMRIDR_DEFINE_KERNELS(d, D, orgqr, ORGQR, double, double)
_QMRIDR_DEFINE_KERNELS(s, S, orgqr, ORGQR, float, float)
_QMRIDR_DEFINE_KERNELS(z, Z, ungqr, UNGQR, std::complex<double>, void)
_QMRIDR_DEFINE_KERNELS(c, C, ungqr, UNGQR, std::complex<float>, void)

#  undef _QMRIDR_DEFINE_KERNELS
#  undef _QMRIDR_CHR
#  undef _QMRIDR_INT

#endif  // DOXYGEN_SHOULD_SKIP_THIS

/*!
 * @}
 */  // sss group

}  // namespace internal
}  // namespace qmridr

#endif  // _QMRIDR_SMALLSCALE_BLAS_LAPACK_HPP
