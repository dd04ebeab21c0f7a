///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/small_scale/lapack.hpp
 * \brief Typed front end of the BLAS/LAPACK kernels

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

#ifndef _QMRIDR_SMALLSCALE_LAPACK_HPP
#define _QMRIDR_SMALLSCALE_LAPACK_HPP

#include <algorithm>
#include <type_traits>
#include <vector>

#include "qmridr/ds/Array.hpp"
#include "qmridr/ds/DenseMatrix.hpp"
#include "qmridr/small_scale/blas_lapack.hpp"
#include "qmridr/utils/log.hpp"
#include "qmridr/utils/math.hpp"

namespace qmridr {

/// \class Lapack
/// \tparam ValueType value type, e.g. \a double
/// \ingroup sss
template <class ValueType>
class Lapack {
 public:
  typedef qmridr_lapack_int int_type;    ///< integer type
  typedef ValueType         value_type;  ///< value type
  typedef value_type *      pointer;     ///< pointer type
  typedef typename ValueTypeTrait<value_type>::value_type scalar_type;
  ///< scalar type

  /// \name LU
  ///@{

  inline static int_type getrf(const int_type n, pointer a, const int_type lda,
                               int_type *ipiv) {
    return internal::getrf(n, n, a, lda, ipiv);
  }

  inline static int_type getrf(DenseMatrix<value_type> &a,
                               Array<int_type> &        ipiv) {
    qmridr_assert(a.nrows() == ipiv.size(),
                  "row size should match permutation vector length");
    return getrf(a.nrows(), a.data(), a.nrows(), ipiv.data());
  }

  inline static int_type getrs(const char tran, const int_type n,
                               const int_type nrhs, const value_type *a,
                               const int_type lda, const int_type *ipiv,
                               pointer b, const int_type ldb) {
    return internal::getrs(tran, n, nrhs, a, lda, ipiv, b, ldb);
  }

  /// \brief solve with a single right-hand side stored contiguously
  inline static int_type getrs(const DenseMatrix<value_type> &a,
                               const Array<int_type> &ipiv, pointer b,
                               const char tran = 'N') {
    qmridr_assert(a.is_squared(), "matrix must be squared");
    qmridr_assert(a.nrows() == ipiv.size(),
                  "row size should match permutation vector length");
    return getrs(tran, a.nrows(), 1, a.data(), a.nrows(), ipiv.data(), b,
                 a.nrows());
  }

  ///@}

  /// \name QR
  ///@{

  inline static int_type geqrf(const int_type m, const int_type n, pointer a,
                               const int_type lda, pointer tau, pointer work,
                               const int_type lwork) {
    return internal::geqrf(m, n, a, lda, tau, work, lwork);
  }

  inline static int_type orgqr(const int_type m, const int_type n,
                               const int_type k, pointer a, const int_type lda,
                               const value_type *tau, pointer work,
                               const int_type lwork) {
    return internal::orgqr(m, n, k, a, lda, tau, work, lwork);
  }

  /// \brief overwrite a tall matrix with the Q factor of its thin QR
  /// \param[in,out] a input matrix, the orthonormal basis upon output
  /// \return negative values indicate illegal arguments (LAPACK info)
  ///
  /// This is done via \a ?geqrf followed by \a ?orgqr (or \a ?ungqr for
  /// complex numbers) with optimal workspace sizes queried first.
  inline static int_type orthonormalize(DenseMatrix<value_type> &a) {
    const int_type m = a.nrows(), n = a.ncols();
    qmridr_assert(m >= n, "must be a tall matrix");
    if (!n) return 0;
    std::vector<value_type> tau(n);
    value_type              lwork1, lwork2;
    int_type info = geqrf(m, n, a.data(), m, tau.data(), &lwork1, -1);
    if (info) return info;
    info = orgqr(m, n, n, a.data(), m, tau.data(), &lwork2, -1);
    if (info) return info;
    std::vector<value_type> work(
        std::max(std::max((int_type)abs(lwork1), (int_type)abs(lwork2)), n));
    info = geqrf(m, n, a.data(), m, tau.data(), work.data(), work.size());
    if (info) return info;
    return orgqr(m, n, n, a.data(), m, tau.data(), work.data(), work.size());
  }

  ///@}

  /// \name common
  ///@{

  /// \brief matrix-vector, \f$\mathbf{y}=\alpha op(\mathbf{A})\mathbf{x}+
  ///        \beta\mathbf{y}\f$
  /// \param[in] trans 'N', 'T', or 'C' for conjugate transpose
  inline static void gemv(const char trans, const int_type m, const int_type n,
                          const value_type alpha, const value_type *a,
                          const int_type lda, const value_type *x,
                          const value_type beta, pointer y) {
    // quick return, BLAS would reject lda=0
    if (!m || !n) {
      const int_type len = trans == 'N' ? m : n;
      for (int_type i(0); i < len; ++i)
        y[i] = beta == value_type(0) ? value_type(0) : beta * y[i];
      return;
    }
    internal::gemv(trans, m, n, alpha, a, lda, x, beta, y);
  }

  inline static void gemv(const char trans, const value_type alpha,
                          const DenseMatrix<value_type> &a,
                          const Array<value_type> &x, const value_type beta,
                          Array<value_type> &y) {
    if (trans == 'N') {
      qmridr_assert(a.ncols() == x.size(), "unmatched sizes");
      qmridr_assert(a.nrows() == y.size(), "unmatched sizes");
    } else {
      qmridr_assert(a.ncols() == y.size(), "unmatched sizes");
      qmridr_assert(a.nrows() == x.size(), "unmatched sizes");
    }
    gemv(trans, a.nrows(), a.ncols(), alpha, a.data(), a.nrows(), x.data(),
         beta, y.data());
  }

  ///@}
};

}  // namespace qmridr

#endif  // _QMRIDR_SMALLSCALE_LAPACK_HPP
