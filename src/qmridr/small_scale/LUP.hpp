///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/small_scale/LUP.hpp
 * \brief LU with partial pivoting and column replacement updates

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

#ifndef _QMRIDR_SMALLSCALE_LUP_HPP
#define _QMRIDR_SMALLSCALE_LUP_HPP

#include <algorithm>

#include "qmridr/ds/Array.hpp"
#include "qmridr/ds/DenseMatrix.hpp"
#include "qmridr/macros.hpp"
#include "qmridr/small_scale/lapack.hpp"
#include "qmridr/utils/log.hpp"

namespace qmridr {

/// \class LUP
/// \brief LU with partial pivoting for the small Gram system
/// \tparam ValueType value type, e.g. \a double
/// \ingroup sss
///
/// Besides the plain LAPACK factorization, this class supports replacing a
/// single column of the matrix in \f$\mathcal{O}(n)\f$ storage. Given
/// \f$\mathbf{M}=\mathbf{PLU}\f$ and a new column \f$\mathbf{m}\f$ for
/// position \f$p\f$, we have \f$\mathbf{M}'=\mathbf{ME}\f$, where
/// \f$\mathbf{E}\f$ is the identity with its \f$p\f$-th column replaced by
/// \f$\boldsymbol{\alpha}=\mathbf{M}^{-1}\mathbf{m}\f$. We store the
/// sequence of such eta columns and apply their inverses after the LU solve.
/// After \ref max_updates replacements, the matrix is factorized from
/// scratch.
template <class ValueType>
class LUP {
 public:
  typedef ValueType                      value_type;     ///< value type
  typedef Lapack<value_type>             lapack_kernel;  ///< lapack backend
  typedef Array<value_type>              array_type;     ///< array type
  typedef DenseMatrix<value_type>        mat_type;       ///< dense matrix
  typedef typename array_type::size_type size_type;      ///< size type

  /// \brief get the solver type
  inline static const char *method() { return "LUP"; }

  /// \brief default constructor
  LUP() : _updates(0), _max_updates(0) {}

  /// \brief allocate an \a n by \a n system
  /// \param[in] n system size
  inline void init(const size_type n) {
    _mat.resize(n, n);
    _mat.fill(value_type(0));
    _fac.resize(n, n);
    _ipiv.resize(n);
    _max_updates = n ? n - 1 : 0;
#if QMRIDR_GRAM_REFRESH >= 0
    _max_updates = std::min(_max_updates, size_type(QMRIDR_GRAM_REFRESH));
#endif
    _etas.resize(n, std::max(_max_updates, size_type(1)));
    _eta_pos.resize(_etas.ncols());
    _updates = 0;
  }

  /// \brief explicit matrix, used for assembling and refactorization
  inline mat_type &      mat() { return _mat; }
  inline const mat_type &mat() const { return _mat; }

  /// \brief number of column replacements since the last factorization
  inline size_type updates() const { return _updates; }

  /// \brief maximum column replacements allowed before refactorization
  inline size_type max_updates() const { return _max_updates; }

  /// \brief factorize the current explicit matrix from scratch
  inline void factorize() {
    qmridr_error_if(_mat.empty(), "matrix is still empty!");
    std::copy(_mat.array().cbegin(), _mat.array().cend(),
              _fac.array().begin());
    const auto info = lapack_kernel::getrf(_fac, _ipiv);
    if (info < 0)
      qmridr_error("GETRF returned negative info %d!", (int)info);
    else if (info > 0)
      qmridr_warning(
          "GETRF returned positive info, U(%zd,%zd) is exactly zero!",
          (size_type)info, (size_type)info);
    _updates = 0;
  }

  /// \brief solve \f$\mathbf{Mx}=\mathbf{b}\f$ in place
  /// \param[in,out] x input rhs, output solution
  inline void solve(array_type &x) const {
    qmridr_error_if(x.size() != _fac.nrows(),
                    "unmatched sizes between system and rhs");
    if (lapack_kernel::getrs(_fac, _ipiv, x.data()) < 0)
      qmridr_error("GETRS returned negative info!");
    for (size_type e(0); e < _updates; ++e) {
      const size_type  p  = _eta_pos[e];
      auto             a  = _etas.col_begin(e);
      const value_type xp = x[p] / a[p];
      for (size_type i(0); i < x.size(); ++i) x[i] -= a[i] * xp;
      x[p] = xp;
    }
  }

  /// \brief replace a column of the matrix
  /// \param[in] col column position
  /// \param[in] m new column
  /// \param[in] alpha solution of the system with \a m before the update
  inline void replace_column(const size_type col, const array_type &m,
                             const array_type &alpha) {
    qmridr_error_if(col >= _mat.ncols(), "%zd exceeds column bound %zd", col,
                    _mat.ncols());
    std::copy(m.cbegin(), m.cend(), _mat.col_begin(col));
    if (_updates >= _max_updates || alpha[col] == value_type(0)) {
      factorize();
      return;
    }
    std::copy(alpha.cbegin(), alpha.cend(), _etas.col_begin(_updates));
    _eta_pos[_updates++] = col;
  }

 protected:
  mat_type                 _mat;          ///< explicit matrix
  mat_type                 _fac;          ///< LU factors
  Array<qmridr_lapack_int> _ipiv;         ///< row pivoting array
  mat_type                 _etas;         ///< eta columns
  Array<size_type>         _eta_pos;      ///< positions of eta columns
  size_type                _updates;      ///< number of updates
  size_type                _max_updates;  ///< allowed number of updates
};

}  // namespace qmridr

#endif  // _QMRIDR_SMALLSCALE_LUP_HPP
