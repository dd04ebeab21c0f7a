///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/KrylovBasis.hpp
 * \brief Circular Krylov basis of the flexible QMR-IDR(s) method

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

#ifndef _QMRIDR_KSP_KRYLOVBASIS_HPP
#define _QMRIDR_KSP_KRYLOVBASIS_HPP

#include <algorithm>

#include "qmridr/ds/Array.hpp"
#include "qmridr/ds/DenseMatrix.hpp"
#include "qmridr/ksp/BandedHessenberg.hpp"
#include "qmridr/ksp/Orthogonalizer.hpp"
#include "qmridr/ksp/Preconditioner.hpp"
#include "qmridr/ksp/common.hpp"
#include "qmridr/small_scale/lapack.hpp"
#include "qmridr/utils/math.hpp"

namespace qmridr {
namespace ksp {

/// \class KrylovBasis
/// \brief generalized Hessenberg decomposition
///        \f$\mathbf{AGU}=\mathbf{GH}\f$ in circular storage
/// \tparam ValueType value type, e.g., \a double
/// \ingroup ksp
///
/// Both \f$\mathbf{G}\f$ and the correction vectors \f$\mathbf{W}\f$ are
/// stored as \a n by \a s+1 column major buffers, where slot \a latest
/// holds the most recent basis vector. The new column of the Hessenberg
/// matrix is assembled in \a r with length \a s+3, i.e., entry \a s+1 is the
/// diagonal and entry \a s+2 is the subdiagonal.
template <class ValueType>
class KrylovBasis {
 public:
  typedef ValueType                                       value_type;
  typedef Array<value_type>                               array_type;
  typedef typename array_type::size_type                  size_type;
  typedef typename ValueTypeTrait<value_type>::value_type scalar_type;
  typedef DenseMatrix<value_type>                         mat_type;
  typedef Orthogonalizer<value_type>                      orth_type;
  typedef Preconditioner<value_type>                      precond_type;
  typedef BandedHessenberg<value_type>                    hessenberg_type;
  typedef Lapack<value_type>                              lapack_kernel;
  typedef typename lapack_kernel::int_type                int_type;

  KrylovBasis() : _n(0), _s(0), _latest(0) {}

  /// \brief initialize the basis with the normalized initial residual
  /// \param[in] r0 initial residual with unit norm
  /// \param[in] s IDR subspace dimension
  /// \param[in] orth orthogonalizer
  inline void init(const array_type &r0, const size_type s,
                   const orth_type &orth) {
    _n      = r0.size();
    _s      = s;
    _latest = 0;
    _orth   = orth;
    _orth.init(s + 1);
    _G.resize(_n, s + 1);
    _W.resize(_n, s + 1);
    _G.fill(value_type(0));
    _W.fill(value_type(0));
    std::copy(r0.cbegin(), r0.cend(), _G.col_begin(0));
    _v = r0;
    _vhat.resize(_n);
    _r.resize(s + 3);
    _coef.resize(s + 1);
    _search.resize(s);
  }

  /// \brief expand the basis with \f$\mathbf{AP}^{-1}\mathbf{v}\f$
  /// \tparam Operator operator type, see \ref apply_operator
  /// \tparam Projector projector type, see \ref ShadowProjector
  /// \param[in] A operator
  /// \param[in] P preconditioner
  /// \param[in] proj projector
  template <class Operator, class Projector>
  inline void expand(const Operator &A, const precond_type &P,
                     const Projector &proj) {
    _latest = (_latest + 1) % (_s + 1);
    P.apply(_v, _vhat);
    if (proj.orth_search() && proj.j() == 0u) {
      const mat_type &R0 = proj.R0();
      _orth.orthogonalize(_n, R0.ncols(), R0.data(), _vhat.data(),
                          _search.data());
    }
    array_type g = _G.col(_latest);
    apply_operator(A, _vhat, g);
  }

  /// \brief shift the latest vector into the current IDR space
  template <class Projector>
  inline void map_to_idr_space(const Projector &proj) {
    if (proj.j())
      axpy(_n, -proj.mu(), _v.data(), _G.col_begin(_latest));
  }

  /// \brief orthogonalize and normalize the latest vector
  /// \param[in] k position in the current IDR cycle, i.e., 1 to \a s+1
  ///
  /// Within a cycle, the latest vector is orthogonalized against the first
  /// \a k slots, i.e., the ones of the current IDR space.
  inline void orthogonalize(const size_type k) {
    std::fill(_r.begin(), _r.end(), value_type(0));
    value_type *      g = _G.col_begin(_latest);
    const scalar_type nrm =
        k < _s + 1 ? _orth.orthogonalize(_n, k, _G.data(), g, &_r[_s + 2 - k])
                   : norm2(_n, g);
    _r[_s + 2] = nrm;
    scale(_n, scalar_type(1) / nrm, g);
    std::copy_n(g, _n, _v.begin());
  }

  /// \brief add the projector contribution and update the QR factorization
  template <class Projector>
  inline void update_hessenberg(const Projector &proj, hessenberg_type &hes) {
    if (proj.j()) {
      const array_type &u  = proj.u();
      const value_type  mu = proj.mu();
      const size_type   pd = u.size();
      for (size_type i(0); i < pd; ++i) _r[_s + 1 - pd + i] -= mu * u[i];
      _r[_s + 1] += mu;
    }
    hes.add_column(_r);
  }

  /// \brief compute the correction vector of the latest slot
  /// \param[in] k position in the current IDR cycle
  /// \param[in] iter total iteration count
  ///
  /// \f$\mathbf{w}=(\hat{\mathbf{v}}-\mathbf{W}\mathbf{r})/r_{s+1}\f$, where
  /// slot \a latest-1-i pairs with row \a s-i, and only the written slots
  /// take part during the first cycle.
  inline void update_W(const size_type k, const size_type iter) {
    const value_type inv = value_type(1) / _r[_s + 1];
    size_type        ncols;
    if (iter > _s) {
      for (size_type l(0); l <= _s; ++l)
        _coef[l] = l < k ? _r[_s + 1 - k + l] : _r[l - k];
      ncols = _s + 1;
    } else {
      for (size_type l(0); l < k; ++l) _coef[l] = _r[_s + 1 - k + l];
      ncols = k;
    }
    lapack_kernel::gemv('N', int_type(_n), int_type(ncols), -inv, _W.data(),
                        int_type(_n), _coef.data(), inv, _vhat.data());
    std::copy(_vhat.cbegin(), _vhat.cend(), _W.col_begin(_latest));
  }

  inline size_type         n() const { return _n; }
  inline size_type         s() const { return _s; }
  inline size_type         latest() const { return _latest; }
  inline const mat_type &  G() const { return _G; }
  inline const mat_type &  W() const { return _W; }
  inline array_type &      v() { return _v; }
  inline const array_type &v() const { return _v; }
  inline const array_type &vhat() const { return _vhat; }
  inline const array_type &r() const { return _r; }

  /// \brief latest correction vector
  inline const value_type *w_latest() const { return _W.col_begin(_latest); }

 protected:
  size_type  _n;       ///< system size
  size_type  _s;       ///< IDR subspace dimension
  size_type  _latest;  ///< latest slot
  mat_type   _G;       ///< basis vectors
  mat_type   _W;       ///< correction vectors
  array_type _v;       ///< latest basis vector, projected in place
  array_type _vhat;    ///< preconditioned v
  array_type _r;       ///< Hessenberg column
  array_type _coef;    ///< Hessenberg entries in slot order
  array_type _search;  ///< coefficients of the search orthogonalization
  orth_type  _orth;    ///< orthogonalizer
};

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_KRYLOVBASIS_HPP
