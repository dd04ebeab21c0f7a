///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/BandedHessenberg.hpp
 * \brief QR updates of the banded Hessenberg matrix with Givens rotations

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

#ifndef _QMRIDR_KSP_BANDEDHESSENBERG_HPP
#define _QMRIDR_KSP_BANDEDHESSENBERG_HPP

#include <algorithm>
#include <cmath>

#include "qmridr/ds/Array.hpp"
#include "qmridr/utils/common.hpp"
#include "qmridr/utils/math.hpp"

namespace qmridr {
namespace ksp {

/// \class BandedHessenberg
/// \brief incremental QR factorization of an upper Hessenberg matrix with
///        upper bandwidth \a s+1
/// \tparam ValueType value type, e.g., \a double
/// \ingroup ksp
///
/// Each new column has \a s+3 entries, i.e., \a s+2 entries in the band plus
/// the subdiagonal. Only the last \a s+1 Givens rotations affect a new column,
/// therefore they are kept in a circular history. The right-hand side of the
/// least-squares problem, \f$\rho_0\mathbf{e}_1\f$, is rotated along with
/// the columns, giving the solution update coefficient \f$\phi\f$ and the
/// quasi-residual \f$\hat{\phi}\f$.
template <class ValueType>
class BandedHessenberg {
 public:
  typedef ValueType                                       value_type;
  typedef Array<value_type>                               array_type;
  typedef typename array_type::size_type                  size_type;
  typedef typename ValueTypeTrait<value_type>::value_type scalar_type;

  BandedHessenberg() : _s(0), _head(0), _phi(0), _phihat(0) {}

  /// \brief initialize with identity rotations
  /// \param[in] s IDR subspace dimension
  /// \param[in] rho0 initial residual norm
  inline void init(const size_type s, const scalar_type rho0) {
    _s = s;
    _cos.resize(s + 1);
    _sin.resize(s + 1);
    std::fill(_cos.begin(), _cos.end(), scalar_type(1));
    std::fill(_sin.begin(), _sin.end(), value_type(0));
    _head   = 0;
    _phi    = value_type(0);
    _phihat = value_type(rho0);
  }

  /// \brief add a new column
  /// \param[in,out] r column of length \a s+3, upper triangular on output
  inline void add_column(array_type &r) {
    qmridr_assert(r.size() == _s + 3, "column size must be s+3");
    const size_type nrots = _s + 1;

    // apply the previous rotations, oldest first
    for (size_type l(0); l < nrots; ++l) {
      const size_type   pos = (_head + l) % nrots;
      const scalar_type c   = _cos[pos];
      const value_type  sn  = _sin[pos];
      const value_type  t   = r[l];
      r[l]                  = c * t + sn * r[l + 1];
      r[l + 1]              = -conj(sn) * t + c * r[l + 1];
    }

    // new rotation annihilating the subdiagonal
    const value_type a = r[_s + 1], b = r[_s + 2];
    scalar_type      c;
    value_type       sn;
    if (abs(a) < Const<scalar_type>::EPS) {
      sn        = value_type(1);
      c         = scalar_type(0);
      r[_s + 1] = b;
    } else {
      const scalar_type t     = abs(a) + abs(b);
      const scalar_type rho   = t * std::sqrt(abs2(a / t) + abs2(b / t));
      const value_type  alpha = a / abs(a);
      sn                      = alpha * conj(b) / rho;
      c                       = abs(a) / rho;
      r[_s + 1]               = alpha * rho;
    }
    r[_s + 2] = value_type(0);

    // overwrite the oldest one
    _cos[_head] = c;
    _sin[_head] = sn;
    _head       = (_head + 1) % nrots;

    _phi    = c * _phihat;
    _phihat = -conj(sn) * _phihat;
  }

  /// \brief coefficient of the latest correction vector
  inline value_type phi() const { return _phi; }

  /// \brief quasi-residual
  inline value_type phihat() const { return _phihat; }

 protected:
  size_type          _s;       ///< IDR subspace dimension
  Array<scalar_type> _cos;     ///< cosines
  array_type         _sin;     ///< sines
  size_type          _head;    ///< position of the oldest rotation
  value_type         _phi;     ///< solution update coefficient
  value_type         _phihat;  ///< quasi-residual
};

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_BANDEDHESSENBERG_HPP
