///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/Orthogonalizer.hpp
 * \brief Gram-Schmidt orthogonalization strategies

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

#ifndef _QMRIDR_KSP_ORTHOGONALIZER_HPP
#define _QMRIDR_KSP_ORTHOGONALIZER_HPP

#include <algorithm>
#include <cmath>

#include "qmridr/Options.h"
#include "qmridr/ds/Array.hpp"
#include "qmridr/small_scale/lapack.hpp"
#include "qmridr/utils/common.hpp"
#include "qmridr/utils/math.hpp"

namespace qmridr {
namespace ksp {

/// \class Orthogonalizer
/// \brief orthogonalize a vector against a set of orthonormal columns
/// \tparam ValueType value type, e.g., \a double
/// \ingroup ksp
///
/// Three methods are supported: classical Gram-Schmidt (\ref ORTH_CGS),
/// modified Gram-Schmidt (\ref ORTH_MGS), and repeated classical Gram-Schmidt
/// (\ref ORTH_RCGS). For the latter, CGS passes are repeated until either
/// \f$\Vert\mathbf{g}\Vert<\Vert\Delta\mathbf{h}\Vert/\sqrt{2}\f$ or
/// \f$\Vert\Delta\mathbf{h}\Vert<\mathrm{tol}\Vert\mathbf{g}\Vert\f$,
/// or the maximum number of passes is reached.
template <class ValueType>
class Orthogonalizer {
 public:
  typedef ValueType                                       value_type;
  typedef Array<value_type>                               array_type;
  typedef typename array_type::size_type                  size_type;
  typedef typename ValueTypeTrait<value_type>::value_type scalar_type;
  typedef Lapack<value_type>                              lapack_kernel;
  typedef typename lapack_kernel::int_type                int_type;

  int         method;      ///< orthogonalization method
  scalar_type tol;         ///< stopping tolerance of repeated passes
  int         max_repeat;  ///< maximum passes of repeated CGS

  Orthogonalizer()
      : method(ORTH_MGS), tol(Const<scalar_type>::EPS), max_repeat(3) {}

  /// \brief constructor with parameters
  /// \param[in] mthd method, see \ref ORTH_CGS, \ref ORTH_MGS, and
  ///            \ref ORTH_RCGS
  /// \param[in] tl tolerance of repeated passes
  /// \param[in] max_rep maximum number of passes
  Orthogonalizer(const int mthd, const scalar_type tl, const int max_rep)
      : method(mthd), tol(tl), max_repeat(max_rep) {}

  /// \brief get the method name
  inline const char *repr() const {
    switch (method) {
      case ORTH_CGS:
        return "CGS";
      case ORTH_RCGS:
        return "RCGS";
      default:
        return "MGS";
    }
  }

  /// \brief allocate workspace for at most \a max_cols columns
  inline void init(const size_type max_cols) { _upd.resize(max_cols); }

  /// \brief orthogonalize \a g against the first \a k columns of \a Q
  /// \param[in] n length of vectors
  /// \param[in] k number of columns of \a Q
  /// \param[in] Q column major orthonormal columns with leading dimension \a n
  /// \param[in,out] g vector to be orthogonalized
  /// \param[out] h coefficients, i.e., \f$\mathbf{Q}^H\mathbf{g}\f$
  /// \return the 2-norm of \a g upon output (not normalized)
  inline scalar_type orthogonalize(const size_type n, const size_type k,
                                   const value_type *Q, value_type *g,
                                   value_type *h) const {
    if (!k) return norm2(n, g);
    switch (method) {
      case ORTH_CGS:
        return _cgs(n, k, Q, g, h);
      case ORTH_RCGS:
        return _rcgs(n, k, Q, g, h);
      default:
        return _mgs(n, k, Q, g, h);
    }
  }

 protected:
  mutable array_type _upd;  ///< coefficient updates of repeated passes

 protected:
  inline static scalar_type _cgs(const size_type n, const size_type k,
                                 const value_type *Q, value_type *g,
                                 value_type *h) {
    lapack_kernel::gemv('C', int_type(n), int_type(k), value_type(1), Q,
                        int_type(n), g, value_type(0), h);
    lapack_kernel::gemv('N', int_type(n), int_type(k), value_type(-1), Q,
                        int_type(n), h, value_type(1), g);
    return norm2(n, g);
  }

  inline static scalar_type _mgs(const size_type n, const size_type k,
                                 const value_type *Q, value_type *g,
                                 value_type *h) {
    for (size_type l(0); l < k; ++l) {
      const value_type *q = Q + l * n;
      h[l]                = inner(n, q, g);
      axpy(n, -h[l], q, g);
    }
    return norm2(n, g);
  }

  inline scalar_type _rcgs(const size_type n, const size_type k,
                           const value_type *Q, value_type *g,
                           value_type *h) const {
    const static scalar_type one = scalar_type(1) / std::sqrt(scalar_type(2));

    scalar_type norm_g = _cgs(n, k, Q, g, h);
    if (max_repeat <= 1) return norm_g;
    qmridr_error_if(_upd.size() < k, "workspace (%zd) is too small for %zd",
                    _upd.size(), k);
    std::copy_n(h, k, _upd.begin());
    for (int rep(2); rep <= max_repeat; ++rep) {
      const scalar_type norm_h = norm2(k, _upd.data());
      if (norm_g < one * norm_h || norm_h < tol * norm_g) break;
      norm_g = _cgs(n, k, Q, g, _upd.data());
      axpy(k, value_type(1), _upd.data(), h);
    }
    return norm_g;
  }
};

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_ORTHOGONALIZER_HPP
