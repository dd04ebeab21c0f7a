///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/ShadowProjector.hpp
 * \brief Oblique projection onto the complement of the shadow space

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

#ifndef _QMRIDR_KSP_SHADOWPROJECTOR_HPP
#define _QMRIDR_KSP_SHADOWPROJECTOR_HPP

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <random>

#include "qmridr/ds/Array.hpp"
#include "qmridr/ds/DenseMatrix.hpp"
#include "qmridr/small_scale/LUP.hpp"
#include "qmridr/small_scale/lapack.hpp"
#include "qmridr/utils/common.hpp"
#include "qmridr/utils/log.hpp"
#include "qmridr/utils/math.hpp"

namespace qmridr {
namespace ksp {
namespace internal {

// uniform random entries in [0,1)
template <class T, class Engine, class Dist>
inline void random_value(Engine &eng, Dist &dist, T &v) {
  v = dist(eng);
}

// both real and imaginary parts are random
template <class T, class Engine, class Dist>
inline void random_value(Engine &eng, Dist &dist, std::complex<T> &v) {
  const T re = dist(eng);
  v          = std::complex<T>(re, dist(eng));
}

}  // namespace internal

/// \class ShadowProjector
/// \brief maps \f$\mathbf{v}\f$ to
///        \f$\mathbf{v}-\mathbf{G}(\mathbf{R}_0^H\mathbf{G})^{-1}
///        \mathbf{R}_0^H\mathbf{v}\f$
/// \tparam ValueType value type, e.g., \a double
/// \ingroup ksp
///
/// The active columns of \f$\mathbf{G}\f$ are the \a proj_dim slots before
/// the latest one in the circular basis buffer, thus the window may wrap
/// around the end of the buffer. The Gram matrix
/// \f$\mathbf{M}=\mathbf{R}_0^H\mathbf{G}\f$ is never rebuilt during the
/// iterations. Instead, the column of the oldest slot is replaced with that
/// of the newest one (see \ref LUP::replace_column). The map \a _g2m keeps
/// track of which column of \f$\mathbf{M}\f$ belongs to which slot.
template <class ValueType>
class ShadowProjector {
 public:
  typedef ValueType                                       value_type;
  typedef Array<value_type>                               array_type;
  typedef typename array_type::size_type                  size_type;
  typedef typename ValueTypeTrait<value_type>::value_type scalar_type;
  typedef DenseMatrix<value_type>                         mat_type;
  typedef LUP<value_type>                                 lu_type;
  typedef Lapack<value_type>                              lapack_kernel;
  typedef typename lapack_kernel::int_type                int_type;

  /// \brief flag of slots that are not in the window
  constexpr static size_type npos = static_cast<size_type>(-1);

  ShadowProjector()
      : _n(0),
        _s(0),
        _pd(0),
        _j(0),
        _mu(0),
        _omega(0),
        _kappa(0.7),
        _orth_search(false),
        _skew_repeat(1),
        _skew_tol(Const<scalar_type>::EPS),
        _latest(0),
        _oldest(0),
        _initialized(false) {}

  /// \brief initialize the projector
  /// \param[in] n system size
  /// \param[in] s IDR subspace dimension
  /// \param[in] pd shadow space dimension
  /// \param[in] kappa angle safeguard
  /// \param[in] orth_search orthogonalize search vectors against \a R0
  /// \param[in] skew_repeat maximum passes of the skew projection
  /// \param[in] skew_tol tolerance of repeated skew projections
  /// \param[in] R0 user shadow space, if \a nullptr, then a random one is
  ///            generated with \a seed
  /// \param[in] seed random seed, negative values use \a std::random_device
  inline void init(const size_type n, const size_type s, const size_type pd,
                   const scalar_type kappa, const bool orth_search,
                   const int skew_repeat, const scalar_type skew_tol,
                   const mat_type *R0, const int seed) {
    qmridr_error_if(pd == 0u || pd > s, "invalid shadow space dimension %zd",
                    pd);
    _n           = n;
    _s           = s;
    _pd          = pd;
    _j           = 0;
    _mu          = value_type(0);
    _omega       = value_type(0);
    _kappa       = kappa;
    _orth_search = orth_search;
    _skew_repeat = skew_repeat;
    _skew_tol    = skew_tol;
    _latest      = 0;
    _oldest      = 0;
    _initialized = false;
    if (R0) {
      qmridr_error_if(R0->nrows() != n || R0->ncols() != pd,
                      "R0 must be of size (%zd,%zd), got (%zd,%zd)", n, pd,
                      R0->nrows(), R0->ncols());
      _R0 = *R0;
    } else
      _random_R0(seed);
    _lu.init(pd);
    _m.resize(pd);
    _alpha.resize(pd);
    _u.resize(pd);
    _m_upd.resize(pd);
    _u_upd.resize(pd);
    _g2m.resize(s + 1);
    std::fill(_g2m.begin(), _g2m.end(), npos);
  }

  /// \brief apply the oblique projection to the latest basis vector
  /// \tparam Basis basis type, see \ref KrylovBasis
  /// \param[in,out] basis Krylov basis, whose \a v is projected in place
  ///
  /// Nothing happens within the first IDR space before the basis buffer
  /// has been filled up.
  template <class Basis>
  inline void apply(Basis &basis) {
    const size_type L = basis.latest();
    if (_j == 0u && L < _s) return;
    qmridr_error_if(!_initialized, "the Gram matrix has not been initialized");

    _latest              = (_latest + 1) % _pd;
    const mat_type &G    = basis.G();
    array_type &    v    = basis.v();
    const size_type O    = _oldest;
    const size_type len1 = O < L ? L - O : _s + 1 - O;
    qmridr_assert(len1 <= _pd, "window length %zd exceeds %zd", len1, _pd);

    // m=R0'*v, alpha=M\m
    lapack_kernel::gemv('C', value_type(1), _R0, v, value_type(0), _m);
    std::copy(_m.cbegin(), _m.cend(), _alpha.begin());
    _lu.solve(_alpha);
    _gather(_alpha, O, len1, _u);
    _subtract(G, O, len1, _u, v);

    if (_skew_repeat > 1) {
      const static scalar_type one =
          scalar_type(1) / std::sqrt(scalar_type(2));
      // the first update is u itself
      std::copy(_u.cbegin(), _u.cend(), _u_upd.begin());
      for (int rep(2); rep <= _skew_repeat; ++rep) {
        const scalar_type norm_v = norm2(v), norm_upd = norm2(_u_upd);
        if (norm_v < one * norm_upd || norm_upd < _skew_tol * norm_v) break;
        lapack_kernel::gemv('C', value_type(1), _R0, v, value_type(0),
                            _m_upd);
        _lu.solve(_m_upd);
        _gather(_m_upd, O, len1, _u_upd);
        _subtract(G, O, len1, _u_upd, v);
        axpy(_pd, value_type(1), _u_upd.data(), _u.data());
      }
    }

    // the latest slot enters the window, the oldest leaves
    _g2m[L] = _latest;
    _g2m[O] = npos;
    _oldest = (O + 1) % (_s + 1);
  }

  /// \brief update the Gram matrix after the basis has been expanded
  /// \tparam Basis basis type, see \ref KrylovBasis
  ///
  /// The Gram matrix is assembled and factorized once the first \a s basis
  /// vectors are available; afterwards, each call replaces one column.
  template <class Basis>
  inline void update(const Basis &basis) {
    if (!_initialized) {
      if (basis.latest() + 1 == _s) _initialize(basis);
    } else if (_j > 0u)
      _lu.replace_column(_latest, _m, _alpha);
  }

  /// \brief enter the next IDR space and compute the shift \f$\mu\f$
  /// \tparam Basis basis type, see \ref KrylovBasis
  ///
  /// \f$\omega\f$ minimizes the residual of the latest unnormalized basis
  /// vector, and it is enlarged if the angle between the vectors is too
  /// small, i.e., \f$\vert\eta\vert<\kappa\f$.
  template <class Basis>
  inline void next_idr_space(const Basis &basis) {
    ++_j;
    const value_type *g   = basis.G().col_begin(basis.latest());
    const array_type &v   = basis.v();
    const value_type  nu  = inner(_n, g, v.data());
    const scalar_type tau = norm2_sq(_n, g);
    _omega                = nu / tau;
    const scalar_type eta = abs(nu) / (std::sqrt(tau) * norm2(v));
    if (eta < _kappa) _omega *= _kappa / eta;
    _mu = abs(_omega) > Const<scalar_type>::EPS ? value_type(1) / _omega
                                                : value_type(1);
  }

  inline size_type         j() const { return _j; }
  inline value_type        mu() const { return _mu; }
  inline value_type        omega() const { return _omega; }
  inline const array_type &u() const { return _u; }
  inline const mat_type &  R0() const { return _R0; }
  inline bool              orth_search() const { return _orth_search; }
  inline size_type         proj_dim() const { return _pd; }
  inline bool              initialized() const { return _initialized; }
  inline const lu_type &   gram() const { return _lu; }

 protected:
  size_type        _n;            ///< system size
  size_type        _s;            ///< IDR subspace dimension
  size_type        _pd;           ///< shadow space dimension
  size_type        _j;            ///< number of IDR spaces
  value_type       _mu;           ///< shift, inverse of omega
  value_type       _omega;        ///< residual minimizing parameter
  scalar_type      _kappa;        ///< angle safeguard
  bool             _orth_search;  ///< orthogonal search vectors
  int              _skew_repeat;  ///< maximum passes
  scalar_type      _skew_tol;     ///< stopping tolerance of repeated passes
  mat_type         _R0;           ///< shadow space
  lu_type          _lu;           ///< Gram matrix and its factorization
  array_type       _m;            ///< R0'*v
  array_type       _alpha;        ///< M\m
  array_type       _u;            ///< alpha in window order
  array_type       _m_upd;        ///< workspace of repeated passes
  array_type       _u_upd;        ///< coefficient updates of repeated passes
  size_type        _latest;       ///< Gram column of the latest slot
  size_type        _oldest;       ///< oldest slot in the window
  Array<size_type> _g2m;          ///< slot to Gram column map
  bool             _initialized;  ///< Gram matrix is ready

 protected:
  /// \brief fill R0 with random values and orthonormalize its columns
  inline void _random_R0(const int seed) {
    _R0.resize(_n, _pd);
    std::mt19937 eng;
    if (seed < 0) {
      std::random_device rd;
      eng.seed(rd());
    } else
      eng.seed(static_cast<std::mt19937::result_type>(seed));
    std::uniform_real_distribution<scalar_type> dist(scalar_type(0),
                                                     scalar_type(1));
    for (auto &v : _R0.array()) internal::random_value(eng, dist, v);
    const auto info = lapack_kernel::orthonormalize(_R0);
    if (info < 0)
      qmridr_error("QR of the shadow space returned negative info %d!",
                   (int)info);
  }

  /// \brief assemble the Gram matrix from slots \a s-pd to \a s-1
  template <class Basis>
  inline void _initialize(const Basis &basis) {
    const mat_type &G     = basis.G();
    const size_type first = _s - _pd;
    auto &          M     = _lu.mat();
    for (size_type i(0); i < _pd; ++i)
      lapack_kernel::gemv('C', int_type(_n), int_type(_pd), value_type(1),
                          _R0.data(), int_type(_n), G.col_begin(first + i),
                          value_type(0), M.col_begin(i));
    _lu.factorize();
    _latest = _pd - 1;
    _oldest = first;
    for (size_type i(0); i < _pd; ++i) _g2m[first + i] = i;
    _initialized = true;
  }

  /// \brief gather Gram coefficients in window order (oldest first)
  inline void _gather(const array_type &a, const size_type O,
                      const size_type len1, array_type &u) const {
    const size_type len2 = _pd - len1;
    for (size_type i(0); i < len1; ++i) u[i] = a[_g2m[O + i]];
    for (size_type i(0); i < len2; ++i) u[len1 + i] = a[_g2m[i]];
  }

  /// \brief v-=G_win*u, where the window may consist of two blocks
  inline void _subtract(const mat_type &G, const size_type O,
                        const size_type len1, const array_type &u,
                        array_type &v) const {
    const size_type len2 = _pd - len1;
    lapack_kernel::gemv('N', int_type(_n), int_type(len1), value_type(-1),
                        G.col_begin(O), int_type(_n), u.data(), value_type(1),
                        v.data());
    if (len2)
      lapack_kernel::gemv('N', int_type(_n), int_type(len2), value_type(-1),
                          G.data(), int_type(_n), u.data() + len1,
                          value_type(1), v.data());
  }
};

#ifndef DOXYGEN_SHOULD_SKIP_THIS
template <class ValueType>
constexpr typename ShadowProjector<ValueType>::size_type
    ShadowProjector<ValueType>::npos;
#endif  // DOXYGEN_SHOULD_SKIP_THIS

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_SHADOWPROJECTOR_HPP
