///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/common.hpp
 * \brief Common interface and helpers for the Krylov subspace solver

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

#ifndef _QMRIDR_KSP_COMMON_HPP
#define _QMRIDR_KSP_COMMON_HPP

#include <cmath>
#include <cstddef>
#include <string>

#include "qmridr/utils/common.hpp"

namespace qmridr {
namespace ksp {

/*!
 * \addtogroup ksp
 * @{
 */

/// \brief flags for returned information
enum {
  INVALID_ARGS  = -2,  ///< invalid function arguments
  M_SOLVE_ERROR = -1,  ///< preconditioner solve error
  SUCCESS       = 0,   ///< successful converged
  DIVERGED      = 1,   ///< iteration diverged
  STAGNATED     = 2,   ///< iteration stagnated
  BREAK_DOWN    = 3,   ///< solver break down
};

/// \brief get flag representation
/// \param[in] solver solver name
/// \param[in] flag solver returned flag
inline std::string flag_repr(const std::string &solver, const int flag) {
  switch (flag) {
    case INVALID_ARGS:
      return solver + "_" + "INVALID_ARGS";
    case M_SOLVE_ERROR:
      return solver + "_" + "M_SOLVE_ERROR";
    case SUCCESS:
      return solver + "_" + "SUCCESS";
    case DIVERGED:
      return solver + "_" + "DIVERGED";
    case STAGNATED:
      return solver + "_" + "STAGNATED";
    case BREAK_DOWN:
      return solver + "_" + "BREAK_DOWN";
    default:
      return solver + "_" + "UNKNOWN";
  }
}

/// \class DefaultSettings
/// \tparam V value type
/// \brief parameters for default setting
template <class V>
class DefaultSettings {
 public:
  using scalar_type = typename ValueTypeTrait<V>::value_type;  ///< scalar

  /// \brief default relative tolerance, i.e. square root of machine epsilon
  inline static scalar_type rtol() {
    return std::sqrt(Const<scalar_type>::EPS);
  }

  /// \brief default tolerance of repeated (skew) orthogonalization passes
  inline static scalar_type orth_tol() { return Const<scalar_type>::EPS; }

  static constexpr int    s           = 8;    ///< IDR subspace dimension
  static constexpr double kappa       = 0.7;  ///< angle safeguard
  static constexpr double resid_slack = 10.0;  ///< true vs. estimated residual
  static constexpr int    orth_repeat = 3;    ///< repeated CGS passes
};

#ifndef DOXYGEN_SHOULD_SKIP_THIS
template <class V>
constexpr int DefaultSettings<V>::s;
template <class V>
constexpr double DefaultSettings<V>::kappa;
template <class V>
constexpr double DefaultSettings<V>::resid_slack;
template <class V>
constexpr int DefaultSettings<V>::orth_repeat;
#endif  // DOXYGEN_SHOULD_SKIP_THIS

/*!
 * @}
 */

namespace internal {

/// \brief call the \a multiply member if the operator has one
template <class Operator, class ArrayType>
inline auto multiply(const Operator &A, const ArrayType &x, ArrayType &y,
                     int) -> decltype(A.multiply(x, y), void()) {
  A.multiply(x, y);
}

/// \brief otherwise treat the operator as a callable
template <class Operator, class ArrayType>
inline void multiply(const Operator &A, const ArrayType &x, ArrayType &y,
                     long) {
  A(x, y);
}

}  // namespace internal

/// \brief compute \f$\mathbf{y}=\mathbf{Ax}\f$ for a generic operator
/// \tparam Operator either a type with member \a multiply(x,y), e.g.
///         \ref DenseMatrix, or a callable with signature \a A(x,y)
/// \tparam ArrayType array type, see \ref Array
/// \param[in] A operator
/// \param[in] x input array
/// \param[out] y output array
/// \ingroup ksp
template <class Operator, class ArrayType>
inline void apply_operator(const Operator &A, const ArrayType &x,
                           ArrayType &y) {
  internal::multiply(A, x, y, 0);
}

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_COMMON_HPP
