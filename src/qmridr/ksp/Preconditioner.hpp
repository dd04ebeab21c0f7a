///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/Preconditioner.hpp
 * \brief Right preconditioner strategies for flexible Krylov solvers

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

#ifndef _QMRIDR_KSP_PRECONDITIONER_HPP
#define _QMRIDR_KSP_PRECONDITIONER_HPP

#include <algorithm>
#include <functional>
#include <memory>

#include "qmridr/ds/Array.hpp"
#include "qmridr/utils/log.hpp"

namespace qmridr {
namespace ksp {

/*!
 * \addtogroup ksp
 * @{
 */

/// \brief preconditioner kinds
enum {
  PRECOND_IDENTITY = 0,  ///< no preconditioning, i.e. copy
  PRECOND_SOLVER   = 1,  ///< an operator with member \a solve(v,vhat)
  PRECOND_FUNCTION = 2,  ///< a user callable \a P(v,vhat)
};

/// \class Preconditioner
/// \brief computing \f$\hat{\mathbf{v}}=\mathbf{P}^{-1}\mathbf{v}\f$
/// \tparam ValueType value type, e.g., \a double
///
/// The strategy is chosen once, i.e., at construction. Because the solver
/// is flexible, the callable is allowed to change from call to call, e.g.,
/// an inner iterative solver with varying accuracy.
template <class ValueType>
class Preconditioner {
 public:
  typedef ValueType         value_type;  ///< value type
  typedef Array<value_type> array_type;  ///< array type
  typedef std::function<void(const array_type &, array_type &)> func_type;
  ///< callable type

  /// \brief default is identity
  Preconditioner() : _kind(PRECOND_IDENTITY) {}

  /// \brief create from an operator owning \a solve(v,vhat)
  /// \tparam MType operator type
  /// \param[in] M shared operator
  template <class MType>
  inline static Preconditioner from_solver(std::shared_ptr<MType> M) {
    qmridr_error_if(!M, "empty preconditioner operator");
    Preconditioner P;
    P._kind = PRECOND_SOLVER;
    P._func = [M](const array_type &v, array_type &vhat) { M->solve(v, vhat); };
    return P;
  }

  /// \brief create from a callable
  /// \param[in] f callable with signature \a f(v,vhat)
  inline static Preconditioner from_function(const func_type &f) {
    qmridr_error_if(!f, "empty preconditioner function");
    Preconditioner P;
    P._kind = PRECOND_FUNCTION;
    P._func = f;
    return P;
  }

  /// \brief get the strategy, see the enumerators above
  inline int kind() const { return _kind; }

  /// \brief get a string representation of the strategy
  inline const char *repr() const {
    switch (_kind) {
      case PRECOND_SOLVER:
        return "solver";
      case PRECOND_FUNCTION:
        return "function";
      default:
        return "identity";
    }
  }

  /// \brief apply the preconditioner
  /// \param[in] v input array
  /// \param[out] vhat output array
  inline void apply(const array_type &v, array_type &vhat) const {
    qmridr_assert(v.size() == vhat.size(), "unmatched sizes");
    switch (_kind) {
      case PRECOND_SOLVER:
      case PRECOND_FUNCTION:
        _func(v, vhat);
        break;
      default:
        std::copy(v.cbegin(), v.cend(), vhat.begin());
    }
  }

 protected:
  int       _kind;  ///< strategy tag
  func_type _func;  ///< type-erased solve or callable
};

/*!
 * @}
 */

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_PRECONDITIONER_HPP
