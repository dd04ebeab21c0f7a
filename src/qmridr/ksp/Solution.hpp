///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/Solution.hpp
 * \brief Solution and residual estimate updates

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

#ifndef _QMRIDR_KSP_SOLUTION_HPP
#define _QMRIDR_KSP_SOLUTION_HPP

#include <cmath>

#include "qmridr/ds/Array.hpp"
#include "qmridr/utils/common.hpp"
#include "qmridr/utils/math.hpp"

namespace qmridr {
namespace ksp {

/// \class Solution
/// \brief accumulate the iterates and the residual estimates
/// \tparam ValueType value type, e.g., \a double
/// \ingroup ksp
///
/// The residual estimate \f$\rho=\vert\hat{\phi}\vert\sqrt{j+1}\f$ is an upper
/// bound of the true residual norm, where \a j is the number of IDR spaces
/// visited so far.
template <class ValueType>
class Solution {
 public:
  typedef ValueType                                       value_type;
  typedef Array<value_type>                               array_type;
  typedef typename array_type::size_type                  size_type;
  typedef typename ValueTypeTrait<value_type>::value_type scalar_type;
  typedef Array<scalar_type>                              resid_array;

  Solution() : _rho0(0), _tol(0) {}

  /// \brief initialize the residual history
  /// \param[in] rho0 initial residual norm
  /// \param[in] tol relative tolerance
  /// \param[in] maxit maximum number of iterations, for reserving history
  inline void init(const scalar_type rho0, const scalar_type tol,
                   const size_type maxit) {
    _rho0 = rho0;
    _tol  = tol;
    _rho.resize(0);
    _rho.reserve(maxit + 1);
    _rho.push_back(rho0);
  }

  /// \brief update the solution
  /// \param[in,out] x current iterate
  /// \param[in] phi update coefficient
  /// \param[in] phihat quasi-residual
  /// \param[in] w latest correction vector
  /// \param[in] j number of IDR spaces visited
  inline void update(array_type &x, const value_type phi,
                     const value_type phihat, const value_type *w,
                     const size_type j) {
    axpy(x.size(), phi, w, x.data());
    _rho.push_back(abs(phihat) * std::sqrt(scalar_type(j + 1)));
  }

  /// \brief check convergence, strict inequality
  inline bool is_converged() const { return _rho.back() < _tol * _rho0; }

  /// \brief latest residual estimate
  inline scalar_type resid() const { return _rho.back(); }

  /// \brief initial residual norm
  inline scalar_type rho0() const { return _rho0; }

  /// \brief full history of residual estimates, starting with \a rho0
  inline const resid_array &resids() const { return _rho; }

 protected:
  resid_array _rho;   ///< residual estimates
  scalar_type _rho0;  ///< initial residual norm
  scalar_type _tol;   ///< relative tolerance
};

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_SOLUTION_HPP
