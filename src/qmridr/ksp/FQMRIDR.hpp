///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ksp/FQMRIDR.hpp
 * \brief Flexible IDR(s) with quasi-minimal residual recursion

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

#ifndef _QMRIDR_KSP_FQMRIDR_HPP
#define _QMRIDR_KSP_FQMRIDR_HPP

#include <algorithm>
#include <cmath>
#include <memory>
#include <type_traits>
#include <utility>

#include "qmridr/Options.h"
#include "qmridr/ds/Array.hpp"
#include "qmridr/ds/DenseMatrix.hpp"
#include "qmridr/ksp/BandedHessenberg.hpp"
#include "qmridr/ksp/KrylovBasis.hpp"
#include "qmridr/ksp/Orthogonalizer.hpp"
#include "qmridr/ksp/Preconditioner.hpp"
#include "qmridr/ksp/ShadowProjector.hpp"
#include "qmridr/ksp/Solution.hpp"
#include "qmridr/ksp/common.hpp"
#include "qmridr/utils/common.hpp"
#include "qmridr/utils/log.hpp"
#include "qmridr/utils/math.hpp"

namespace qmridr {
namespace ksp {

/// \class FQMRIDR
/// \brief flexible IDR(s) with QMR recursion
/// \tparam ValueType value type, e.g., \a double or \a std::complex<double>
/// \ingroup ksp
///
/// The method iteratively builds the generalized Hessenberg decomposition
/// \f$\mathbf{AGU}=\mathbf{GH}\f$ and minimizes the upper bound
/// \f$\Vert\mathbf{b}-\mathbf{Ax}\Vert\le\sqrt{j+1}
/// \Vert\rho_0\mathbf{e}_1-\mathbf{H}\boldsymbol{\phi}\Vert\f$. See
/// M. B. van Gijzen, G. L. G. Sleijpen, and J.-P. M. Zemke, "Flexible and
/// multi-shift induced dimension reduction algorithms for solving large
/// sparse linear systems," Numer. Linear Algebra Appl., 22(1), 2015.
///
/// \code{.cpp}
/// qmridr::ksp::FQMRIDR<double> solver;
/// solver.s    = 4;
/// solver.rtol = 1e-10;
/// const auto info = solver.solve(A, b, x);  // A is a DenseMatrix
/// \endcode
template <class ValueType = double>
class FQMRIDR {
 public:
  typedef ValueType                                       value_type;
  typedef Array<value_type>                               array_type;
  typedef typename array_type::size_type                  size_type;
  typedef typename ValueTypeTrait<value_type>::value_type scalar_type;
  typedef DenseMatrix<value_type>                         mat_type;
  typedef Preconditioner<value_type>                      precond_type;
  typedef typename precond_type::func_type                func_type;
  typedef Array<scalar_type>                              resid_array;

  static_assert(std::is_floating_point<scalar_type>::value,
                "must be floating point type");

  /// \brief get the solver name
  inline static const char *repr() { return "FQMRIDR"; }

  int         s;            ///< IDR subspace dimension
  int         proj_dim;     ///< shadow space dimension, 0 for \a s
  scalar_type rtol;         ///< relative tolerance, 0 for sqrt(eps)
  size_type   maxit;        ///< maximum iterations, 0 for system size
  scalar_type kappa;        ///< angle safeguard
  int         orth;         ///< orthogonalization method
  scalar_type orth_tol;     ///< tolerance of repeated passes, 0 for eps
  int         orth_repeat;  ///< maximum passes of repeated CGS
  int         skew_repeat;  ///< maximum passes of the skew projection
  bool        orth_search;  ///< orthogonalize search vectors against R0
  int         seed;         ///< seed of the random shadow space
  int         verbose;      ///< verbose flag, see \ref VERBOSE_INFO

  /// \brief default constructor with \ref get_default_options
  FQMRIDR() { set_options(get_default_options()); }

  /// \brief constructor with options
  /// \param[in] opts control parameters, see \ref Options
  explicit FQMRIDR(const Options &opts) { set_options(opts); }

  /// \brief assign control parameters
  /// \param[in] opts control parameters, see \ref Options
  inline void set_options(const Options &opts) {
    s           = opts.s;
    proj_dim    = opts.proj_dim;
    rtol        = opts.rtol;
    maxit       = opts.maxit > 0 ? opts.maxit : 0;
    kappa       = opts.kappa;
    orth        = opts.orth;
    orth_tol    = opts.orth_tol;
    orth_repeat = opts.orth_repeat;
    skew_repeat = opts.skew_repeat;
    orth_search = opts.orth_search;
    seed        = opts.seed;
    verbose     = opts.verbose;
  }

  /// \brief set a user shadow space of size \a n by \a proj_dim
  /// \param[in] R0 shadow space, deep copied
  inline void set_R0(const mat_type &R0) { _R0 = R0; }

  /// \brief use random shadow spaces
  inline void clear_R0() { _R0 = mat_type(); }

  /// \brief set an operator with member \a solve(v,vhat) as preconditioner
  /// \tparam MType operator type
  /// \param[in] M preconditioner, the reference counter is incremented
  template <class MType>
  inline void set_M(std::shared_ptr<MType> M) {
    _P = precond_type::from_solver(M);
  }

  /// \brief set a callable \a f(v,vhat) as (flexible) preconditioner
  inline void set_M_func(const func_type &f) {
    _P = precond_type::from_function(f);
  }

  /// \brief remove preconditioner
  inline void clear_M() { _P = precond_type(); }

  /// \brief get residual estimate history, starting with the initial
  ///        residual norm
  inline const resid_array &resids() const { return _sol.resids(); }

  /// \brief solve for solution
  /// \tparam Operator user operator, either with member \a multiply(x,y),
  ///         e.g., \ref DenseMatrix, or a callable \a A(x,y)
  /// \param[in] A user operator
  /// \param[in] b right-hand side vector
  /// \param[in,out] x solution
  /// \param[in] with_init_guess if \a false (default), then assign zero to
  ///             \a x as starting values
  /// \param[in] verbose if \a true (default), enable verbose printing
  /// \return flag (see \ref SUCCESS) and the number of iterations
  template <class Operator>
  inline std::pair<int, size_type> solve(const Operator &  A,
                                         const array_type &b, array_type &x,
                                         const bool with_init_guess = false,
                                         const bool verbose = true) {
    const static qmridr::internal::StdoutStruct       Cout;
    const static qmridr::internal::StderrStruct       Cerr;
    const static qmridr::internal::DummyStreamer      Dummy_streamer;
    const static qmridr::internal::DummyErrorStreamer Dummy_cerr;

    const bool show = verbose && qmridr_verbose2(INFO, this->verbose);
    if (b.size() != x.size()) {
      if (show)
        Cerr(__QMRIDR_FILE__, __QMRIDR_FUNC__, __LINE__,
             "Unmatched sizes between b (%zd) and x (%zd).", b.size(),
             x.size());
      return std::make_pair((int)INVALID_ARGS, size_type(0));
    }
    _validate(b.size());
    if (show) {
      _show(b.size(), with_init_guess);
      if (orth_search && _P.kind() == PRECOND_IDENTITY)
        qmridr_warning(
            "orth_search without preconditioner keeps x-x0 orthogonal to "
            "R0, the system is in general not solvable in that space.");
      qmridr_info("Calling %s kernel...", repr());
    }
    return show ? _solve(A, b, with_init_guess, x, Cout, Cerr)
                : _solve(A, b, with_init_guess, x, Dummy_streamer, Dummy_cerr);
  }

 protected:
  precond_type                 _P;      ///< preconditioner
  mat_type                     _R0;     ///< user shadow space
  KrylovBasis<value_type>      _basis;  ///< Krylov basis
  ShadowProjector<value_type>  _proj;   ///< projector
  BandedHessenberg<value_type> _hes;    ///< QR of Hessenberg
  Solution<value_type>         _sol;    ///< solution updater
  array_type                   _r0;     ///< initial residual

 protected:
  /// \brief shadow space dimension after defaults
  inline size_type _pd() const {
    return size_type(proj_dim > 0 ? proj_dim : s);
  }

  /// \brief check control parameters, raise errors on invalid ones
  /// \param[in] n system size
  inline void _validate(const size_type n) const {
    qmridr_error_if(s <= 0, "IDR subspace dimension must be positive, got %d",
                    s);
    const size_type pd = _pd();
    qmridr_error_if(pd > size_type(s),
                    "shadow space dimension %zd may not exceed s (%d)", pd, s);
    qmridr_error_if(pd > n,
                    "shadow space dimension %zd exceeds system size %zd", pd,
                    n);
    if (!_R0.empty())
      qmridr_error_if(_R0.nrows() != n || _R0.ncols() != pd,
                      "R0 must be of size (%zd,%zd), got (%zd,%zd)", n, pd,
                      _R0.nrows(), _R0.ncols());
  }

  /// \brief show information
  inline void _show(const size_type n, const bool with_init_guess) const {
    qmridr_info(
        "- %s -\n"
        "n=%zd\n"
        "s=%d\n"
        "proj_dim=%zd\n"
        "rtol=%g\n"
        "maxit=%zd\n"
        "kappa=%g\n"
        "orth: %s\n"
        "orth_search: %s\n"
        "skew_repeat=%d\n"
        "shadow-space: %s\n"
        "preconditioner: %s\n"
        "init-guess: %s\n",
        repr(), n, s, _pd(),
        (double)(rtol > 0 ? rtol : DefaultSettings<value_type>::rtol()),
        maxit ? maxit : n, (double)kappa,
        Orthogonalizer<value_type>(orth, orth_tol, orth_repeat).repr(),
        (orth_search ? "yes" : "no"), skew_repeat,
        (_R0.empty() ? "random" : "user"), _P.repr(),
        (with_init_guess ? "yes" : "no"));
  }

  /// \brief low level solve kernel
  /// \tparam Operator user operator type
  /// \tparam StreamerCout cout streamer type
  /// \tparam StreamerCerr cerr streamer type
  /// \param[in] A user operator
  /// \param[in] b right hard size
  /// \param[in] with_init_guess flag to indicate \a x is the starting value
  /// \param[in,out] x initial guess and solution on output
  /// \param[in] Cout "stdout" streamer
  /// \param[in] Cerr "stderr" streamer
  template <class Operator, class StreamerCout, class StreamerCerr>
  std::pair<int, size_type> _solve(const Operator &A, const array_type &b,
                                   const bool with_init_guess, array_type &x,
                                   const StreamerCout &Cout,
                                   const StreamerCerr &Cerr) {
    const size_type   n  = b.size();
    const size_type   ss = s;
    const size_type   pd = _pd();
    const scalar_type tol =
        rtol > 0 ? rtol : DefaultSettings<value_type>::rtol();
    const size_type   max_its = maxit ? maxit : n;
    const scalar_type otol =
        orth_tol > 0 ? orth_tol : DefaultSettings<value_type>::orth_tol();

    // initial residual
    _r0.resize(n);
    if (with_init_guess) {
      apply_operator(A, x, _r0);
      for (size_type i(0); i < n; ++i) _r0[i] = b[i] - _r0[i];
    } else {
      std::fill(x.begin(), x.end(), value_type(0));
      std::copy(b.cbegin(), b.cend(), _r0.begin());
    }
    const scalar_type rho0 = norm2(_r0);
    _sol.init(rho0, tol, max_its);
    if (rho0 == 0) return std::make_pair((int)SUCCESS, size_type(0));
    if (!std::isfinite(rho0)) {
      Cerr(__QMRIDR_FILE__, __QMRIDR_FUNC__, __LINE__,
           "Non-finite initial residual norm.");
      return std::make_pair((int)BREAK_DOWN, size_type(0));
    }
    scale(n, scalar_type(1) / rho0, _r0.data());

    const Orthogonalizer<value_type> orthogonalizer(orth, otol,
                                                    std::max(orth_repeat, 1));
    _basis.init(_r0, ss, orthogonalizer);
    _hes.init(ss, rho0);
    _proj.init(n, ss, pd, kappa, orth_search, std::max(skew_repeat, 1), otol,
               _R0.empty() ? nullptr : &_R0, seed);
    // the Gram matrix is ready after setup if s==1
    _proj.update(_basis);

    size_type iter(0);
    for (;;) {
      for (size_type k(1); k <= ss + 1; ++k) {
        ++iter;
        _proj.apply(_basis);
        _basis.expand(A, _P, _proj);
        if (k == ss + 1) _proj.next_idr_space(_basis);
        _basis.map_to_idr_space(_proj);
        _basis.orthogonalize(k);
        _basis.update_hessenberg(_proj, _hes);
        _basis.update_W(k, iter);
        _proj.update(_basis);
        _sol.update(x, _hes.phi(), _hes.phihat(), _basis.w_latest(),
                    _proj.j());
        const scalar_type resid = _sol.resid() / rho0;
        Cout("  At iteration %zd, relative residual estimate is %g.", iter,
             (double)resid);
        if (!std::isfinite(resid)) {
          Cerr(__QMRIDR_FILE__, __QMRIDR_FUNC__, __LINE__,
               "Solver break-down detected at iteration %zd.", iter);
          return std::make_pair((int)BREAK_DOWN, iter);
        }
        if (_sol.is_converged()) {
          // the estimate is only a bound while the IDR spaces are not
          // exhausted, confirm with the true residual
          apply_operator(A, x, _r0);
          for (size_type i(0); i < n; ++i) _r0[i] = b[i] - _r0[i];
          const scalar_type true_resid = norm2(_r0) / rho0;
          if (true_resid <=
              std::max(scalar_type(DefaultSettings<value_type>::resid_slack) *
                           tol,
                       DefaultSettings<value_type>::rtol()))
            return std::make_pair((int)SUCCESS, iter);
          Cerr(__QMRIDR_FILE__, __QMRIDR_FUNC__, __LINE__,
               "True relative residual %g does not match the estimate %g at "
               "iteration %zd.",
               (double)true_resid, (double)resid, iter);
          return std::make_pair((int)BREAK_DOWN, iter);
        }
        if (iter >= max_its) {
          Cerr(__QMRIDR_FILE__, __QMRIDR_FUNC__, __LINE__,
               "Reached maxit iteration limit %zd.", max_its);
          return std::make_pair((int)DIVERGED, iter);
        }
      }
    }
  }
};

}  // namespace ksp
}  // namespace qmridr

#endif  // _QMRIDR_KSP_FQMRIDR_HPP
