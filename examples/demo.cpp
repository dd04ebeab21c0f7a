///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*

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

*/

// This file contains an example of solving a 1D convection-diffusion problem
// with the flexible QMR-IDR(s) solver, where the operator is matrix free and
// the preconditioner is a callable.
// Usage: demo [n] [s]

#include <cstdlib>
#include <string>

#include "QMRIDR.hpp"

using solver_t = qmridr::ksp::FQMRIDR<double>;
using array_t  = qmridr::Array<double>;

// -u''+c*u'=f with central differences, Dirichlet boundary
struct ConvDiff {
  std::size_t n;
  double      h, c;

  void operator()(const array_t &x, array_t &y) const {
    const double dl = -1.0 / (h * h) - 0.5 * c / h,
                 dr = -1.0 / (h * h) + 0.5 * c / h, dd = 2.0 / (h * h);
    for (std::size_t i(0); i < n; ++i) {
      y[i] = dd * x[i];
      if (i) y[i] += dl * x[i - 1];
      if (i + 1 < n) y[i] += dr * x[i + 1];
    }
  }
};

int main(int argc, char *argv[]) {
  const std::size_t n = argc > 1 ? std::atoi(argv[1]) : 200;
  const int         s = argc > 2 ? std::atoi(argv[2]) : 4;
  qmridr_error_if(n < 2u, "invalid system size %zd", n);

  const ConvDiff A{n, 1.0 / (n + 1), 20.0};
  array_t        b(n, 1.0), x(n);

  auto opts  = qmridr::get_default_options();
  opts.s     = s;
  opts.rtol  = 1e-10;
  opts.maxit = 10 * n;
  qmridr_info("%s", qmridr::opt_repr(opts).c_str());

  solver_t solver(opts);
  // Jacobi
  const double diag = 2.0 / (A.h * A.h);
  solver.set_M_func([=](const array_t &v, array_t &vhat) {
    for (std::size_t i(0); i < v.size(); ++i) vhat[i] = v[i] / diag;
  });

  const auto info = solver.solve(A, b, x);
  qmridr_info("\n%s after %zd iterations",
              qmridr::ksp::flag_repr(solver_t::repr(), info.first).c_str(),
              info.second);

  // check the true residual
  array_t r(n);
  A(x, r);
  for (std::size_t i(0); i < n; ++i) r[i] = b[i] - r[i];
  const double err = qmridr::norm2(r) / qmridr::norm2(b);
  qmridr_info("relative residual is %g, estimate is %g", err,
              solver.resids().back() / solver.resids().front());
  qmridr_warning_if(err >= 1e-8, "residual is too large!");

  return info.first == qmridr::ksp::SUCCESS ? 0 : 1;
}
