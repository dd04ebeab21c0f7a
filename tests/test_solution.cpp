///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/ksp/Solution.hpp"

#include <gtest/gtest.h>

using namespace qmridr;

TEST(SOLUTION, update) {
  const int              n = 5;
  ksp::Solution<double>  sol;
  sol.init(2.0, 0.5, 10);
  ASSERT_EQ(sol.resids().size(), 1u);
  ASSERT_EQ(sol.resid(), 2.0);
  ASSERT_EQ(sol.rho0(), 2.0);
  Array<double> x(n, 1.0), w(n, 2.0);
  sol.update(x, 0.5, -0.25, w.data(), 0);
  for (const auto v : x) ASSERT_EQ(v, 2.0);
  ASSERT_EQ(sol.resid(), 0.25);
  // estimate carries sqrt(j+1)
  sol.update(x, 0.0, 0.5, w.data(), 3);
  ASSERT_EQ(sol.resid(), 1.0);
  ASSERT_EQ(sol.resids().size(), 3u);
}

TEST(SOLUTION, strict_convergence) {
  ksp::Solution<double> sol;
  sol.init(1.0, 0.5, 4);
  Array<double> x(1, 0.0), w(1, 0.0);
  // equal to the threshold is not converged
  sol.update(x, 0.0, 0.5, w.data(), 0);
  ASSERT_FALSE(sol.is_converged());
  sol.update(x, 0.0, 0.499, w.data(), 0);
  ASSERT_TRUE(sol.is_converged());
}
