///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/ksp/BandedHessenberg.hpp"

#include <gtest/gtest.h>

using namespace qmridr;

const static RandRealGen r_rand(-1.0, 1.0);

template <class T>
static void test_rotations(const int s, const int ncols) {
  ksp::BandedHessenberg<T> hes;
  const double             rho0 = 3.0;
  hes.init(s, rho0);
  ASSERT_EQ(hes.phihat(), T(rho0));
  double prev = rho0 * rho0;
  for (int col = 0; col < ncols; ++col) {
    auto r = gen_rand_array<T>(s + 3, r_rand);
    hes.add_column(r);
    ASSERT_EQ(r[s + 2], T(0));
    const double now = abs2(hes.phi()) + abs2(hes.phihat());
    ASSERT_NEAR(now, prev, 1e-12 * prev);
    // quasi-residual never increases
    ASSERT_LE(qmridr::abs(hes.phihat()), std::sqrt(prev) * (1.0 + 1e-14));
    prev = abs2(hes.phihat());
  }
}

TEST(HESSENBERG, rotations) {
  test_rotations<double>(1, 10);
  test_rotations<double>(4, 23);
  test_rotations<std::complex<double>>(3, 17);
}

TEST(HESSENBERG, upper_triangular) {
  // a single column, no previous rotation takes effect
  const int                     s = 2;
  ksp::BandedHessenberg<double> hes;
  hes.init(s, 1.0);
  Array<double> r(s + 3, 0.0);
  r[s + 1] = 3.0;
  r[s + 2] = 4.0;
  hes.add_column(r);
  ASSERT_NEAR(r[s + 1], 5.0, 1e-14);
  ASSERT_EQ(r[s + 2], 0.0);
  ASSERT_NEAR(hes.phi(), 0.6, 1e-14);
  ASSERT_NEAR(hes.phihat(), -0.8, 1e-14);
  for (int i = 0; i <= s; ++i) ASSERT_EQ(r[i], 0.0);
}

TEST(HESSENBERG, zero_diagonal) {
  // the rotation degenerates to a swap
  const int                     s = 3;
  ksp::BandedHessenberg<double> hes;
  hes.init(s, 2.0);
  Array<double> r(s + 3, 0.0);
  r[s + 2] = 7.0;
  hes.add_column(r);
  ASSERT_EQ(r[s + 1], 7.0);
  ASSERT_EQ(r[s + 2], 0.0);
  ASSERT_EQ(hes.phi(), 0.0);
  ASSERT_EQ(hes.phihat(), -2.0);
}
