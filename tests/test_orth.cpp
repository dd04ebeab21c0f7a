///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/ksp/Orthogonalizer.hpp"

#include <gtest/gtest.h>

using namespace qmridr;

const static RandRealGen r_rand(-1.0, 1.0);

template <class T>
static void test_orth(const int method) {
  const int  n = 40, k = 6;
  const auto Q = gen_orthonormal<T>(n, k, r_rand);
  const auto g0 = gen_rand_array<T>(n, r_rand);
  auto       g  = g0;
  Array<T>   h(k);

  ksp::Orthogonalizer<T> orth(method, Const<double>::EPS, 3);
  orth.init(k);
  const double nrm = orth.orthogonalize(n, k, Q.data(), g.data(), h.data());
  ASSERT_NEAR(nrm, norm2(g), 1e-12);
  // Q'*g==0
  for (int j = 0; j < k; ++j)
    ASSERT_NEAR(qmridr::abs(inner(n, Q.col_begin(j), g.data())), 0.0,
                1e-12)
        << orth.repr() << " column " << j;
  // g0==Q*h+g
  for (int i = 0; i < n; ++i) {
    T v = g[i];
    for (int j = 0; j < k; ++j) v += Q(i, j) * h[j];
    ASSERT_NEAR(qmridr::abs(v - g0[i]), 0.0, 1e-12)
        << orth.repr() << " row " << i;
  }
}

TEST(ORTH, cgs) {
  test_orth<double>(ORTH_CGS);
  test_orth<std::complex<double>>(ORTH_CGS);
}

TEST(ORTH, mgs) {
  test_orth<double>(ORTH_MGS);
  test_orth<std::complex<double>>(ORTH_MGS);
}

TEST(ORTH, rcgs) {
  test_orth<double>(ORTH_RCGS);
  test_orth<std::complex<double>>(ORTH_RCGS);
}

TEST(ORTH, empty_basis) {
  const int                   n = 10;
  auto                        g = gen_rand_array<double>(n, r_rand);
  const auto                  g0 = g;
  ksp::Orthogonalizer<double> orth;
  ASSERT_STREQ(orth.repr(), "MGS");
  const double nrm = orth.orthogonalize(n, 0, nullptr, g.data(), nullptr);
  ASSERT_EQ(nrm, norm2(g0));
  for (int i = 0; i < n; ++i) ASSERT_EQ(g[i], g0[i]);
}

TEST(ORTH, rcgs_single_pass) {
  // a single pass of RCGS is CGS
  const int     n = 30, k = 4;
  const auto    Q = gen_orthonormal<double>(n, k, r_rand);
  const auto    g0 = gen_rand_array<double>(n, r_rand);
  auto          g1 = g0, g2 = g0;
  Array<double> h1(k), h2(k);
  ksp::Orthogonalizer<double> cgs(ORTH_CGS, Const<double>::EPS, 3),
      rcgs(ORTH_RCGS, Const<double>::EPS, 1);
  rcgs.init(k);
  ASSERT_EQ(cgs.orthogonalize(n, k, Q.data(), g1.data(), h1.data()),
            rcgs.orthogonalize(n, k, Q.data(), g2.data(), h2.data()));
  for (int i = 0; i < n; ++i) ASSERT_EQ(g1[i], g2[i]);
  for (int j = 0; j < k; ++j) ASSERT_EQ(h1[j], h2[j]);
}
