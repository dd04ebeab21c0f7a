///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/small_scale/LUP.hpp"

#include <gtest/gtest.h>

using namespace qmridr;

const static RandRealGen r_rand(-1.0, 1.0);

template <class T>
static LUP<T> fresh_factor(const DenseMatrix<T> &M) {
  LUP<T> lu;
  lu.init(M.nrows());
  std::copy(M.array().cbegin(), M.array().cend(), lu.mat().array().begin());
  lu.factorize();
  return lu;
}

template <class T>
static void test_replace(const int n, const int nreplaces) {
  auto   M  = gen_diag_dominant<T>(n, r_rand);
  LUP<T> lu = fresh_factor(M);
  ASSERT_EQ(lu.updates(), 0u);
  ASSERT_EQ(lu.max_updates(), std::size_t(n - 1));

  // circular replacement, the same as the Gram matrix
  for (int step = 0; step < nreplaces; ++step) {
    const int col = step % n;
    auto      m   = gen_rand_array<T>(n, r_rand);
    m[col] += T(n + 1.0);
    auto alpha = m;
    lu.solve(alpha);
    lu.replace_column(col, m, alpha);
    std::copy(m.cbegin(), m.cend(), M.col_begin(col));
    ASSERT_EQ(lu.updates(), std::size_t((step + 1) % n));

    const auto b   = gen_rand_array<T>(n, r_rand);
    auto       x1  = b;
    auto       x2  = b;
    auto       ref = fresh_factor(M);
    lu.solve(x1);
    ref.solve(x2);
    for (int i = 0; i < n; ++i)
      ASSERT_NEAR(qmridr::abs(x1[i] - x2[i]), 0.0, 1e-10)
          << "step " << step << ", entry " << i;
  }
}

TEST(LUP, solve) {
  const int n = 7;
  auto      M = gen_diag_dominant<double>(n, r_rand);
  auto      lu = fresh_factor(M);
  const auto x = gen_rand_array<double>(n, r_rand);
  Array<double> b(n);
  M.multiply(x, b);
  lu.solve(b);
  for (int i = 0; i < n; ++i) ASSERT_NEAR(b[i], x[i], 1e-12);
}

TEST(LUP, replace_column) {
  test_replace<double>(5, 3);
  // triggers refactorizations
  test_replace<double>(5, 17);
  test_replace<std::complex<double>>(4, 13);
}

TEST(LUP, singular_pivot_refactorizes) {
  const int n  = 3;
  auto      M  = gen_diag_dominant<double>(n, r_rand);
  auto      lu = fresh_factor(M);
  Array<double> m(n), alpha(n, 1.0);
  for (int i = 0; i < n; ++i) m[i] = M(i, 1) * 2.0;
  alpha[1] = 0.0;
  lu.replace_column(1, m, alpha);
  ASSERT_EQ(lu.updates(), 0u);
  std::copy(m.cbegin(), m.cend(), M.col_begin(1));
  auto       ref = fresh_factor(M);
  const auto b   = gen_rand_array<double>(n, r_rand);
  auto       x1 = b, x2 = b;
  lu.solve(x1);
  ref.solve(x2);
  for (int i = 0; i < n; ++i) ASSERT_NEAR(x1[i], x2[i], 1e-12);
}

TEST(LUP, errors) {
  LUP<double> lu;
  lu.init(3);
  Array<double> x(4);
  lu.mat().fill(0.0);
  for (int i = 0; i < 3; ++i) lu.mat()(i, i) = 1.0;
  lu.factorize();
  ASSERT_THROW(lu.solve(x), std::runtime_error);
  Array<double> m(3), alpha(3, 1.0);
  ASSERT_THROW(lu.replace_column(3, m, alpha), std::runtime_error);
}
