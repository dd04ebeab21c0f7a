///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/ds/Array.hpp"
#include "qmridr/ds/DenseMatrix.hpp"

#include <gtest/gtest.h>
#include <utility>
#include <vector>

using namespace qmridr;

const static RandIntGen  i_rand(1, 50);
const static RandRealGen r_rand(-1.0, 1.0);

TEST(Array_api, test_core) {
  Array<double> v;
  ASSERT_EQ(v.status(), DATA_UNDEF);
  v.resize(100);
  ASSERT_EQ(v.status(), DATA_OWN);
  ASSERT_EQ(v.size(), 100u);
  for (auto &i : v) i = 1.0;
  for (const auto i : v) ASSERT_EQ(i, 1.0);
  v.resize(0);
  ASSERT_GE(v.capacity(), 100u);
  // deep copy
  Array<double> b(10u, 2.0);
  Array<double> c(b);
  ASSERT_NE(b.data(), c.data());
  c[0] = -1.0;
  ASSERT_EQ(b[0], 2.0);
  v = b;
  ASSERT_EQ(v.size(), 10u);
  for (const auto i : v) ASSERT_EQ(i, 2.0);
  ASSERT_THROW(v.at(10), std::runtime_error);
}

TEST(Array_api, test_wrap) {
  std::vector<int> _v(100);
  Array<int>       v(100u, _v.data(), true);
  ASSERT_EQ(v.status(), DATA_WRAP);
  for (auto &i : v) i = -100;
  for (const auto i : _v) ASSERT_EQ(i, -100);
  ASSERT_THROW(v.resize(200), std::runtime_error);
  // copy of a wrapper owns its data
  Array<int> w(v);
  ASSERT_EQ(w.status(), DATA_OWN);
  ASSERT_NE(w.data(), _v.data());
}

TEST(Array_api, test_pushback) {
  Array<long> v;
  v.reserve(4);
  for (long i = 0; i < 20; ++i) v.push_back(i + 1);
  ASSERT_EQ(v.size(), 20u);
  ASSERT_EQ(v.front(), 1l);
  ASSERT_EQ(v.back(), 20l);
  long j(1l);
  for (const auto i : v) ASSERT_EQ(i, j++);
}

TEST(Array_api, test_move) {
  Array<float> v1(100);
  Array<float> v2(std::move(v1));
  ASSERT_EQ(v1.status(), DATA_UNDEF);
  ASSERT_EQ(v1.size(), 0u);
  ASSERT_EQ(v2.size(), 100u);
  ASSERT_EQ(v2.status(), DATA_OWN);
  Array<float> v3;
  v3 = std::move(v2);
  ASSERT_EQ(v2.status(), DATA_UNDEF);
  ASSERT_EQ(v3.size(), 100u);
  ASSERT_EQ(v3.status(), DATA_OWN);
}

TEST(DENSE, core) {
  const int           nrows = i_rand(), ncols = i_rand();
  DenseMatrix<double> mat(nrows, ncols);
  ASSERT_EQ(mat.nrows(), (std::size_t)nrows);
  ASSERT_EQ(mat.ncols(), (std::size_t)ncols);
  for (int col = 0; col < ncols; ++col)
    for (int row = 0; row < nrows; ++row) mat(row, col) = r_rand();
  // column major
  for (int col = 0; col < ncols; ++col)
    for (int row = 0; row < nrows; ++row)
      ASSERT_EQ(mat(row, col), mat.data()[col * nrows + row]);
  // column wrapper shares memory
  const int col = ncols - 1;
  auto      c   = mat.col(col);
  ASSERT_EQ(c.status(), DATA_WRAP);
  ASSERT_EQ(c.size(), (std::size_t)nrows);
  c[0] = 10.0;
  ASSERT_EQ(mat(0, col), 10.0);
}

TEST(DENSE, multiply) {
  const int           n = i_rand(), m = i_rand();
  DenseMatrix<double> A(m, n);
  for (auto &v : A.array()) v = r_rand();
  Array<double> x(n), y(m);
  for (auto &v : x) v = r_rand();
  A.multiply(x, y);
  for (int i = 0; i < m; ++i) {
    double sum(0);
    for (int j = 0; j < n; ++j) sum += A(i, j) * x[j];
    ASSERT_NEAR(sum, y[i], 1e-12);
  }
  Array<double> z(m + 1);
  ASSERT_THROW(A.multiply(x, z), std::runtime_error);
}
