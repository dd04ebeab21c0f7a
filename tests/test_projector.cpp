///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/ksp/ShadowProjector.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace qmridr;

const static RandRealGen r_rand(-1.0, 1.0);

// the minimal interface of a circular basis
template <class T>
struct MockBasis {
  DenseMatrix<T> g;
  Array<T>       vec;
  std::size_t    slot;

  std::size_t           latest() const { return slot; }
  const DenseMatrix<T> &G() const { return g; }
  Array<T> &            v() { return vec; }
  const Array<T> &      v() const { return vec; }

  // fill the slot with a new vector and make it the latest
  void push(const std::size_t l) {
    slot = l;
    for (std::size_t i = 0u; i < g.nrows(); ++i)
      g(i, l) = rand_value<T>(r_rand);
    vec.resize(g.nrows());
    std::copy_n(g.col_begin(l), g.nrows(), vec.begin());
  }
};

template <class T>
static void check_projection(const ksp::ShadowProjector<T> &proj,
                             const MockBasis<T> &           basis,
                             const Array<T> &               v0,
                             const std::vector<std::size_t> &window) {
  const std::size_t n = v0.size();
  const auto &      R0 = proj.R0();
  const auto &      u  = proj.u();
  ASSERT_EQ(u.size(), window.size());
  const double nrm = norm2(v0);
  // R0'*v==0
  for (std::size_t j = 0u; j < R0.ncols(); ++j)
    ASSERT_LE(qmridr::abs(inner(n, R0.col_begin(j), basis.v().data())),
              1e-10 * nrm);
  // v0==v+G(:,window)*u, oldest first
  for (std::size_t i = 0u; i < n; ++i) {
    T x = basis.v()[i];
    for (std::size_t l = 0u; l < window.size(); ++l)
      x += basis.G()(i, window[l]) * u[l];
    ASSERT_LE(qmridr::abs(x - v0[i]), 1e-10 * nrm);
  }
}

template <class T>
static void test_window(const std::size_t s, const std::size_t pd) {
  const std::size_t     n = 30;
  MockBasis<T>          basis;
  ksp::ShadowProjector<T> proj;
  basis.g.resize(n, s + 1);
  proj.init(n, s, pd, 0.7, false, 1, Const<double>::EPS, nullptr, 0);
  ASSERT_FALSE(proj.initialized());

  // fill up the first s slots, nothing happens before
  for (std::size_t l = 0u; l < s; ++l) {
    basis.push(l);
    const auto v0 = basis.v();
    proj.apply(basis);
    for (std::size_t i = 0u; i < n; ++i) ASSERT_EQ(basis.v()[i], v0[i]);
    proj.update(basis);
  }
  ASSERT_TRUE(proj.initialized());

  // the window slides along the circular buffer, wrapping around twice
  std::vector<std::size_t> window;
  for (std::size_t l = s - pd; l < s; ++l) window.push_back(l);
  for (std::size_t step = 0u; step < 2 * (s + 1); ++step) {
    const std::size_t L = (s + step) % (s + 1);
    basis.push(L);
    const auto v0 = basis.v();
    proj.apply(basis);
    check_projection(proj, basis, v0, window);
    if (!step) {
      proj.next_idr_space(basis);
      ASSERT_EQ(proj.j(), 1u);
    }
    proj.update(basis);
    window.erase(window.begin());
    window.push_back(L);
  }
}

TEST(PROJECTOR, full_window) {
  test_window<double>(4, 4);
  test_window<double>(1, 1);
  test_window<std::complex<double>>(3, 3);
}

TEST(PROJECTOR, small_window) {
  test_window<double>(5, 2);
  test_window<std::complex<double>>(4, 3);
}

TEST(PROJECTOR, random_shadow_space) {
  const std::size_t            n = 25, s = 4;
  ksp::ShadowProjector<double> p1, p2, p3;
  p1.init(n, s, s, 0.7, false, 1, 1e-16, nullptr, 7);
  p2.init(n, s, s, 0.7, false, 1, 1e-16, nullptr, 7);
  p3.init(n, s, s, 0.7, false, 1, 1e-16, nullptr, 8);
  const auto &R0 = p1.R0();
  ASSERT_EQ(R0.nrows(), n);
  ASSERT_EQ(R0.ncols(), s);
  // deterministic with the same seed
  for (std::size_t i = 0u; i < R0.array().size(); ++i)
    ASSERT_EQ(R0.array()[i], p2.R0().array()[i]);
  ASSERT_NE(R0(0, 0), p3.R0()(0, 0));
  // orthonormal columns
  for (std::size_t j = 0u; j < s; ++j)
    for (std::size_t k = 0u; k < s; ++k)
      ASSERT_NEAR(inner(n, R0.col_begin(j), R0.col_begin(k)),
                  j == k ? 1.0 : 0.0, 1e-12);
}

TEST(PROJECTOR, user_shadow_space) {
  const std::size_t            n = 12, s = 3, pd = 2;
  const auto                   R0 = gen_orthonormal<double>(n, pd, r_rand);
  ksp::ShadowProjector<double> proj;
  proj.init(n, s, pd, 0.7, true, 1, 1e-16, &R0, 0);
  ASSERT_TRUE(proj.orth_search());
  ASSERT_EQ(proj.proj_dim(), pd);
  for (std::size_t i = 0u; i < R0.array().size(); ++i)
    ASSERT_EQ(R0.array()[i], proj.R0().array()[i]);
  const DenseMatrix<double> bad(n, pd + 1);
  ASSERT_THROW(proj.init(n, s, pd, 0.7, true, 1, 1e-16, &bad, 0),
               std::runtime_error);
  ASSERT_THROW(proj.init(n, s, s + 1, 0.7, true, 1, 1e-16, nullptr, 0),
               std::runtime_error);
}

TEST(PROJECTOR, angle_safeguard) {
  const std::size_t n = 20, s = 2;
  MockBasis<double> basis;
  basis.g.resize(n, s + 1);
  basis.push(1);
  // make v nearly orthogonal to g
  const auto w = gen_rand_array<double>(n, r_rand);
  basis.vec = w;
  const double *g   = basis.g.col_begin(1);
  const double  gw  = inner(n, g, w.data()) / norm2_sq(n, g);
  axpy(n, -gw, g, basis.vec.data());
  axpy(n, 1e-3, g, basis.vec.data());

  const double nu  = inner(n, g, basis.vec.data());
  const double tau = norm2_sq(n, g);

  ksp::ShadowProjector<double> proj;
  proj.init(n, s, s, 0.0, false, 1, 1e-16, nullptr, 0);
  proj.next_idr_space(basis);
  ASSERT_NEAR(proj.omega(), nu / tau, 1e-14);
  ASSERT_NEAR(proj.mu(), tau / nu, 1e-8 * std::abs(tau / nu));

  proj.init(n, s, s, 0.7, false, 1, 1e-16, nullptr, 0);
  proj.next_idr_space(basis);
  // |omega| is enlarged to kappa*|v|/|g|
  ASSERT_NEAR(std::abs(proj.omega()), 0.7 * norm2(basis.vec) / std::sqrt(tau),
              1e-12);
  ASSERT_NEAR(proj.mu() * proj.omega(), 1.0, 1e-12);
}
