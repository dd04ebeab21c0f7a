///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/ksp/Preconditioner.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace qmridr;

const static RandRealGen r_rand(-1.0, 1.0);

// scale by the inverse of a constant
struct ScalingSolver {
  double d;
  void   solve(const Array<double> &v, Array<double> &vhat) const {
    for (std::size_t i = 0u; i < v.size(); ++i) vhat[i] = v[i] / d;
  }
};

TEST(PRECOND, identity) {
  ksp::Preconditioner<double> P;
  ASSERT_EQ(P.kind(), ksp::PRECOND_IDENTITY);
  ASSERT_STREQ(P.repr(), "identity");
  const auto    v = gen_rand_array<double>(20, r_rand);
  Array<double> vhat(20);
  P.apply(v, vhat);
  for (int i = 0; i < 20; ++i) ASSERT_EQ(v[i], vhat[i]);
}

TEST(PRECOND, solver) {
  auto M = std::make_shared<ScalingSolver>();
  M->d   = 4.0;
  auto P = ksp::Preconditioner<double>::from_solver(M);
  ASSERT_EQ(P.kind(), ksp::PRECOND_SOLVER);
  ASSERT_STREQ(P.repr(), "solver");
  // shared ownership
  ASSERT_EQ(M.use_count(), 2);
  Array<double> v(3, 8.0), vhat(3);
  P.apply(v, vhat);
  for (const auto x : vhat) ASSERT_EQ(x, 2.0);
  std::shared_ptr<ScalingSolver> empty;
  ASSERT_THROW(ksp::Preconditioner<double>::from_solver(empty),
               std::runtime_error);
}

TEST(PRECOND, function) {
  int  calls = 0;
  auto P     = ksp::Preconditioner<double>::from_function(
      [&](const Array<double> &v, Array<double> &vhat) {
        // changes from call to call
        ++calls;
        for (std::size_t i = 0u; i < v.size(); ++i) vhat[i] = calls * v[i];
      });
  ASSERT_EQ(P.kind(), ksp::PRECOND_FUNCTION);
  ASSERT_STREQ(P.repr(), "function");
  Array<double> v(2, 1.0), vhat(2);
  P.apply(v, vhat);
  ASSERT_EQ(vhat[0], 1.0);
  P.apply(v, vhat);
  ASSERT_EQ(vhat[1], 2.0);
  ASSERT_EQ(calls, 2);
  ASSERT_THROW(ksp::Preconditioner<double>::from_function(
                   ksp::Preconditioner<double>::func_type()),
               std::runtime_error);
}
