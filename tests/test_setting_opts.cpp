///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/Options.h"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace qmridr;

const RandIntGen  i_rand(1, 100);
const RandRealGen r_rand(0.0, 1.0);

TEST(OPT, set) {
  Options      opt = get_default_options();
  const int    s = i_rand(), proj_dim = i_rand(), maxit = i_rand();
  const double rtol = r_rand(), kappa = r_rand(), orth_tol = r_rand();
  const int    orth_repeat = i_rand(), skew_repeat = i_rand(),
            seed = i_rand();
  ASSERT_FALSE(set_option_attr("s", s, opt));
  ASSERT_FALSE(set_option_attr("proj_dim", proj_dim, opt));
  ASSERT_FALSE(set_option_attr("rtol", rtol, opt));
  ASSERT_FALSE(set_option_attr("maxit", maxit, opt));
  ASSERT_FALSE(set_option_attr("kappa", kappa, opt));
  ASSERT_FALSE(set_option_attr("orth", (int)ORTH_RCGS, opt));
  ASSERT_FALSE(set_option_attr("orth_tol", orth_tol, opt));
  ASSERT_FALSE(set_option_attr("orth_repeat", orth_repeat, opt));
  ASSERT_FALSE(set_option_attr("skew_repeat", skew_repeat, opt));
  ASSERT_FALSE(set_option_attr("orth_search", 1, opt));
  ASSERT_FALSE(set_option_attr("seed", seed, opt));
  ASSERT_FALSE(set_option_attr("verbose", (int)VERBOSE_NONE, opt));

  ASSERT_EQ(opt.s, s);
  ASSERT_EQ(opt.proj_dim, proj_dim);
  ASSERT_EQ(opt.rtol, rtol);
  ASSERT_EQ(opt.maxit, maxit);
  ASSERT_EQ(opt.kappa, kappa);
  ASSERT_EQ(opt.orth, ORTH_RCGS);
  ASSERT_EQ(opt.orth_tol, orth_tol);
  ASSERT_EQ(opt.orth_repeat, orth_repeat);
  ASSERT_EQ(opt.skew_repeat, skew_repeat);
  ASSERT_EQ(opt.orth_search, 1);
  ASSERT_EQ(opt.seed, seed);
  ASSERT_EQ(opt.verbose, VERBOSE_NONE);

  ASSERT_TRUE(set_option_attr("foobar", 1, opt));
}

TEST(OPT, defaults) {
  const Options opt = get_default_options();
  ASSERT_EQ(opt.s, 8);
  ASSERT_EQ(opt.proj_dim, 0);
  ASSERT_EQ(opt.rtol, 0.0);
  ASSERT_EQ(opt.maxit, 0);
  ASSERT_EQ(opt.kappa, 0.7);
  ASSERT_EQ(opt.orth, ORTH_MGS);
  ASSERT_EQ(opt.orth_repeat, 3);
  ASSERT_EQ(opt.skew_repeat, 1);
  ASSERT_EQ(opt.orth_search, 0);
  ASSERT_EQ(opt.seed, 0);
  ASSERT_EQ(opt.verbose, VERBOSE_INFO);
  ASSERT_EQ(get_orth_name(opt), "MGS");
  ASSERT_EQ(get_verbose(opt), "info");
}

TEST(OPT, repr) {
  Options opt = get_default_options();
  opt.orth    = ORTH_CGS;
  opt.verbose = VERBOSE_NONE;
  const std::string str = opt_repr(opt);
  ASSERT_NE(str.find("CGS"), std::string::npos);
  ASSERT_NE(str.find("none"), std::string::npos);
  ASSERT_NE(str.find("orth_search"), std::string::npos);
  opt.orth = 10;
  ASSERT_EQ(get_orth_name(opt), "Null");
}

TEST(OPT, read) {
  std::stringstream ss;
  ss << "4 2 1e-6 100 0.5 2 1e-12 4 2 1 -1 0";
  Options opt;
  ss >> opt;
  ASSERT_EQ(opt.s, 4);
  ASSERT_EQ(opt.proj_dim, 2);
  ASSERT_EQ(opt.rtol, 1e-6);
  ASSERT_EQ(opt.maxit, 100);
  ASSERT_EQ(opt.kappa, 0.5);
  ASSERT_EQ(opt.orth, ORTH_RCGS);
  ASSERT_EQ(opt.orth_tol, 1e-12);
  ASSERT_EQ(opt.orth_repeat, 4);
  ASSERT_EQ(opt.skew_repeat, 2);
  ASSERT_EQ(opt.orth_search, 1);
  ASSERT_EQ(opt.seed, -1);
  ASSERT_EQ(opt.verbose, VERBOSE_NONE);
}
