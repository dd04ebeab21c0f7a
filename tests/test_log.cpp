///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

#include "common.hpp"
// line break to avoid sorting
#include "qmridr/utils/log.hpp"
#include "qmridr/utils/stacktrace.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

TEST(LOG, error_throws) {
  ASSERT_THROW(qmridr_error("error %d", 1), std::runtime_error);
  ASSERT_THROW(qmridr_error_if(1 + 1 == 2, "error %s", "message"),
               std::runtime_error);
  ASSERT_NO_THROW(qmridr_error_if(1 + 1 == 3, "never"));
  try {
    qmridr_error("value is %g", 2.5);
  } catch (const std::runtime_error &e) {
    const std::string msg(e.what());
    ASSERT_NE(msg.find("value is 2.5"), std::string::npos);
  }
}

TEST(LOG, warn_flag) {
  ASSERT_TRUE(qmridr::warn_flag());
  const bool revert = qmridr::warn_flag();
  qmridr::warn_flag(0);
  ASSERT_FALSE(qmridr::warn_flag());
  qmridr_warning("muted %d", 1);
  qmridr::warn_flag(revert);
  ASSERT_TRUE(qmridr::warn_flag());
}

TEST(LOG, stacktrace) {
  std::stringstream ss;
  qmridr::internal::load_stacktrace(ss);
  ASSERT_FALSE(ss.str().empty());
}
