///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/utils/log.hpp
 * \brief Logging interface, including info/warning/error

\verbatim
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
\endverbatim

 */

#ifndef _QMRIDR_UTILS_LOG_HPP
#define _QMRIDR_UTILS_LOG_HPP

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>
#ifdef QMRIDR_THROW
#  include <stdexcept>
#endif

#include "qmridr/utils/print.hpp"
#include "qmridr/utils/stacktrace.hpp"

namespace qmridr {
namespace internal {

/// \brief format a printf-style message into a character buffer
/// \param[out] buf output buffer, null-terminated upon output
/// \param[in] fmt format string
/// \param[in] args variadic argument list, consumed by this call
inline void vformat(std::vector<char> &buf, const char *fmt, va_list args) {
  va_list args2;
  va_copy(args2, args);
  const int len = std::vsnprintf(nullptr, 0, fmt, args);
  buf.resize(len < 0 ? 1 : len + 1);
  buf.front() = '\0';
  if (len >= 0) std::vsnprintf(buf.data(), buf.size(), fmt, args2);
  va_end(args2);
}

}  // namespace internal

/// \brief common information streaming, dump \a msg to \ref QMRIDR_STDOUT
/// \param[in] msg message string
/// \sa qmridr_info top level macro wrapper
/// \ingroup util
inline void info(const char *msg, ...) {
  std::vector<char> buf;
  va_list           args;
  va_start(args, msg);
  internal::vformat(buf, msg, args);
  va_end(args);
  QMRIDR_STDOUT(buf.data());
}

/// \brief global switch of warning messages
/// \param[in] flag if negative (default), then query the current status,
///                 otherwise, set the status to \a flag
/// \return the warning status upon exit
/// \ingroup util
///
/// \code{.cpp}
/// const bool revert = warn_flag();
/// warn_flag(0);  // mute
/// // ...
/// warn_flag(revert);
/// \endcode
inline bool warn_flag(const int flag = -1) {
  static bool warn = true;
  if (flag < 0) return warn;
  warn = flag;
  return warn;
}

/// \brief warning information streaming, dump to \ref QMRIDR_STDERR
/// \param[in] prefix prefix message, omitted if passed as \a nullptr
/// \param[in] file filename
/// \param[in] func function name, i.e. \a __func__
/// \param[in] line line number, i.e. \a __LINE__
/// \param[in] msg message string
/// \sa qmridr_warning, qmridr_warning_if
/// \ingroup util
inline void warning(const char *prefix, const char *file, const char *func,
                    const unsigned line, const char *msg, ...) {
  std::vector<char> buf;
  va_list           args;
  va_start(args, msg);
  internal::vformat(buf, msg, args);
  va_end(args);
  std::stringstream ss;
#ifndef QMRIDR_LOG_PLAIN_PREFIX
  ss << "\033[1;33mWARNING!\033[0m ";
#else
  ss << "WARNING! ";
#endif  // QMRIDR_LOG_PLAIN_PREFIX
  if (prefix) ss << prefix << ", ";
  ss << "function " << func << ", at " << file << ':' << line
     << "\nmessage: " << buf.data();
  QMRIDR_STDERR(ss.str().c_str());
}

/// \brief error information streaming, dump to \ref QMRIDR_STDERR
/// \param[in] prefix prefix message, omitted if passed as \a nullptr
/// \param[in] file filename, i.e. __FILE__
/// \param[in] func function name, i.e. \a __func__
/// \param[in] line line number, i.e. \a __LINE__
/// \param[in] msg message string
/// \sa qmridr_error, qmridr_error_if
/// \ingroup util
///
/// With \ref QMRIDR_THROW, a \a std::runtime_error carrying the message and
/// the stack trace is thrown, otherwise the program aborts.
inline void error(const char *prefix, const char *file, const char *func,
                  const unsigned line, const char *msg, ...) {
  std::vector<char> buf;
  va_list           args;
  va_start(args, msg);
  internal::vformat(buf, msg, args);
  va_end(args);
  std::stringstream ss;
#ifndef QMRIDR_LOG_PLAIN_PREFIX
  ss << "\033[1;31mERROR!\033[0m ";
#else
  ss << "ERROR! ";
#endif  // QMRIDR_LOG_PLAIN_PREFIX
  if (prefix) ss << prefix << ", ";
  ss << "function " << func << ", at " << file << ':' << line
     << "\nmessage: " << buf.data() << "\n\n";
  internal::load_stacktrace(ss);
#ifdef QMRIDR_THROW
  throw std::runtime_error(ss.str());
#else
  QMRIDR_STDERR(ss.str().c_str());
  std::abort();
#endif
}
}  // namespace qmridr

/// \def qmridr_info(__msgs)
/// \brief general message streaming macro wrapper
/// \sa qmridr::info
/// \ingroup util
#define qmridr_info(__msgs...) ::qmridr::info(__msgs)

#ifndef DOXYGEN_SHOULD_SKIP_THIS

#  ifdef __GNUC__
#    define __QMRIDR_FUNC__ __FUNCTION__
#  else
#    define __QMRIDR_FUNC__ __func__
#  endif

// strip out the prefix of the file
#  define __QMRIDR_FILE__ \
    (std::strrchr(__FILE__, '/') ? std::strrchr(__FILE__, '/') + 1 : __FILE__)

#endif  // DOXYGEN_SHOULD_SKIP_THIS

/// \def qmridr_warning(__msgs)
/// \brief print warning message if \ref qmridr::warn_flag is on
/// \sa qmridr::warning
/// \ingroup util
#define qmridr_warning(__msgs...)                                          \
  do {                                                                     \
    if (::qmridr::warn_flag())                                             \
      ::qmridr::warning(nullptr, __QMRIDR_FILE__, __QMRIDR_FUNC__, __LINE__, \
                        __msgs);                                           \
  } while (false)

/// \def qmridr_warning_if(__cond, __msgs)
/// \brief conditionally print message, __cond will be shown as \a prefix
/// \sa qmridr::warning
/// \ingroup util
#define qmridr_warning_if(__cond, __msgs...)                              \
  do {                                                                    \
    if (::qmridr::warn_flag() && (__cond))                                \
      ::qmridr::warning("condition " #__cond " alerted", __QMRIDR_FILE__, \
                        __QMRIDR_FUNC__, __LINE__, __msgs);               \
  } while (false)

/// \def qmridr_error(__msgs)
/// \brief print error message and abort (or throw)
/// \sa qmridr::error
/// \ingroup util
#define qmridr_error(__msgs...) \
  ::qmridr::error(nullptr, __QMRIDR_FILE__, __QMRIDR_FUNC__, __LINE__, __msgs)

/// \def qmridr_error_if(__cond, __msgs)
/// \brief conditionally print error message and abort (or throw)
/// \sa qmridr::error
/// \ingroup util
#define qmridr_error_if(__cond, __msgs...)                                    \
  do {                                                                        \
    if (__cond)                                                               \
      ::qmridr::error("invalid condition " #__cond, __QMRIDR_FILE__,          \
                      __QMRIDR_FUNC__, __LINE__, __msgs);                     \
  } while (false)

/// \def qmridr_assert(__cond, __msgs)
/// \brief internal debugging assertion
/// \ingroup util

/// \def qmridr_debug_code(__code)
/// \brief code will only be translated on debug builds
/// \ingroup util

#if defined QMRIDR_DEBUG
#  define qmridr_assert(__cond, __msgs...)                                    \
    do {                                                                      \
      if (!(__cond))                                                          \
        ::qmridr::error("condition " #__cond " failed", __QMRIDR_FILE__,      \
                        __QMRIDR_FUNC__, __LINE__, __msgs);                   \
    } while (false)
#  define qmridr_debug_code(__code) __code
#else
#  define qmridr_assert(__cond, __msgs...)
#  define qmridr_debug_code(__code)
#endif

#endif  // _QMRIDR_UTILS_LOG_HPP
