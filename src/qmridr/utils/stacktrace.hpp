///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/utils/stacktrace.hpp
 * \brief Collect a demangled stack trace for fatal errors
 * \note Only works on Unix/Linux with glibc-style backtraces

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

#ifndef _QMRIDR_UTILS_STACKTRACE_HPP
#define _QMRIDR_UTILS_STACKTRACE_HPP

#include <cstdlib>
#include <ostream>
#include <vector>

#if defined(__GNUC__) && defined(__unix__)
#  include <cxxabi.h>
#  include <execinfo.h>
#  define QMRIDR_HAS_BACKTRACE 1
#else
#  define QMRIDR_HAS_BACKTRACE 0
#endif

namespace qmridr {
namespace internal {

/// \brief write the current call stack into a streamer
/// \tparam OStream output streamer type, e.g. \a std::stringstream
/// \param[out] os output streamer
/// \param[in] limit maximum number of frames
/// \ingroup util
///
/// Each symbol line of \a backtrace_symbols looks like
/// \a "module(mangled+offset) [address]"; the mangled part is passed through
/// \a abi::__cxa_demangle whenever possible.
template <class OStream>
inline void load_stacktrace(OStream &os, const int limit = 63) {
  os << "stack trace:\n";
#if QMRIDR_HAS_BACKTRACE
  std::vector<void *> addrs(limit + 1);
  const int           addr_len = backtrace(addrs.data(), (int)addrs.size());
  if (addr_len == 0) {
    os << " <empty, possibly corrupt>\n";
    return;
  }
  char **symbols = backtrace_symbols(addrs.data(), addr_len);
  if (!symbols) {
    os << " <failed to resolve symbols>\n";
    return;
  }
  std::size_t buf_size = 512u;
  char *      buf      = (char *)std::malloc(buf_size);
  // skip this frame
  for (int i = 1; i < addr_len; ++i) {
    char *name(nullptr), *offset(nullptr), *offset_end(nullptr);
    for (char *p = symbols[i]; *p; ++p) {
      if (*p == '(')
        name = p;
      else if (*p == '+')
        offset = p;
      else if (*p == ')' && offset) {
        offset_end = p;
        break;
      }
    }
    if (!name || !offset || !offset_end || name >= offset) {
      os << '[' << i << "] " << symbols[i] << '\n';
      continue;
    }
    *name++     = '\0';
    *offset++   = '\0';
    *offset_end = '\0';
    int   status(-1);
    char *demangled =
        buf ? abi::__cxa_demangle(name, buf, &buf_size, &status) : nullptr;
    if (status == 0 && demangled) {
      buf = demangled;  // may have been reallocated
      os << '[' << i << "] " << symbols[i] << ':' << buf << '+' << offset
         << '\n';
    } else
      os << '[' << i << "] " << symbols[i] << ':' << name << "()+" << offset
         << '\n';
  }
  std::free(buf);
  std::free(symbols);
#else
  (void)limit;
  os << " <not available on the platform>\n";
#endif
}

}  // namespace internal
}  // namespace qmridr

#endif  // _QMRIDR_UTILS_STACKTRACE_HPP
