///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/Options.h
 * \brief Options (parameters) for the flexible QMR-IDR(s) solver

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

#ifndef _QMRIDR_OPTIONS_H
#define _QMRIDR_OPTIONS_H

#ifdef __cplusplus
extern "C" {
#endif

/*!
 * \addtogroup itr
 * @{
 */

/*!
 * \brief the verbose level for progress report
 */
enum {
  QMRIDR_VERBOSE_NONE = 0, /*!< mute */
  QMRIDR_VERBOSE_INFO = 1, /*!< general information */
};

/*!
 * \brief orthogonalization methods for the Krylov basis
 */
enum {
  QMRIDR_ORTH_CGS  = 0, /*!< classical Gram-Schmidt */
  QMRIDR_ORTH_MGS  = 1, /*!< modified Gram-Schmidt (default) */
  QMRIDR_ORTH_RCGS = 2, /*!< repeated classical Gram-Schmidt */
};

/*!
 * \struct qmridr_Options
 * \brief POD parameter controls
 * \note Values in parentheses are default settings
 */
struct qmridr_Options {
  int    s;           /*!< dimension of the IDR subspaces (8) */
  int    proj_dim;    /*!< shadow space dimension (0, i.e. s) */
  double rtol;        /*!< relative tolerance (0, i.e. sqrt(eps)) */
  int    maxit;       /*!< maximum iterations (0, i.e. system size) */
  double kappa;       /*!< angle safeguard of the IDR step (0.7) */
  int    orth;        /*!< orthogonalization method (1, i.e. MGS) */
  double orth_tol;    /*!< tolerance of repeated passes (0, i.e. eps) */
  int    orth_repeat; /*!< maximum repeated CGS passes (3) */
  int    skew_repeat; /*!< maximum skew projection passes (1) */
  int    orth_search; /*!< orthogonalize search vectors against R0 during
                         the first IDR cycle (0) */
  int    seed;        /*!< random seed of the shadow space, negative values
                         indicate nondeterministic seeding (0) */
  int    verbose;     /*!< message output level (1, i.e. info) */
};

/*!
 * \typedef qmridr_Options
 * \brief type wrapper
 */
typedef struct qmridr_Options qmridr_Options;

/*!
 * \brief get the default controls
 * \note See the values of attributes in parentheses
 */
static qmridr_Options qmridr_get_default_options(void) {
  qmridr_Options opts;
  opts.s           = 8;
  opts.proj_dim    = 0;
  opts.rtol        = 0.0;
  opts.maxit       = 0;
  opts.kappa       = 0.7;
  opts.orth        = QMRIDR_ORTH_MGS;
  opts.orth_tol    = 0.0;
  opts.orth_repeat = 3;
  opts.skew_repeat = 1;
  opts.orth_search = 0;
  opts.seed        = 0;
  opts.verbose     = QMRIDR_VERBOSE_INFO;
  return opts;
}

/*!
 * \brief get the string tag for orthogonalization methods
 * \param[in] opt options
 * \return C-string of the method name
 */
static const char *qmridr_get_orth_name(const qmridr_Options *opt) {
  if (opt) {
    switch (opt->orth) {
      case QMRIDR_ORTH_CGS:
        return "CGS";
      case QMRIDR_ORTH_MGS:
        return "MGS";
      case QMRIDR_ORTH_RCGS:
        return "RCGS";
      default:
        return "Null";
    }
  }
  return "Null";
}

/*!
 * @}
 */ /* c interface group */

#ifdef __cplusplus
}

/* C++ interface */
#  include <stdexcept>
#  include <string>
#  include <unordered_map>

namespace qmridr {

/*!
 * \addtogroup itr
 * @{
 */

/*!
 * \brief enum wrapper
 * \note The prefix \a QMRIDR is dropped
 */
enum : int {
  VERBOSE_NONE = ::QMRIDR_VERBOSE_NONE, /*!< mute */
  VERBOSE_INFO = ::QMRIDR_VERBOSE_INFO, /*!< general information */
};

/*!
 * \brief enum wrapper for orthogonalization methods
 * \note The prefix \a QMRIDR is dropped
 */
enum : int {
  ORTH_CGS  = ::QMRIDR_ORTH_CGS,  /*!< classical Gram-Schmidt */
  ORTH_MGS  = ::QMRIDR_ORTH_MGS,  /*!< modified Gram-Schmidt */
  ORTH_RCGS = ::QMRIDR_ORTH_RCGS, /*!< repeated classical Gram-Schmidt */
};

/*!
 * \typedef Options
 * \brief type wrapper
 */
typedef qmridr_Options Options;

/*!
 * \brief get the orthogonalization method name
 */
inline std::string get_orth_name(const Options &opt) {
  return ::qmridr_get_orth_name(&opt);
}

/*!
 * \brief get the verbose name
 */
inline std::string get_verbose(const Options &opt);

/*!
 * \brief get the default configuration
 */
inline Options get_default_options() { return ::qmridr_get_default_options(); }

/*!
 * \brief represent an option control with C++ string
 * \param[in] opt input option controls
 * \return string representation of \a opt
 */
inline std::string opt_repr(const Options &opt) {
  using std::string;
  using std::to_string;               /* C++11 */
  const static int leading_size = 30; /* should be enough */
  const auto       pack_int     = [](const string &cat, const int v) -> string {
    return cat + string(leading_size - cat.size(), ' ') + to_string(v) + "\n";
  };
  const auto pack_double = [](const string &cat, const double v) -> string {
    return cat + string(leading_size - cat.size(), ' ') + to_string(v) + "\n";
  };
  const auto pack_name = [](const string &cat, const string &v) -> string {
    return cat + string(leading_size - cat.size(), ' ') + v + "\n";
  };
  return pack_int("s", opt.s) + pack_int("proj_dim", opt.proj_dim) +
         pack_double("rtol", opt.rtol) + pack_int("maxit", opt.maxit) +
         pack_double("kappa", opt.kappa) +
         pack_name("orth", get_orth_name(opt)) +
         pack_double("orth_tol", opt.orth_tol) +
         pack_int("orth_repeat", opt.orth_repeat) +
         pack_int("skew_repeat", opt.skew_repeat) +
         pack_name("orth_search", opt.orth_search ? "yes" : "no") +
         pack_int("seed", opt.seed) + pack_name("verbose", get_verbose(opt));
}

#  ifndef DOXYGEN_SHOULD_SKIP_THIS
namespace internal {
#    define _QMRIDR_TOTAL_OPTIONS 12

/* using unordered map to store the string to index map */
const static std::unordered_map<std::string, int> option_tag2pos = {
    {"s", 0},
    {"proj_dim", 1},
    {"rtol", 2},
    {"maxit", 3},
    {"kappa", 4},
    {"orth", 5},
    {"orth_tol", 6},
    {"orth_repeat", 7},
    {"skew_repeat", 8},
    {"orth_search", 9},
    {"seed", 10},
    {"verbose", 11}};

} /* namespace internal */
#  endif /* DOXYGEN_SHOULD_SKIP_THIS */

/// \brief set \ref Options attribute value from key value pairs
/// \tparam T value type, either \a double or \a int
/// \param[in] attr attribute/member name
/// \param[in] v value
/// \param[out] opt output options
/// \return \a true if \a attr is not a valid attribute name
///
/// This function can be handy while initialing option parameters from string
/// values. Notice that the keys (string values) are the same as the attribute
/// variable names.
template <typename T>
inline bool set_option_attr(const std::string &attr, const T v, Options &opt) {
  const static bool failed = true;
  int               pos;
  try {
    pos = internal::option_tag2pos.at(attr);
  } catch (const std::out_of_range &) {
    return failed;
  }
  switch (pos) {
    case 0:
      opt.s = v;
      break;
    case 1:
      opt.proj_dim = v;
      break;
    case 2:
      opt.rtol = v;
      break;
    case 3:
      opt.maxit = v;
      break;
    case 4:
      opt.kappa = v;
      break;
    case 5:
      opt.orth = v;
      break;
    case 6:
      opt.orth_tol = v;
      break;
    case 7:
      opt.orth_repeat = v;
      break;
    case 8:
      opt.skew_repeat = v;
      break;
    case 9:
      opt.orth_search = v;
      break;
    case 10:
      opt.seed = v;
      break;
    case 11:
      opt.verbose = v;
  }
  return !failed;
}

/*!
 * @}
 */

} /* namespace qmridr */

/*!
 * \brief read control parameters from a standard input streamer
 * \tparam InStream input streamer, i.e. with input operator
 * \param[in,out] in_str input streamer, e.g. \a std::cin
 * \param[out] opt control parameters
 * \return reference to \a in_str to enable chain reaction
 * \note Read data in sequential order with default separators
 * \ingroup itr
 */
template <class InStream>
inline InStream &operator>>(InStream &in_str, qmridr::Options &opt) {
  in_str >> opt.s >> opt.proj_dim >> opt.rtol >> opt.maxit >> opt.kappa >>
      opt.orth >> opt.orth_tol >> opt.orth_repeat >> opt.skew_repeat >>
      opt.orth_search >> opt.seed >> opt.verbose;
  return in_str;
}

/*!
 * \def qmridr_verbose2(__LVL, __opt_tag)
 * \brief return \a true if certain verbose level is defined
 * \note __LVL must be upper case and align with the enumerators
 * \note This macro is for algorithm implementation thus available only in C++
 * \ingroup util
 */
#  define qmridr_verbose2(__LVL, __opt_tag) \
    (__opt_tag & ::qmridr::VERBOSE_##__LVL)

/*!
 * \def qmridr_verbose(__LVL, __opt)
 * \brief return \a true if certain verbose level is defined
 * \note __LVL must be upper case and align with the enumerators
 * \note This macro is for algorithm implementation thus available only in C++
 * \ingroup util
 *
 * \code{.cpp}
 * if (qmridr_verbose(INFO, opt)) ...;
 * \endcode
 */
#  define qmridr_verbose(__LVL, __opt) qmridr_verbose2(__LVL, __opt.verbose)

inline std::string qmridr::get_verbose(const qmridr::Options &opt) {
  if (opt.verbose == VERBOSE_NONE) return "none";
  if (qmridr_verbose(INFO, opt)) return "info";
  return "unknown";
}

#endif /* __cplusplus */

#endif /* _QMRIDR_OPTIONS_H */
