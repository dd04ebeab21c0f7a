///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/utils/common.hpp
 * \brief Common traits, constants and message streamers

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

#ifndef _QMRIDR_UTILS_COMMON_HPP
#define _QMRIDR_UTILS_COMMON_HPP

#include <complex>
#include <limits>
#include <type_traits>

#include "qmridr/utils/log.hpp"

namespace qmridr {

/*!
 * \addtogroup util
 * @{
 */

/// \brief trait extract value type
/// \tparam T value type
/// \note For user-defined types, instance this trait
///
/// By default, the value type is \a void for compilation error handling
template <class T>
struct ValueTypeTrait {
  typedef void value_type;  ///< value type
};

/// \class Const
/// \brief constant values
/// \tparam T value type
template <class T>
class Const {
 public:
  typedef typename ValueTypeTrait<T>::value_type value_type;  ///< value type
  typedef std::numeric_limits<value_type>        std_trait;   ///< std trait

  constexpr static value_type EPS = std_trait::epsilon();  ///< machine prec

  static_assert(!std::is_same<value_type, void>::value,
                "not a support value type, instance ValueTypeTrait first");
};

#ifndef DOXYGEN_SHOULD_SKIP_THIS

template <class T>
constexpr typename Const<T>::value_type Const<T>::EPS;

// long double
template <>
struct ValueTypeTrait<long double> {
  using value_type = long double;
};

// double
template <>
struct ValueTypeTrait<double> {
  using value_type = double;
};

// float
template <>
struct ValueTypeTrait<float> {
  using value_type = float;
};

// for standard complex numbers
template <class T>
struct ValueTypeTrait<std::complex<T>> {
  typedef typename ValueTypeTrait<T>::value_type value_type;
};

#endif  // DOXYGEN_SHOULD_SKIP_THIS

/*!
 * @}
 */ // group util

namespace internal {

/*!
 * \addtogroup util
 * @{
 */

/// \struct StdoutStruct
/// \brief struct wrapped around \a stdout
struct StdoutStruct {
  template <class... Args>
  inline void operator()(const char *f, Args... args) const {
    qmridr_info(f, args...);
  }
};

/// \struct StderrStruct
/// \brief struct wrapped around \a stderr
struct StderrStruct {
  template <class... Args>
  inline void operator()(const char *file, const char *func,
                         const unsigned line, const char *f,
                         Args... args) const {
    if (warn_flag()) warning(nullptr, file, func, line, f, args...);
  }
};

/// \struct DummyStreamer
/// \brief dummy streamer (empty functor)
struct DummyStreamer {
  template <class... Args>
  inline void operator()(const char *, Args...) const {}
};

/// \struct DummyErrorStreamer
/// \brief streamer with error/warning information for dummy usage
struct DummyErrorStreamer {
  template <class... Args>
  inline void operator()(const char *, const char *, const unsigned,
                         const char *, Args...) const {}
};

/*!
 * @}
 */

}  // namespace internal
}  // namespace qmridr

#endif  // _QMRIDR_UTILS_COMMON_HPP
