///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/utils/math.hpp
 * \brief Scalar and vector kernels used by the Krylov solver

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

#ifndef _QMRIDR_UTILS_MATH_HPP
#define _QMRIDR_UTILS_MATH_HPP

#include <cmath>
#include <complex>
#include <cstddef>

#include "qmridr/utils/common.hpp"

namespace qmridr {

/*!
 * \addtogroup util
 * @{
 */

/// \name scalar helpers
/// Plain overloads (no templates) so that they take precedence over the
/// \a std templates found through argument dependent lookup.
/// @{

inline long double conj(const long double v) { return v; }
inline double      conj(const double v) { return v; }
inline float       conj(const float v) { return v; }
inline std::complex<double> conj(const std::complex<double> &v) {
  return std::conj(v);
}
inline std::complex<float> conj(const std::complex<float> &v) {
  return std::conj(v);
}

inline long double abs(const long double v) { return std::abs(v); }
inline double      abs(const double v) { return std::abs(v); }
inline float       abs(const float v) { return std::abs(v); }
inline double      abs(const std::complex<double> &v) { return std::abs(v); }
inline float       abs(const std::complex<float> &v) { return std::abs(v); }

/// \brief squared modulus, i.e. \f$\bar{v}v\f$ as a real number
inline double abs2(const double v) { return v * v; }
inline float  abs2(const float v) { return v * v; }
inline double abs2(const std::complex<double> &v) { return std::norm(v); }
inline float  abs2(const std::complex<float> &v) { return std::norm(v); }

/// @}

/// \brief compute the dot product \f$\mathbf{x}^H\mathbf{y}\f$
/// \tparam T value type
/// \param[in] n length
/// \param[in] x first vector, conjugated
/// \param[in] y second vector
template <class T>
inline T inner(const std::size_t n, const T *x, const T *y) {
  T tmp(0);
  for (std::size_t i(0); i < n; ++i) tmp += conj(x[i]) * y[i];
  return tmp;
}

/// \brief compute the 2-norm square of a vector
/// \tparam T value type
/// \param[in] n length
/// \param[in] x vector
template <class T>
inline typename ValueTypeTrait<T>::value_type norm2_sq(const std::size_t n,
                                                       const T *         x) {
  typename ValueTypeTrait<T>::value_type tmp(0);
  for (std::size_t i(0); i < n; ++i) tmp += abs2(x[i]);
  return tmp;
}

/// \brief compute the Euclidean norm of a vector
/// \tparam T value type
/// \param[in] n length
/// \param[in] x vector
///
/// The entries are scaled by the largest magnitude first, so that the
/// accumulation neither overflows nor underflows.
template <class T>
inline typename ValueTypeTrait<T>::value_type norm2(const std::size_t n,
                                                    const T *         x) {
  using scalar_type = typename ValueTypeTrait<T>::value_type;

  scalar_type max_mag(0);
  for (std::size_t i(0); i < n; ++i) {
    const scalar_type a = abs(x[i]);
    if (a > max_mag || a != a) max_mag = a;
  }
  if (max_mag == scalar_type(0) || !std::isfinite(max_mag)) return max_mag;
  const scalar_type alpha = scalar_type(1) / max_mag;
  scalar_type       tmp(0);
  for (std::size_t i(0); i < n; ++i) tmp += abs2(x[i] * alpha);
  return max_mag * std::sqrt(tmp);
}

/// \brief scale a vector in place
/// \tparam T value type
/// \tparam V scaling factor type
template <class T, class V>
inline void scale(const std::size_t n, const V alpha, T *x) {
  for (std::size_t i(0); i < n; ++i) x[i] *= alpha;
}

/// \brief \f$\mathbf{y}=\mathbf{y}+\alpha\mathbf{x}\f$
/// \tparam T value type
template <class T>
inline void axpy(const std::size_t n, const T alpha, const T *x, T *y) {
  for (std::size_t i(0); i < n; ++i) y[i] += alpha * x[i];
}

/// \brief compute the dot product of two arrays
/// \tparam ArrayType array type, see, for instance, \ref Array
/// \param[in] v1 first array input, conjugated
/// \param[in] v2 second array input
template <class ArrayType>
inline typename ArrayType::value_type inner(const ArrayType &v1,
                                            const ArrayType &v2) {
  return inner(v1.size(), v1.data(), v2.data());
}

/// \brief compute the norm 2 square
/// \tparam ArrayType array type, see, for instance, \ref Array
template <class ArrayType>
inline typename ValueTypeTrait<typename ArrayType::value_type>::value_type
norm2_sq(const ArrayType &v) {
  return norm2_sq(v.size(), v.data());
}

/// \brief compute the Euclidean norm of a given array
/// \tparam ArrayType array type, see, for instance, \ref Array
template <class ArrayType>
inline typename ValueTypeTrait<typename ArrayType::value_type>::value_type
norm2(const ArrayType &v) {
  return norm2(v.size(), v.data());
}

/*!
 * @}
 */

}  // namespace qmridr

#endif  // _QMRIDR_UTILS_MATH_HPP
