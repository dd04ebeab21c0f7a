///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

// Unit testing utilities

#pragma once

#include <algorithm>
#include <cmath>
#include <complex>
#include <ctime>
#include <limits>
#include <random>
#include <type_traits>
#include <vector>

#ifndef QMRIDR_THROW
#  define QMRIDR_THROW
#endif

#ifdef NDEBUG
#  undef NDEBUG
#endif

#ifndef QMRIDR_DEBUG
#  define QMRIDR_DEBUG
#endif

#include "qmridr/ds/Array.hpp"
#include "qmridr/ds/DenseMatrix.hpp"
#include "qmridr/utils/log.hpp"
#include "qmridr/utils/math.hpp"

//--------------------------
// random number generators
//--------------------------

template <typename T>
class RandGen {
  constexpr static bool _IS_INT = std::is_integral<T>::value;
  typedef typename std::conditional<
      _IS_INT, typename std::uniform_int_distribution<T>,
      typename std::uniform_real_distribution<T>>::type _dist_t;
  mutable std::mt19937_64                               _eng;
  mutable _dist_t                                       _d;

 public:
  typedef T value_type;
  RandGen(T low = T(), T hi = _IS_INT ? std::numeric_limits<T>::max() : (T)1)
      : _eng(std::time(0)), _d(low, hi) {}
  RandGen(const RandGen &) = delete;
  RandGen &operator=(const RandGen &) = delete;
  RandGen(RandGen &&)                 = default;

  inline T operator()() const { return _d(_eng); }
};

typedef RandGen<int>    RandIntGen;
typedef RandGen<double> RandRealGen;

// random scalars, complex numbers have random real and imaginary parts
template <class T>
inline T rand_value(const RandRealGen &r) {
  return T(r());
}

template <>
inline std::complex<double> rand_value<std::complex<double>>(
    const RandRealGen &r) {
  const double re = r();
  return std::complex<double>(re, r());
}

template <class T>
static qmridr::Array<T> gen_rand_array(const int n, const RandRealGen &r) {
  qmridr::Array<T> v(n);
  for (auto &x : v) x = rand_value<T>(r);
  return v;
}

// random strictly diagonally dominant matrix
template <class T>
static qmridr::DenseMatrix<T> gen_diag_dominant(const int n,
                                                const RandRealGen &r) {
  qmridr::DenseMatrix<T> A(n, n);
  for (int j = 0; j < n; ++j)
    for (int i = 0; i < n; ++i) A(i, j) = rand_value<T>(r);
  for (int i = 0; i < n; ++i) {
    double sum(0);
    for (int j = 0; j < n; ++j)
      if (i != j) sum += std::abs(A(i, j));
    A(i, i) = T(sum + 1.0 + r());
  }
  return A;
}

// ||b-A*x||/||b||
template <class T>
static double rel_resid(const qmridr::DenseMatrix<T> &A,
                        const qmridr::Array<T> &b, const qmridr::Array<T> &x) {
  qmridr::Array<T> r(b.size());
  A.multiply(x, r);
  for (std::size_t i = 0u; i < r.size(); ++i) r[i] = b[i] - r[i];
  return qmridr::norm2(r) / qmridr::norm2(b);
}

// random matrix with orthonormal columns through MGS
template <class T>
static qmridr::DenseMatrix<T> gen_orthonormal(const int m, const int n,
                                              const RandRealGen &r) {
  qmridr::DenseMatrix<T> Q(m, n);
  for (auto &v : Q.array()) v = rand_value<T>(r);
  for (int j = 0; j < n; ++j) {
    T *q = Q.col_begin(j);
    for (int k = 0; k < j; ++k) {
      const T h = qmridr::inner(m, (const T *)Q.col_begin(k), (const T *)q);
      qmridr::axpy(m, -h, (const T *)Q.col_begin(k), q);
    }
    qmridr::scale(m, 1.0 / qmridr::norm2(m, q), q);
  }
  return Q;
}
