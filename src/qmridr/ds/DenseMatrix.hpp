///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ds/DenseMatrix.hpp
 * \brief Column major dense matrix

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

#ifndef _QMRIDR_DS_DENSEMATRIX_HPP
#define _QMRIDR_DS_DENSEMATRIX_HPP

#include <algorithm>

#include "qmridr/ds/Array.hpp"
#include "qmridr/utils/log.hpp"

namespace qmridr {

/// \class DenseMatrix
/// \brief Dense storage
/// \tparam ValueType scalar value type, e.g. \a double, \a float, etc
/// \ingroup ds
///
/// To be easily compatible with \b LAPACK, we choose to use column major
/// orientation, a.k.a. Fortran index order. Columns are contiguous, thus
/// they can be wrapped by \ref Array without copying.
template <class ValueType>
class DenseMatrix {
 public:
  typedef Array<ValueType>                     array_type;     ///< array
  typedef typename array_type::value_type      value_type;     ///< value
  typedef typename array_type::pointer         pointer;        ///< pointer
  typedef typename array_type::reference       reference;      ///< reference
  typedef typename array_type::size_type       size_type;      ///< size
  typedef typename array_type::const_pointer   const_pointer;  ///< constant ptr
  typedef typename array_type::const_reference const_reference;
  ///< const reference
  typedef typename array_type::iterator col_iterator;
  ///< column iterator
  typedef typename array_type::const_iterator const_col_iterator;
  ///< constant column iterator

  /// \brief default constructor
  DenseMatrix() : _nrows(0u), _ncols(0u), _data() {}

  /// \brief constructor for own data
  /// \param[in] n1 number of rows
  /// \param[in] n2 number of columns, if == 0, then a square matrix is created
  explicit DenseMatrix(const size_type n1, const size_type n2 = 0u)
      : _nrows(n1), _ncols(n2 ? n2 : n1), _data(_nrows * _ncols) {}

  /// \brief constructor for own data with init value
  /// \param[in] n1 number of rows
  /// \param[in] n2 number of columns
  /// \param[in] v init value
  DenseMatrix(const size_type n1, const size_type n2, const value_type v)
      : _nrows(n1), _ncols(n2), _data(n1 * n2, v) {}

  /// \brief resize the matrix, values are not preserved in a meaningful way
  inline void resize(const size_type n1, const size_type n2) {
    _data.resize(n1 * n2, false);
    _nrows = n1;
    _ncols = n2;
  }

  /// \brief fill all entries with a uniform value
  inline void fill(const value_type v) {
    std::fill(_data.begin(), _data.end(), v);
  }

  // matrix interface
  inline size_type         nrows() const { return _nrows; }
  inline size_type         ncols() const { return _ncols; }
  inline bool              is_squared() const { return _nrows == _ncols; }
  inline bool              empty() const { return _data.empty(); }
  inline pointer           data() { return _data.data(); }
  inline const_pointer     data() const { return _data.data(); }
  inline array_type &      array() { return _data; }
  inline const array_type &array() const { return _data; }

  /// \brief accessing entry (i,j)
  inline reference operator()(const size_type i, const size_type j) {
    qmridr_assert(i < _nrows, "%zd exceeds row bound %zd", i, _nrows);
    qmridr_assert(j < _ncols, "%zd exceeds column bound %zd", j, _ncols);
    return _data[j * _nrows + i];
  }
  inline const_reference operator()(const size_type i,
                                    const size_type j) const {
    qmridr_assert(i < _nrows, "%zd exceeds row bound %zd", i, _nrows);
    qmridr_assert(j < _ncols, "%zd exceeds column bound %zd", j, _ncols);
    return _data[j * _nrows + i];
  }

  /// \brief get the starting iterator of column \a j
  inline col_iterator col_begin(const size_type j) {
    return _data.begin() + j * _nrows;
  }
  inline const_col_iterator col_begin(const size_type j) const {
    return _data.cbegin() + j * _nrows;
  }
  inline col_iterator col_end(const size_type j) {
    return col_begin(j) + _nrows;
  }
  inline const_col_iterator col_end(const size_type j) const {
    return col_begin(j) + _nrows;
  }

  /// \brief wrap column \a j as an array, no copy is involved
  inline array_type col(const size_type j) {
    return array_type(_nrows, col_begin(j), true);
  }

  /// \brief matrix-vector multiplication \f$\mathbf{y}=\mathbf{A}\mathbf{x}\f$
  /// \param[in] x input array
  /// \param[out] y output array
  ///
  /// Provided so that a dense matrix can serve as the operator of a Krylov
  /// solver directly.
  inline void multiply(const array_type &x, array_type &y) const {
    qmridr_error_if(x.size() != _ncols, "unmatched sizes %zd and %zd",
                    x.size(), _ncols);
    qmridr_error_if(y.size() != _nrows, "unmatched sizes %zd and %zd",
                    y.size(), _nrows);
    std::fill(y.begin(), y.end(), value_type(0));
    for (size_type j(0); j < _ncols; ++j) {
      const value_type xj = x[j];
      auto             itr = col_begin(j);
      for (size_type i(0); i < _nrows; ++i) y[i] += itr[i] * xj;
    }
  }

 protected:
  size_type  _nrows;  ///< number of rows
  size_type  _ncols;  ///< number of columns
  array_type _data;   ///< column major data
};

}  // namespace qmridr

#endif  // _QMRIDR_DS_DENSEMATRIX_HPP
