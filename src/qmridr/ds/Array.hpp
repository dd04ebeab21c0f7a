///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/ds/Array.hpp
 * \brief Contiguous array that either owns or wraps its storage

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

#ifndef _QMRIDR_DS_ARRAY_HPP
#define _QMRIDR_DS_ARRAY_HPP

#include <algorithm>
#include <cstddef>
#include <new>

#include "qmridr/utils/log.hpp"

namespace qmridr {

/*!
 * \addtogroup ds
 * @{
 */

enum : unsigned char {
  DATA_UNDEF = 0,  ///< data type undefined
  DATA_WRAP,       ///< wrapping external data
  DATA_OWN,        ///< data type owned
};

/// \class Array
/// \brief Core vector type of the solver
/// \tparam T value type
///
/// Compared to std::vector, \a Array allows one to wrap external data, e.g.
/// a column of a \ref DenseMatrix, without copying. Wrapped arrays can be
/// read and written but never resized. Copies are always deep and own their
/// storage.
template <class T>
class Array {
 public:
  typedef T             value_type;       ///< value type
  typedef T *           pointer;          ///< corresponding pointer type
  typedef T &           reference;        ///< corresponding lvalue reference
  typedef pointer       iterator;         ///< just use pointer for iterator
  typedef const T *     const_pointer;    ///< pointer to constant
  typedef const T &     const_reference;  ///< constant reference
  typedef const_pointer const_iterator;   ///< constant iterator
  typedef std::size_t   size_type;        ///< size type, use std::size_t

  /// \brief default constructor
  Array() : _data(nullptr), _size(0), _cap(0), _status(DATA_UNDEF) {}

  /// \brief constructor with owned (uninitialized) data
  /// \param[in] n length of the array
  explicit Array(const size_type n) : Array() { resize(n); }

  /// \brief similary to Array(n) but with uniform value initialization
  /// \param[in] n length of the array
  /// \param[in] v init value
  Array(const size_type n, const value_type v) : Array(n) {
    std::fill_n(_data, _size, v);
  }

  /// \brief constructor for copying or wrapping external data
  /// \param[in] n size of array
  /// \param[in] data external data
  /// \param[in] wrap flag to indicate wrapping or copying (optional)
  Array(const size_type n, pointer data, bool wrap = false) : Array() {
    if (wrap) {
      _data   = data;
      _size   = _cap = n;
      _status = DATA_WRAP;
    } else {
      resize(n);
      std::copy_n(data, n, _data);
    }
  }

  /// \brief deep copy
  Array(const Array &other) : Array(other._size) {
    std::copy_n(other._data, _size, _data);
  }

  /// \brief move constructor (steal)
  Array(Array &&other)
      : _data(other._data),
        _size(other._size),
        _cap(other._cap),
        _status(other._status) {
    other._reset();
  }

  ~Array() { _release(); }

  /// \brief deep copy assignment, reusing the capacity if possible
  Array &operator=(const Array &other) {
    if (this != &other) {
      if (_status == DATA_WRAP)
        qmridr_error_if(_size != other._size,
                        "cannot assign %zd values to a wrapper of size %zd",
                        other._size, _size);
      else
        resize(other._size, false);
      std::copy_n(other._data, other._size, _data);
    }
    return *this;
  }

  /// \brief move assignment
  Array &operator=(Array &&other) {
    if (this != &other) {
      _release();
      _data   = other._data;
      _size   = other._size;
      _cap    = other._cap;
      _status = other._status;
      other._reset();
    }
    return *this;
  }

  /// \brief accessing data position i
  inline reference operator[](const size_type i) {
    qmridr_assert(i < _size, "%zd exceeds the size bound %zd", i, _size);
    return _data[i];
  }
  inline const_reference operator[](const size_type i) const {
    qmridr_assert(i < _size, "%zd exceeds the size bound %zd", i, _size);
    return _data[i];
  }

  // bound checking acessing
  inline reference at(const size_type i) {
    qmridr_error_if(i >= _size, "%zd exceeds the size bound %zd", i, _size);
    return _data[i];
  }
  inline const_reference at(const size_type i) const {
    qmridr_error_if(i >= _size, "%zd exceeds the size bound %zd", i, _size);
    return _data[i];
  }

  // utilities mimic STL
  inline pointer         data() { return _data; }
  inline const_pointer   data() const { return _data; }
  inline size_type       size() const { return _size; }
  inline size_type       capacity() const { return _cap; }
  inline bool            empty() const { return _size == 0u; }
  inline unsigned char   status() const { return _status; }
  inline reference       front() { return *_data; }
  inline reference       back() { return _data[_size - 1]; }
  inline const_reference front() const { return *_data; }
  inline const_reference back() const { return _data[_size - 1]; }
  inline void            swap(Array &rhs) {
    std::swap(_data, rhs._data);
    std::swap(_size, rhs._size);
    std::swap(_cap, rhs._cap);
    std::swap(_status, rhs._status);
  }

  // iterators and range loop functionality
  inline iterator       begin() { return _data; }
  inline const_iterator begin() const { return _data; }
  inline iterator       end() { return _data + _size; }
  inline const_iterator end() const { return _data + _size; }
  inline const_iterator cbegin() const { return _data; }
  inline const_iterator cend() const { return _data + _size; }

  /// \brief resize an Array with new size
  /// \param[in] n new size
  /// \param[in] presv if \a true (default), then values will be preserved
  /// \note No reallocation happens if \a n does not exceed \ref capacity
  inline void resize(const size_type n, const bool presv = true) {
    qmridr_error_if(_status == DATA_WRAP && n != _size,
                    "cannot resize external data");
    if (n <= _cap) {
      _size = n;
      return;
    }
    _grow(n, presv);
    _size = n;
  }

  /// \brief reserve space for Array
  /// \param[in] n capacity request
  inline void reserve(const size_type n) {
    qmridr_error_if(_status == DATA_WRAP,
                    "cannot call reserve for external data");
    if (_cap >= n) return;
    _grow(n, true);
  }

  /// \brief append a new value
  /// \note amortized by a 20% over-allocation if the capacity is exhausted
  inline void push_back(const value_type v) {
    if (_size == _cap) reserve(_size ? _size + _size / 5 + 1 : 1);
    _data[_size++] = v;
  }

 protected:
  pointer       _data;    ///< data pointer
  size_type     _size;    ///< array size
  size_type     _cap;     ///< array capacity
  unsigned char _status;  ///< array status, see \a enum above

 private:
  inline void _reset() {
    _data = nullptr;
    _size = _cap = 0u;
    _status      = DATA_UNDEF;
  }

  inline void _release() {
    if (_status == DATA_OWN) delete[] _data;
    _reset();
  }

  inline void _grow(const size_type cap, const bool presv) {
    pointer data = new (std::nothrow) value_type[cap];
    qmridr_error_if(!data, "memory allocation failed for %zd entries", cap);
    if (presv && _data) std::copy_n(_data, _size, data);
    const size_type size_bak = _size;
    _release();
    _data   = data;
    _size   = size_bak;
    _cap    = cap;
    _status = DATA_OWN;
  }
};

/*!
 * @}
 */ // group ds

}  // namespace qmridr

#endif  // _QMRIDR_DS_ARRAY_HPP
