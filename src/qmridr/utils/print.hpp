///////////////////////////////////////////////////////////////////////////////
//                  This file is part of the QMRIDR library                  //
///////////////////////////////////////////////////////////////////////////////

/*!
 * \file qmridr/utils/print.hpp
 * \brief Macros for "stdout" and "stderr" message printers
 *
 * Both hooks receive a C-string without a trailing newline. Predefine
 * \ref QMRIDR_STDOUT and/or \ref QMRIDR_STDERR to redirect the messages,
 * e.g. to a log file or to the printer of a host application.

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

#ifndef _QMRIDR_UTILS_PRINT_HPP
#define _QMRIDR_UTILS_PRINT_HPP

/// \def QMRIDR_STDOUT(__msg_wo_nl)
/// \brief dump message string to "stdout"
/// \ingroup macros
#ifndef QMRIDR_STDOUT
#  include <iostream>
#  define QMRIDR_STDOUT(__msg_wo_nl) std::cout << __msg_wo_nl << '\n'
#endif  // QMRIDR_STDOUT

/// \def QMRIDR_STDERR(__msg_wo_nl)
/// \brief dump message string to "stderr"
/// \ingroup macros
#ifndef QMRIDR_STDERR
#  include <iostream>
#  define QMRIDR_STDERR(__msg_wo_nl) std::cerr << __msg_wo_nl << '\n'
#endif  // QMRIDR_STDERR

#endif  // _QMRIDR_UTILS_PRINT_HPP
