/*
 *
 Copyright (C) 2024 The visconv developers
 This program is free software; you can redistribute it and/or modify
 it under the terms of the GNU General Public License as published by
 the Free Software Foundation; either version 2 of the License, or
 (at your option) any later version.

 This program is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 GNU General Public License for more details.

 You should have received a copy of the GNU General Public License
 along with this program; if not, write to the Free Software
 Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 $Id$
 */

#ifndef __VISCONV_ERRORS_H__
#define __VISCONV_ERRORS_H__

#include <stdexcept>
#include <string>

namespace Visconv
{

    /* base class for all errors raised by the library */
    class Error : public std::runtime_error {
    public:
      explicit Error(const std::string &msg) : std::runtime_error(msg) {}
    };

    /* missing/malformed header key, buffer length mismatch */
    class FormatError : public Error {
    public:
      explicit FormatError(const std::string &msg) : Error(msg) {}
    };

    /* argument out of range, mismatched row length */
    class ValueError : public Error {
    public:
      explicit ValueError(const std::string &msg) : Error(msg) {}
    };

    /* failure creating, copying or writing a file */
    class IOError : public Error {
    public:
      explicit IOError(const std::string &msg) : Error(msg) {}
    };

    /* geodetic/time conversion returned a non-zero status */
    class ConversionError : public Error {
    public:
      ConversionError(const std::string &function, int status);
      int status() const { return status_; }
    private:
      int status_;
    };

    /* throw if cfitsio status is non-zero,
       KEY_NO_EXIST and VALUE_UNDEFINED give FormatError, anything else IOError.
       context: what was being done, prepended to cfitsio's message */
    void checkFitsStatus(int status, const std::string &context);
}
#endif /* __VISCONV_ERRORS_H__ */
