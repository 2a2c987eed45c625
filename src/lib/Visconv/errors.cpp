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

#include "errors.h"
#include <fitsio.h>
#include <sstream>

namespace Visconv
{

ConversionError::ConversionError(const std::string &function, int status)
  : Error("Call to "+function+" returned status code "+std::to_string(status)),
    status_(status) {
}

void
checkFitsStatus(int status, const std::string &context) {
  if (!status) {
    return;
  }
  char errtext[FLEN_STATUS]={0};
  fits_get_errstatus(status,errtext);
  std::ostringstream msg;
  msg<<context<<": "<<errtext<<" (cfitsio status "<<status<<")";
  /* drop the rest of the cfitsio error stack, it is in msg now */
  fits_clear_errmsg();
  if (status==KEY_NO_EXIST || status==VALUE_UNDEFINED) {
    throw FormatError(msg.str());
  }
  throw IOError(msg.str());
}

}
