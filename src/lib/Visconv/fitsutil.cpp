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

#include "fitsutil.h"
#include "errors.h"
#include <fstream>
#include <unistd.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

namespace Visconv
{

long
readLongKey(fitsfile *fptr, const char *key) {
  int status=0;
  long val=0;
  fits_read_key(fptr,TLONG,key,&val,NULL,&status);
  checkFitsStatus(status,std::string("Reading key ")+key);
  return val;
}

double
readDoubleKey(fitsfile *fptr, const char *key) {
  int status=0;
  double val=0.0;
  fits_read_key(fptr,TDOUBLE,key,&val,NULL,&status);
  checkFitsStatus(status,std::string("Reading key ")+key);
  return val;
}

bool
readDoubleKey(fitsfile *fptr, const char *key, double *val) {
  int status=0;
  double v=0.0;
  fits_read_key(fptr,TDOUBLE,key,&v,NULL,&status);
  if (status==KEY_NO_EXIST) {
    fits_clear_errmsg();
    return false;
  }
  checkFitsStatus(status,std::string("Reading key ")+key);
  *val=v;
  return true;
}

std::string
readStringKey(fitsfile *fptr, const char *key, const std::string &defval) {
  int status=0;
  char val[FLEN_VALUE]={0};
  fits_read_key(fptr,TSTRING,key,val,NULL,&status);
  if (status==KEY_NO_EXIST) {
    fits_clear_errmsg();
    return defval;
  }
  checkFitsStatus(status,std::string("Reading key ")+key);
  return std::string(val);
}

void
removeIfExists(const std::string &fname) {
  if (access(fname.c_str(),F_OK)!=0) {
    return;
  }
  if (unlink(fname.c_str())!=0) {
    throw IOError("Cannot remove existing file "+fname+": "+strerror(errno));
  }
}

bool
sameFile(const std::string &a, const std::string &b) {
  char *ra=realpath(a.c_str(),NULL);
  char *rb=realpath(b.c_str(),NULL);
  bool same=(ra && rb && !strcmp(ra,rb));
  free(ra);
  free(rb);
  return same;
}

void
copyFile(const std::string &src, const std::string &dest) {
  /* opening dest would truncate src before it is read */
  if (sameFile(src,dest)) {
    throw ValueError("Cannot copy "+src+" onto itself ("+dest+")");
  }
  std::ifstream in(src.c_str(),std::ios::binary);
  if (!in.good()) {
    throw IOError("Cannot open "+src+" for reading");
  }
  std::ofstream out(dest.c_str(),std::ios::binary|std::ios::trunc);
  if (!out.good()) {
    throw IOError("Cannot open "+dest+" for writing");
  }
  out<<in.rdbuf();
  out.close();
  if (!out) {
    throw IOError("Copying "+src+" to "+dest+" failed");
  }
}

}
