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


#include "testutil.h"
#include "errors.h"
#include <dirent.h>
#include <errno.h>
#include <fitsio.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <iostream>

namespace Visconv
{
namespace test
{

TempDir::TempDir() {
  char tmpl[]="/tmp/visconv_testXXXXXX";
  if (!mkdtemp(tmpl)) {
    throw IOError(std::string("Cannot create temporary directory: ")+strerror(errno));
  }
  path_=tmpl;
}

TempDir::~TempDir() {
  DIR *d=opendir(path_.c_str());
  if (d) {
    struct dirent *e;
    while ((e=readdir(d))!=NULL) {
      if (!strcmp(e->d_name,".") || !strcmp(e->d_name,"..")) {
        continue;
      }
      unlink(file(e->d_name).c_str());
    }
    closedir(d);
  }
  if (rmdir(path_.c_str())) {
    std::cerr<<"Warning: cannot remove "<<path_<<std::endl;
  }
}

void
writeMwaf(const std::string &fname, int Nchan, int Nant, int Nscans,
  int width, const std::vector<unsigned char> &bits, bool bitColumn) {
  fitsfile *fptr;
  int status=0;
  fits_create_file(&fptr,fname.c_str(),&status);
  fits_create_img(fptr,BYTE_IMG,0,NULL,&status);
  fits_write_key(fptr,TINT,"NCHANS",&Nchan,NULL,&status);
  fits_write_key(fptr,TINT,"NANTENNA",&Nant,NULL,&status);
  fits_write_key(fptr,TINT,"NSCANS",&Nscans,NULL,&status);
  int gpsstart=1065880128;
  fits_write_key(fptr,TINT,"GPSTIME",&gpsstart,NULL,&status);

  char form[16];
  if (bitColumn) {
    snprintf(form,16,"%dX",Nchan);
  } else {
    snprintf(form,16,"%dB",width);
  }
  char *ttype[]={(char*)"FLAGS"};
  char *tform[]={form};
  fits_create_tbl(fptr,BINARY_TBL,0,1,ttype,tform,NULL,NULL,&status);
  if (!bits.empty()) {
    fits_write_col(fptr,TBYTE,1,1,1,(LONGLONG)bits.size(),
       const_cast<unsigned char*>(&bits[0]),&status);
  }
  fits_close_file(fptr,&status);
  checkFitsStatus(status,"Writing test flag file "+fname);
}

std::vector<unsigned char>
makeFlagBits(const std::vector<unsigned int> &counts, size_t nrows, unsigned int width) {
  std::vector<unsigned char> bits(nrows*width,0);
  for (size_t ch=0; ch<counts.size(); ch++) {
    for (size_t row=0; row<counts[ch] && row<nrows; row++) {
      /* most significant bit is the lowest channel */
      bits[row*width+ch/8]|=(unsigned char)(0x80>>(ch%8));
    }
  }
  return bits;
}

bool
fileExists(const std::string &fname) {
  return access(fname.c_str(),F_OK)==0;
}

}
}
