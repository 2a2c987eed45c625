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

#ifndef __VISCONV_FITSUTIL_H__
#define __VISCONV_FITSUTIL_H__

#include <fitsio.h>
#include <string>

namespace Visconv
{

    /* closes the file when going out of scope, unless released */
    class FitsCloser {
    public:
      explicit FitsCloser(fitsfile *fptr) : fptr_(fptr) {}
      ~FitsCloser() {
        if (fptr_) {
          int status=0;
          fits_close_file(fptr_,&status);
        }
      }
      fitsfile *release() { fitsfile *f=fptr_; fptr_=0; return f; }
    private:
      FitsCloser(const FitsCloser&);
      FitsCloser &operator=(const FitsCloser&);
      fitsfile *fptr_;
    };

    /* read a key that must be present in the current HDU */
    long readLongKey(fitsfile *fptr, const char *key);
    double readDoubleKey(fitsfile *fptr, const char *key);
    /* false if the key is absent, val is then left alone */
    bool readDoubleKey(fitsfile *fptr, const char *key, double *val);
    /* returns defval if the key is absent */
    std::string readStringKey(fitsfile *fptr, const char *key, const std::string &defval);

    /* file exists and could be removed, throws IOError if removal fails */
    void removeIfExists(const std::string &fname);
    /* both names resolve to the same existing file */
    bool sameFile(const std::string &a, const std::string &b);
    /* byte for byte copy of src into dest, dest is replaced,
       throws ValueError if dest is src */
    void copyFile(const std::string &src, const std::string &dest);
}
#endif /* __VISCONV_FITSUTIL_H__ */
