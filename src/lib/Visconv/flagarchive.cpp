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

#include "flagarchive.h"
#include "errors.h"
#include "fitsutil.h"
#include <iostream>
#include <sstream>
#include <stdio.h>
#include <string.h>
#include <pthread.h>

namespace Visconv
{

/* structure for worker threads for histogram decoding */
typedef struct thread_data_hist_ {
  unsigned int startcol; /* first byte column */
  unsigned int endcol; /* one past last byte column */
  unsigned int width; /* bytes per row */
  size_t nrows; /* rows */
  const unsigned char *bits; /* packed flags, size nrows*width */
  unsigned int Nchan; /* channels */
  uint32_t *total; /* per thread channel totals, size Nchan */
} thread_data_hist_t;

unsigned int
bitToChannel(unsigned int column, unsigned int bit) {
  return 7*(column+1)+column-bit;
}

/* histogram of byte values in each column, then unpack the
   bits of the 256 possible values into channel totals */
static void
accumulate_columns(const thread_data_hist_t *t) {
  uint32_t histogram[256];
  for (unsigned int s=t->startcol; s<t->endcol; s++) {
    memset(histogram,0,sizeof(histogram));
    const unsigned char *col=&t->bits[s];
    for (size_t row=0; row<t->nrows; row++) {
      histogram[col[row*t->width]]++;
    }
    /* value 0 has no bits set */
    for (unsigned int v=1; v<256; v++) {
      if (!histogram[v]) {
        continue;
      }
      for (unsigned int bit=0; bit<8; bit++) {
        if ((v>>bit)&0x1) {
          unsigned int ch=bitToChannel(s,bit);
          /* padding bits beyond the last channel */
          if (ch<t->Nchan) {
            t->total[ch]+=histogram[v];
          }
        }
      }
    }
  }
}

static void *
histogram_threadfn(void *data) {
  accumulate_columns((thread_data_hist_t*)data);
  return NULL;
}

BitFlagArchive::BitFlagArchive(unsigned int Nchan, unsigned int Nant, unsigned int Nscans,
  unsigned int width, const std::vector<unsigned char> &bits, const std::string &source)
  : Nchan_(Nchan), N_(Nant), Nscans_(Nscans), width_(width), bits_(bits), source_(source) {
  if (!Nchan_ || !N_ || !Nscans_ || !width_) {
    std::ostringstream msg;
    msg<<"Flag archive dimensions must be positive, got channels="<<Nchan_
       <<" antennas="<<N_<<" scans="<<Nscans_<<" width="<<width_;
    throw FormatError(msg.str());
  }
  if (Nchan_>width_*8) {
    std::ostringstream msg;
    msg<<"Flag rows of "<<width_<<" bytes cannot hold "<<Nchan_<<" channels";
    throw FormatError(msg.str());
  }
  if (bits_.size()!=rowCount()*width_) {
    std::ostringstream msg;
    msg<<"Flag buffer has "<<bits_.size()<<" bytes, expected "<<rowCount()*width_
       <<" ("<<baselineCount()<<" baselines x "<<Nscans_<<" scans x "<<width_<<" bytes)";
    throw FormatError(msg.str());
  }
}

BitFlagArchive
BitFlagArchive::load(const std::string &fname) {
  fitsfile *fptr=0;
  int status=0;
  fits_open_file(&fptr,fname.c_str(),READONLY,&status);
  checkFitsStatus(status,"Opening flag file "+fname);
  FitsCloser closer(fptr);

  long Nchan=readLongKey(fptr,"NCHANS");
  long Nant=readLongKey(fptr,"NANTENNA");
  long Nscans=readLongKey(fptr,"NSCANS");
  if (Nchan<=0 || Nant<=0 || Nscans<=0) {
    std::ostringstream msg;
    msg<<fname<<": invalid NCHANS="<<Nchan<<" NANTENNA="<<Nant<<" NSCANS="<<Nscans;
    throw FormatError(msg.str());
  }

  int hdutype=0;
  fits_movabs_hdu(fptr,2,&hdutype,&status);
  if (status==END_OF_FILE) {
    fits_clear_errmsg();
    throw FormatError(fname+": no flag table extension");
  }
  checkFitsStatus(status,"Moving to flag table of "+fname);
  if (hdutype!=BINARY_TBL) {
    throw FormatError(fname+": flag extension is not a binary table");
  }
  long width=readLongKey(fptr,"NAXIS1");
  long nrows=readLongKey(fptr,"NAXIS2");

  /* first column must span the whole row */
  int typecode=0;
  long repeat=0,colwidth=0;
  fits_get_coltype(fptr,1,&typecode,&repeat,&colwidth,&status);
  checkFitsStatus(status,"Reading flag column of "+fname);
  long colbytes=(typecode==TBIT?(repeat+7)/8:repeat*colwidth);
  if (colbytes!=width) {
    std::ostringstream msg;
    msg<<fname<<": flag column has "<<colbytes<<" bytes per row, NAXIS1="<<width;
    throw FormatError(msg.str());
  }

  size_t Nbase=(size_t)Nant*(Nant+1)/2;
  size_t expected=Nbase*(size_t)Nscans*(size_t)width;
  if ((size_t)width*(size_t)nrows!=expected) {
    std::ostringstream msg;
    msg<<fname<<": flag table has "<<nrows<<" rows of "<<width<<" bytes, expected "
       <<Nbase*Nscans<<" rows ("<<Nbase<<" baselines x "<<Nscans<<" scans)";
    throw FormatError(msg.str());
  }

  std::vector<unsigned char> bits(expected,0);
  unsigned char nulval=0;
  int anynul=0;
  fits_read_col(fptr,TBYTE,1,1,1,(LONGLONG)expected,&nulval,&bits[0],&anynul,&status);
  checkFitsStatus(status,"Reading flags of "+fname);

  return BitFlagArchive((unsigned int)Nchan,(unsigned int)Nant,(unsigned int)Nscans,
     (unsigned int)width,bits,fname);
}

std::vector<uint32_t>
BitFlagArchive::decodeChannelHistograms(int Nt) const {
  std::vector<uint32_t> total(Nchan_,0);
  if (Nt<1) {
    Nt=1;
  }
  if ((unsigned int)Nt>width_) {
    Nt=(int)width_;
  }

  if (Nt==1) {
    thread_data_hist_t t;
    t.startcol=0;
    t.endcol=width_;
    t.width=width_;
    t.nrows=rowCount();
    t.bits=&bits_[0];
    t.Nchan=Nchan_;
    t.total=&total[0];
    accumulate_columns(&t);
    return total;
  }

  /* each thread gets a range of columns and its own totals */
  std::vector<std::vector<uint32_t> > partial(Nt,std::vector<uint32_t>(Nchan_,0));
  std::vector<thread_data_hist_t> threaddata(Nt);
  std::vector<pthread_t> th_array(Nt);
  pthread_attr_t attr;
  pthread_attr_init(&attr);
  pthread_attr_setdetachstate(&attr,PTHREAD_CREATE_JOINABLE);

  unsigned int Ncol=(width_+Nt-1)/Nt;
  unsigned int ci=0;
  int nth=0;
  int err=0;
  for (nth=0; nth<Nt && ci<width_; nth++) {
    threaddata[nth].startcol=ci;
    threaddata[nth].endcol=(ci+Ncol<width_?ci+Ncol:width_);
    threaddata[nth].width=width_;
    threaddata[nth].nrows=rowCount();
    threaddata[nth].bits=&bits_[0];
    threaddata[nth].Nchan=Nchan_;
    threaddata[nth].total=&partial[nth][0];
    if ((err=pthread_create(&th_array[nth],&attr,histogram_threadfn,(void*)&threaddata[nth]))!=0) {
      break;
    }
    ci=threaddata[nth].endcol;
  }
  for (int cj=0; cj<nth; cj++) {
    pthread_join(th_array[cj],NULL);
  }
  pthread_attr_destroy(&attr);
  if (err) {
    throw Error(std::string("Cannot create histogram thread: ")+strerror(err));
  }

  for (int cj=0; cj<nth; cj++) {
    for (unsigned int ch=0; ch<Nchan_; ch++) {
      total[ch]+=partial[cj][ch];
    }
  }
  return total;
}

void
BitFlagArchive::writeWithReflag(const std::string &dest, const ReflagDirective &directive) const {
  if (source_.empty()) {
    throw IOError("Flag archive has no backing file to copy");
  }
  if (sameFile(source_,dest)) {
    throw ValueError("Reflagged output "+dest+" is the same file as "+source_);
  }

  copyFile(source_,dest);

  fitsfile *fptr=0;
  int status=0;
  fits_open_file(&fptr,dest.c_str(),READWRITE,&status);
  checkFitsStatus(status,"Opening "+dest);
  FitsCloser closer(fptr);
  int hdutype=0;
  fits_movabs_hdu(fptr,2,&hdutype,&status);
  checkFitsStatus(status,"Moving to flag table of "+dest);

  char key[FLEN_KEYWORD];
  for (size_t ci=0; ci<directive.size(); ci++) {
    snprintf(key,FLEN_KEYWORD,"REFLG_%02u",directive[ci].ordinal);
    unsigned int chan=directive[ci].channel;
    fits_update_key(fptr,TUINT,key,&chan,NULL,&status);
    checkFitsStatus(status,std::string("Writing ")+key+" to "+dest);
  }

  fitsfile *f=closer.release();
  fits_close_file(f,&status);
  checkFitsStatus(status,"Closing "+dest);
}

}
