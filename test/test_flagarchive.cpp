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


#include <catch2/catch.hpp>

#include "errors.h"
#include "flagarchive.h"
#include "testutil.h"
#include <fitsio.h>
#include <stdlib.h>

using namespace Visconv;

/* set bits counted one by one */
static std::vector<uint32_t>
naive_counts(const BitFlagArchive &a) {
  std::vector<uint32_t> counts(a.channelCount(),0);
  const std::vector<unsigned char> &bits=a.rawBits();
  for (size_t row=0; row<a.rowCount(); row++) {
    for (unsigned int ch=0; ch<a.channelCount(); ch++) {
      unsigned char byte=bits[row*a.rowWidth()+ch/8];
      if (byte&(0x80>>(ch%8))) {
        counts[ch]++;
      }
    }
  }
  return counts;
}

TEST_CASE("channel of a bit", "[flagarchive]") {
  SECTION("most significant bit is the first channel of a column") {
    REQUIRE(bitToChannel(0,7)==0);
    REQUIRE(bitToChannel(0,0)==7);
    REQUIRE(bitToChannel(1,7)==8);
    REQUIRE(bitToChannel(3,0)==31);
  }

  SECTION("every channel of a column is hit once") {
    std::vector<int> seen(16,0);
    for (unsigned int s=0; s<2; s++) {
      for (unsigned int b=0; b<8; b++) {
        seen[bitToChannel(s,b)]++;
      }
    }
    for (size_t ch=0; ch<seen.size(); ch++) {
      REQUIRE(seen[ch]==1);
    }
  }
}

TEST_CASE("in memory archive", "[flagarchive]") {
  SECTION("dimensions") {
    /* 3 antennas: 6 baselines with autocorrelations */
    std::vector<unsigned char> bits(6*2*1,0);
    BitFlagArchive a(8,3,2,1,bits);
    REQUIRE(a.baselineCount()==6);
    REQUIRE(a.rowCount()==12);
    REQUIRE(a.channelCount()==8);
    REQUIRE(a.source().empty());
  }

  SECTION("buffer size must match") {
    std::vector<unsigned char> bits(11,0);
    REQUIRE_THROWS_AS((BitFlagArchive(8,3,2,1,bits)),FormatError);
  }

  SECTION("channels must fit in a row") {
    std::vector<unsigned char> bits(12,0);
    REQUIRE_THROWS_AS((BitFlagArchive(9,3,2,1,bits)),FormatError);
  }

  SECTION("zero dimensions") {
    std::vector<unsigned char> bits;
    REQUIRE_THROWS_AS((BitFlagArchive(8,0,2,1,bits)),FormatError);
  }

  SECTION("writing needs a backing file") {
    std::vector<unsigned char> bits(12,0);
    BitFlagArchive a(8,3,2,1,bits);
    test::TempDir tmp;
    REQUIRE_THROWS_AS((a.writeWithReflag(tmp.file("out.mwaf"),ReflagDirective())),IOError);
  }
}

TEST_CASE("histogram decode", "[flagarchive]") {
  /* 30 channels in 4 bytes, 2 padding bits */
  const unsigned int Nant=5, Nscans=7, width=4, Nchan=30;
  size_t nrows=(size_t)Nant*(Nant+1)/2*Nscans;
  std::vector<unsigned char> bits(nrows*width);
  srand(42);
  for (size_t ci=0; ci<bits.size(); ci++) {
    bits[ci]=(unsigned char)(rand()&0xff);
  }
  BitFlagArchive a(Nchan,Nant,Nscans,width,bits);
  std::vector<uint32_t> expected=naive_counts(a);

  SECTION("single thread equals bit by bit count") {
    std::vector<uint32_t> counts=a.decodeChannelHistograms(1);
    REQUIRE(counts.size()==Nchan);
    REQUIRE(counts==expected);
  }

  SECTION("threads give the same result") {
    REQUIRE(a.decodeChannelHistograms(2)==expected);
    REQUIRE(a.decodeChannelHistograms(3)==expected);
    /* more threads than columns */
    REQUIRE(a.decodeChannelHistograms(16)==expected);
  }

  SECTION("all flagged") {
    std::vector<unsigned char> ones(nrows*width,0xff);
    BitFlagArchive b(Nchan,Nant,Nscans,width,ones);
    std::vector<uint32_t> counts=b.decodeChannelHistograms(2);
    for (unsigned int ch=0; ch<Nchan; ch++) {
      REQUIRE(counts[ch]==nrows);
    }
  }
}

TEST_CASE("loading flag files", "[flagarchive]") {
  test::TempDir tmp;
  const int Nant=4, Nscans=3, width=2, Nchan=16;
  size_t nrows=(size_t)Nant*(Nant+1)/2*Nscans;

  SECTION("header and bits are read") {
    std::vector<unsigned int> counts(Nchan,0);
    counts[0]=nrows;
    counts[5]=3;
    counts[15]=1;
    std::vector<unsigned char> bits=test::makeFlagBits(counts,nrows,width);
    std::string fname=tmp.file("1065880128_01.mwaf");
    test::writeMwaf(fname,Nchan,Nant,Nscans,width,bits);

    BitFlagArchive a=BitFlagArchive::load(fname);
    REQUIRE(a.channelCount()==Nchan);
    REQUIRE(a.antennaCount()==Nant);
    REQUIRE(a.scanCount()==Nscans);
    REQUIRE(a.rowWidth()==width);
    REQUIRE(a.source()==fname);
    REQUIRE(a.rawBits()==bits);

    std::vector<uint32_t> h=a.decodeChannelHistograms();
    REQUIRE(h[0]==nrows);
    REQUIRE(h[1]==0);
    REQUIRE(h[5]==3);
    REQUIRE(h[15]==1);
  }

  SECTION("bit column") {
    std::vector<unsigned int> counts(Nchan,0);
    counts[2]=nrows;
    counts[9]=4;
    counts[14]=7;
    std::vector<unsigned char> bits=test::makeFlagBits(counts,nrows,width);
    std::string fname=tmp.file("1065880128_02.mwaf");
    test::writeMwaf(fname,Nchan,Nant,Nscans,width,bits,true);

    BitFlagArchive a=BitFlagArchive::load(fname);
    REQUIRE(a.rowWidth()==width);
    REQUIRE(a.rawBits()==bits);
    std::vector<uint32_t> h=a.decodeChannelHistograms(2);
    REQUIRE(h==naive_counts(a));
    REQUIRE(h[2]==nrows);
    REQUIRE(h[9]==4);
    REQUIRE(h[14]==7);
    REQUIRE(h[15]==0);
  }

  SECTION("bit column with padding bits") {
    /* 12 channels in 2 bytes */
    std::vector<unsigned int> counts(12,0);
    counts[11]=5;
    std::vector<unsigned char> bits=test::makeFlagBits(counts,nrows,width);
    std::string fname=tmp.file("1065880128_03.mwaf");
    test::writeMwaf(fname,12,Nant,Nscans,width,bits,true);

    BitFlagArchive a=BitFlagArchive::load(fname);
    REQUIRE(a.channelCount()==12);
    REQUIRE(a.rowWidth()==width);
    std::vector<uint32_t> h=a.decodeChannelHistograms();
    REQUIRE(h.size()==12);
    REQUIRE(h==naive_counts(a));
    REQUIRE(h[11]==5);
  }

  SECTION("missing file") {
    REQUIRE_THROWS_AS(BitFlagArchive::load(tmp.file("none.mwaf")),IOError);
  }

  SECTION("missing header key") {
    std::string fname=tmp.file("nokey.mwaf");
    fitsfile *fptr;
    int status=0;
    fits_create_file(&fptr,fname.c_str(),&status);
    fits_create_img(fptr,BYTE_IMG,0,NULL,&status);
    int nchan=Nchan;
    fits_write_key(fptr,TINT,"NCHANS",&nchan,NULL,&status);
    fits_close_file(fptr,&status);
    REQUIRE(status==0);
    REQUIRE_THROWS_AS(BitFlagArchive::load(fname),FormatError);
  }

  SECTION("no flag table") {
    std::string fname=tmp.file("notable.mwaf");
    fitsfile *fptr;
    int status=0;
    fits_create_file(&fptr,fname.c_str(),&status);
    fits_create_img(fptr,BYTE_IMG,0,NULL,&status);
    int v=Nchan;
    fits_write_key(fptr,TINT,"NCHANS",&v,NULL,&status);
    v=Nant;
    fits_write_key(fptr,TINT,"NANTENNA",&v,NULL,&status);
    v=Nscans;
    fits_write_key(fptr,TINT,"NSCANS",&v,NULL,&status);
    fits_close_file(fptr,&status);
    REQUIRE(status==0);
    REQUIRE_THROWS_AS(BitFlagArchive::load(fname),FormatError);
  }

  SECTION("row count disagrees with the header") {
    std::string fname=tmp.file("short.mwaf");
    std::vector<unsigned char> bits((nrows-1)*width,0);
    test::writeMwaf(fname,Nchan,Nant,Nscans,width,bits);
    REQUIRE_THROWS_AS(BitFlagArchive::load(fname),FormatError);
  }
}
