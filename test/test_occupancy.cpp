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
#include "occupancy.h"
#include "testutil.h"
#include <fitsio.h>

using namespace Visconv;

/* per channel flag counts of a 128 tile, 224 scan, 32 channel observation */
static const unsigned int kObsCounts[32]={
  1849343,1849343,155462,152424,150517,149608,149075,149136,
  149204,149260,149317,149354,149279,149515,149632,149908,
  1849343,149780,149466,149242,149163,148877,148873,148811,
  148693,148713,148771,149406,150996,152602,1849343,1849343};

static OccupancyStats
stats_from_fractions(const double *f, size_t n) {
  OccupancyStats s;
  s.totalSamples=100;
  for (size_t ci=0; ci<n; ci++) {
    s.flagFraction.push_back(f[ci]);
    s.flagCounts.push_back((uint32_t)(f[ci]*100.0+0.5));
  }
  return s;
}

TEST_CASE("reflag directive", "[occupancy]") {
  const double f[6]={0.0,0.9,0.8,0.81,1.0,0.5};
  OccupancyStats s=stats_from_fractions(f,6);

  SECTION("only channels strictly above the threshold") {
    ReflagDirective d=buildReflagDirective(s,0.8);
    REQUIRE(d.size()==3);
    REQUIRE(d[0].ordinal==0);
    REQUIRE(d[0].channel==1);
    REQUIRE(d[1].ordinal==1);
    REQUIRE(d[1].channel==3);
    REQUIRE(d[2].ordinal==2);
    REQUIRE(d[2].channel==4);
  }

  SECTION("threshold of one flags nothing") {
    REQUIRE(buildReflagDirective(s,1.0).empty());
  }

  SECTION("small threshold flags every partly flagged channel") {
    REQUIRE(buildReflagDirective(s,1e-6).size()==5);
  }

  SECTION("threshold out of range") {
    REQUIRE_THROWS_AS((buildReflagDirective(s,0.0)),ValueError);
    REQUIRE_THROWS_AS((buildReflagDirective(s,-0.5)),ValueError);
    REQUIRE_THROWS_AS((buildReflagDirective(s,1.01)),ValueError);
  }
}

TEST_CASE("output name", "[occupancy]") {
  REQUIRE(reflaggedName("1065880128_01.mwaf")=="RTS_1065880128_01.mwaf");
  REQUIRE(reflaggedName("./1065880128_01.mwaf")=="./RTS_1065880128_01.mwaf");
  REQUIRE(reflaggedName("/data/obs/1065880128_12.mwaf")=="/data/obs/RTS_1065880128_12.mwaf");
}

TEST_CASE("occupancy of an observation", "[occupancy]") {
  const int Nant=128, Nscans=224, width=4, Nchan=32;
  size_t nrows=(size_t)Nant*(Nant+1)/2*Nscans;
  REQUIRE(nrows==1849344);
  std::vector<unsigned int> counts(kObsCounts,kObsCounts+Nchan);
  std::vector<unsigned char> bits=test::makeFlagBits(counts,nrows,width);

  test::TempDir tmp;
  std::string fname=tmp.file("1065880128_01.mwaf");
  test::writeMwaf(fname,Nchan,Nant,Nscans,width,bits);
  BitFlagArchive archive=BitFlagArchive::load(fname);

  SECTION("counts and fractions") {
    OccupancyStats s=computeOccupancy(archive,4);
    REQUIRE(s.totalSamples==1849344);
    REQUIRE(s.flagCounts==std::vector<uint32_t>(kObsCounts,kObsCounts+Nchan));
    REQUIRE(s.flagFraction[0]==Approx(1849343.0/1849344.0));
    REQUIRE(s.flagFraction[2]==Approx(155462.0/1849344.0));
    uint64_t sum=0;
    for (size_t ci=0; ci<s.flagCounts.size(); ci++) {
      REQUIRE(s.flagFraction[ci]==(double)s.flagCounts[ci]/(double)s.totalSamples);
      sum+=s.flagCounts[ci];
    }
    REQUIRE(sum<=(uint64_t)s.totalSamples*Nchan);
    /* decoding again gives the same counts */
    REQUIRE(computeOccupancy(archive,1).flagCounts==s.flagCounts);
  }

  SECTION("reflagged copy carries the channel keys") {
    OccupancyStats s=computeOccupancy(archive);
    std::string out=reflaggedName(fname);
    ReflagDirective d=reflag(archive,s,out,0.8);
    REQUIRE(d.size()==5);

    fitsfile *fptr;
    int status=0;
    fits_open_file(&fptr,out.c_str(),READONLY,&status);
    int hdutype;
    fits_movabs_hdu(fptr,2,&hdutype,&status);
    REQUIRE(status==0);
    const unsigned int expected[5]={0,1,16,30,31};
    char key[FLEN_KEYWORD];
    for (int ci=0; ci<5; ci++) {
      unsigned int chan=999;
      snprintf(key,FLEN_KEYWORD,"REFLG_%02d",ci);
      fits_read_key(fptr,TUINT,key,&chan,NULL,&status);
      REQUIRE(status==0);
      REQUIRE(chan==expected[ci]);
    }
    unsigned int chan;
    fits_read_key(fptr,TUINT,"REFLG_05",&chan,NULL,&status);
    REQUIRE(status==KEY_NO_EXIST);
    status=0;
    fits_clear_errmsg();
    fits_close_file(fptr,&status);

    /* flags are copied unchanged */
    BitFlagArchive copy=BitFlagArchive::load(out);
    REQUIRE(copy.rawBits()==archive.rawBits());
  }

  SECTION("refuses to overwrite its own file") {
    OccupancyStats s=computeOccupancy(archive);
    REQUIRE_THROWS_AS((reflag(archive,s,fname,0.8)),ValueError);
  }
}
