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

#include "coords.h"
#include <cmath>

using namespace Visconv;

TEST_CASE("array location", "[coords]") {
  SECTION("MWA geocentric position") {
    double xyz[3];
    REQUIRE(geodeticToGeocentric(mwaLocation(),xyz)==0);
    REQUIRE(xyz[0]==Approx(-2559454.08).margin(1.0));
    REQUIRE(xyz[1]==Approx(5095372.14).margin(1.0));
    REQUIRE(xyz[2]==Approx(-2849057.19).margin(1.0));
  }

  SECTION("equator and prime meridian") {
    ArrayLocation loc={0.0,0.0,0.0};
    double xyz[3];
    REQUIRE(geodeticToGeocentric(loc,xyz)==0);
    REQUIRE(xyz[0]==Approx(6378137.0).margin(1e-3));
    REQUIRE(xyz[1]==Approx(0.0).margin(1e-3));
    REQUIRE(xyz[2]==Approx(0.0).margin(1e-3));
  }
}

TEST_CASE("sidereal time", "[coords]") {
  double gst=-1.0;
  /* 0h UT 2013-10-15 */
  REQUIRE(greenwichSiderealTime(56580.575370370374,&gst)==0);
  REQUIRE(gst==Approx(23.688).margin(0.2));
  /* only the day counts */
  double gst0=-1.0;
  REQUIRE(greenwichSiderealTime(56580.0,&gst0)==0);
  REQUIRE(gst0==Approx(gst).margin(1e-9));
}

TEST_CASE("local station coordinates", "[coords]") {
  const double array_xyz[3]={100.0,200.0,300.0};

  SECTION("zero longitude is a translation") {
    const double ecef[3]={110.0,195.0,301.0};
    double local[3];
    ecefToLocal(ecef,array_xyz,0.0,local);
    REQUIRE(local[0]==Approx(10.0));
    REQUIRE(local[1]==Approx(-5.0));
    REQUIRE(local[2]==Approx(1.0));
  }

  SECTION("rotation by -longitude about z") {
    const double ecef[3]={100.0,210.0,300.0};
    double local[3];
    ecefToLocal(ecef,array_xyz,M_PI/2.0,local);
    REQUIRE(local[0]==Approx(10.0));
    REQUIRE(local[1]==Approx(0.0).margin(1e-9));
    REQUIRE(local[2]==Approx(0.0).margin(1e-9));
  }
}

TEST_CASE("time conversions", "[coords]") {
  /* 2013-10-15T13:48:32 UTC in casacore seconds */
  REQUIRE(casacoreTimeToMJD(4888561712.0)==Approx(56580.575370370374));
  REQUIRE(mjdToJD(56580.0)==2456580.5);
}
