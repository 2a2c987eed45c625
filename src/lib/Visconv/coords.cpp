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

#include "coords.h"
#include <iostream>
#include <cmath>
#include <casacore/casa/Exceptions/Error.h>
#include <casacore/casa/Quanta/Quantum.h>
#include <casacore/casa/Arrays/Vector.h>
#include <casacore/measures/Measures/MPosition.h>
#include <casacore/measures/Measures/MCPosition.h>
#include <casacore/measures/Measures/MEpoch.h>
#include <casacore/measures/Measures/MCEpoch.h>
#include <casacore/measures/Measures/MeasConvert.h>

using namespace casacore;

namespace Visconv
{

ArrayLocation
mwaLocation() {
  ArrayLocation loc;
  loc.longitude=MWA_LONGITUDE_RAD;
  loc.latitude=MWA_LATITUDE_RAD;
  loc.height=MWA_ALTITUDE_M;
  return loc;
}

int
geodeticToGeocentric(const ArrayLocation &loc, double xyz[3]) {
  try {
    MPosition geod(MVPosition(Quantity(loc.height,"m"),Quantity(loc.longitude,"rad"),
        Quantity(loc.latitude,"rad")),MPosition::WGS84);
    MPosition itrf=MPosition::Convert(geod,MPosition::ITRF)();
    Vector<Double> v=itrf.getValue().getValue();
    xyz[0]=v(0);
    xyz[1]=v(1);
    xyz[2]=v(2);
  } catch (AipsError &e) {
    std::cerr<<"Geodetic conversion failed: "<<e.getMesg()<<std::endl;
    return 1;
  }
  if (!std::isfinite(xyz[0]) || !std::isfinite(xyz[1]) || !std::isfinite(xyz[2])) {
    return 2;
  }
  return 0;
}

int
greenwichSiderealTime(double mjd, double *gst) {
  try {
    MEpoch utc(MVEpoch(Quantity(floor(mjd),"d")),MEpoch::UTC);
    MEpoch gmst=MEpoch::Convert(utc,MEpoch::GMST1)();
    /* integer part counts sidereal days */
    double days=gmst.getValue().get();
    *gst=(days-floor(days))*360.0;
  } catch (AipsError &e) {
    std::cerr<<"Sidereal time conversion failed: "<<e.getMesg()<<std::endl;
    return 1;
  }
  if (!std::isfinite(*gst)) {
    return 2;
  }
  return 0;
}

void
ecefToLocal(const double ecef[3], const double array_xyz[3], double longitude, double local[3]) {
  double dx=ecef[0]-array_xyz[0];
  double dy=ecef[1]-array_xyz[1];
  double dz=ecef[2]-array_xyz[2];
  double sinl=sin(-longitude);
  double cosl=cos(-longitude);
  local[0]=cosl*dx-sinl*dy;
  local[1]=sinl*dx+cosl*dy;
  local[2]=dz;
}

}
