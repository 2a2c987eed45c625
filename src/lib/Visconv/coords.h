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

#ifndef __VISCONV_COORDS_H__
#define __VISCONV_COORDS_H__

#include "constants.h"

namespace Visconv
{

    /* geodetic location of the array reference (WGS84) */
    struct ArrayLocation {
      double longitude; /* rad, east +ve */
      double latitude; /* rad */
      double height; /* m above ellipsoid */
    };

    ArrayLocation mwaLocation();

    /* geodetic -> geocentric (ITRF) XYZ (m), using casacore measures
       return 0 on success, non-zero on failure */
    int geodeticToGeocentric(const ArrayLocation &loc, double xyz[3]);

    /* Greenwich mean sidereal time (deg) at 0h UT of the day of mjd (UTC days)
       return 0 on success, non-zero on failure */
    int greenwichSiderealTime(double mjd, double *gst);

    /* station position relative to the array reference, rotated by
       -longitude about the polar axis into the local meridian frame
       ecef: station ITRF XYZ (m), array_xyz: ITRF XYZ of array reference */
    void ecefToLocal(const double ecef[3], const double array_xyz[3], double longitude, double local[3]);

    /* casacore TIME (s since MJD 0, UTC) to MJD (days) */
    inline double casacoreTimeToMJD(double t) { return t/SEC_PER_DAY; }
    inline double mjdToJD(double mjd) { return mjd+MJD_TO_JD; }
}
#endif /* __VISCONV_COORDS_H__ */
