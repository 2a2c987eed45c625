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

#ifndef __VISCONV_CONSTANTS_H__
#define __VISCONV_CONSTANTS_H__

#include <math.h>

/* speed of light */
#ifndef CONST_C
#define CONST_C 299792458.0
#endif

#ifndef VISCONV_TWOPI
#define VISCONV_TWOPI (2.0*M_PI)
#endif

/* MJD (days) to JD (days) */
#ifndef MJD_TO_JD
#define MJD_TO_JD 2400000.5
#endif

/* seconds per day */
#ifndef SEC_PER_DAY
#define SEC_PER_DAY 86400.0
#endif

/* random group layout: XX,YY,XY,YX each with (real,imag,weight) */
#define UVFITS_NPOL 4
#define UVFITS_FLOATS_PER_POL 3
/* UU,VV,WW,BASELINE,DATE */
#define UVFITS_NPARAMS 5

/* baselines with the second antenna above this use the extended encoding */
#define UVFITS_MAX_SHORT_ANT 255

/* fixed IAT-UTC offset (s) written to the antenna table */
#define VISCONV_IATUTC 33.0
/* Earth's rotation rate (deg/day) */
#define VISCONV_DEGPDY 3.60985e2

/* MWA reference location, used when no other array location is given */
#define MWA_LONGITUDE_RAD 2.0362898668561042
#define MWA_LATITUDE_RAD -0.4660608448386394
#define MWA_ALTITUDE_M 377.827

#define VISCONV_VERSION "0.2.3"

#endif /* __VISCONV_CONSTANTS_H__ */
