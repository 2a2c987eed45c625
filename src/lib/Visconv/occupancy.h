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

#ifndef __VISCONV_OCCUPANCY_H__
#define __VISCONV_OCCUPANCY_H__

#include "flagarchive.h"
#include <stdint.h>
#include <string>
#include <vector>

namespace Visconv
{

    /* per channel flag occupancy of one archive */
    struct OccupancyStats {
      std::vector<uint32_t> flagCounts; /* flagged samples per channel, size Nchan */
      std::vector<double> flagFraction; /* flagCounts/totalSamples */
      uint32_t totalSamples; /* baselines x scans */
    };

    /* decode the archive and normalize, Nt: threads for decoding */
    OccupancyStats computeOccupancy(const BitFlagArchive &archive, int Nt=1);

    /* channels with fraction strictly above threshold, in ascending order,
       throws ValueError unless 0<threshold<=1 */
    ReflagDirective buildReflagDirective(const OccupancyStats &stats, double threshold);

    /* build the directive and write it with the archive into dest */
    ReflagDirective reflag(const BitFlagArchive &archive, const OccupancyStats &stats,
      const std::string &dest, double threshold);

    /* dir/name -> dir/RTS_name */
    std::string reflaggedName(const std::string &fname);
}
#endif /* __VISCONV_OCCUPANCY_H__ */
