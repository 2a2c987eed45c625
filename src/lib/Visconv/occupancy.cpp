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

#include "occupancy.h"
#include "errors.h"
#include <sstream>

namespace Visconv
{

OccupancyStats
computeOccupancy(const BitFlagArchive &archive, int Nt) {
  OccupancyStats stats;
  stats.flagCounts=archive.decodeChannelHistograms(Nt);
  stats.totalSamples=(uint32_t)archive.rowCount();
  stats.flagFraction.resize(stats.flagCounts.size());
  for (size_t ci=0; ci<stats.flagCounts.size(); ci++) {
    stats.flagFraction[ci]=(double)stats.flagCounts[ci]/(double)stats.totalSamples;
  }
  return stats;
}

ReflagDirective
buildReflagDirective(const OccupancyStats &stats, double threshold) {
  if (!(threshold>0.0) || threshold>1.0) {
    std::ostringstream msg;
    msg<<"Reflag threshold must be in (0,1], got "<<threshold;
    throw ValueError(msg.str());
  }
  ReflagDirective directive;
  for (size_t ci=0; ci<stats.flagFraction.size(); ci++) {
    if (stats.flagFraction[ci]>threshold) {
      ReflagEntry e;
      e.ordinal=(unsigned int)directive.size();
      e.channel=(unsigned int)ci;
      directive.push_back(e);
    }
  }
  return directive;
}

ReflagDirective
reflag(const BitFlagArchive &archive, const OccupancyStats &stats,
  const std::string &dest, double threshold) {
  ReflagDirective directive=buildReflagDirective(stats,threshold);
  archive.writeWithReflag(dest,directive);
  return directive;
}

std::string
reflaggedName(const std::string &fname) {
  size_t pos=fname.find_last_of('/');
  if (pos==std::string::npos) {
    return "RTS_"+fname;
  }
  return fname.substr(0,pos+1)+"RTS_"+fname.substr(pos+1);
}

}
