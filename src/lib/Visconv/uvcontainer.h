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

#ifndef __VISCONV_UVCONTAINER_H__
#define __VISCONV_UVCONTAINER_H__

#include <fitsio.h>
#include <memory>
#include <string>
#include <vector>
#include "coords.h"

namespace Visconv
{

    /* primary header of a random group (uvfits) file */
    struct UvHeader {
      long Nrows; /* random groups */
      int Nchan; /* fine channels */
      int Nparams; /* group parameters, UVFITS_NPARAMS for files we create */
      double epoch; /* reference time, MJD (UTC days) */
      double chanWidth; /* fine channel width (Hz) */
      double centreFreq; /* CRVAL4 (Hz) */
      int centreChan; /* 0-based index of the channel at centreFreq */
      double ra0; /* phase center (rad) */
      double dec0;
      std::string object; /* empty: "Undefined" */
      std::string telescope;

      UvHeader();
    };

    /* the five group parameters of one row */
    struct UvGroupParams {
      float u,v,w; /* light travel time (s) */
      float baseline; /* encodeBaseline() */
      float date; /* JD offset from PZERO5 (days) */
    };

    /* random group visibility file with an optional AIPS AN table,
       owns the open file */
    class UvContainer {
    public:
      /* replace fname with a new file with the given header,
         throws IOError if it cannot be created */
      static std::unique_ptr<UvContainer> create(const std::string &fname, const UvHeader &hdr);
      /* open an existing file, header is parsed from the primary HDU */
      static std::unique_ptr<UvContainer> open(const std::string &fname, bool readwrite=true);

      ~UvContainer();

      const UvHeader &header() const { return hdr_; }
      const std::string &filename() const { return fname_; }
      /* floats per row after the group parameters */
      size_t rowLength() const { return (size_t)hdr_.Nchan*UVFITS_NPOL*UVFITS_FLOATS_PER_POL; }
      /* PZERO5 = floor(JD(epoch))+0.5 */
      double dateZero() const { return dateZero_; }
      /* frequency (Hz) of each fine channel from CRVAL4,CRPIX4,CDELT4 */
      std::vector<double> channelFrequencies() const;

      /* row: 0-based group, samples: rowLength() floats,
         throws ValueError on size or index mismatch */
      void writeRow(long row, const UvGroupParams &params, const std::vector<float> &samples);
      /* params: Nparams values */
      void writeGroup(long row, const std::vector<float> &params, const std::vector<float> &samples);
      void readRow(long row, std::vector<float> &params, std::vector<float> &samples);

      /* add the AIPS AN table, xyz: ITRF station positions size 3*names,
         throws ConversionError if the array location or sidereal time cannot be computed */
      void appendAntennaTable(double epoch, double centreFreq, const std::vector<std::string> &names,
        const std::vector<double> &xyz, const ArrayLocation &loc, const std::string &arrayName);

      /* overwrite a double key of the primary header */
      void updateKey(const char *key, double value);

      /* flush and close, throws IOError */
      void close();

    private:
      UvContainer(fitsfile *fptr, const std::string &fname, const UvHeader &hdr, double dateZero);
      UvContainer(const UvContainer&);
      UvContainer &operator=(const UvContainer&);
      void selectPrimary();

      fitsfile *fptr_;
      std::string fname_;
      UvHeader hdr_;
      double dateZero_;
    };

    /* uvfits baseline, 1-based antennas, ant2>255 uses the
       extended (miriad) encoding up to 2048 antennas */
    unsigned int encodeBaseline(unsigned int ant1, unsigned int ant2);
    void decodeBaseline(unsigned int baseline, unsigned int *ant1, unsigned int *ant2);

    /* create (and close) one file per header using Nt threads,
       the first failure is rethrown as raised (IOError, ValueError) */
    void createUvContainers(const std::vector<std::string> &fnames, const std::vector<UvHeader> &hdrs, int Nt);

    /* rotate every row of a phase tracked file back to the zenith,
       CRVAL4 is moved down by half a channel, rows are rewritten in place */
    void removePhaseTracking(UvContainer &uv, bool verbose=false);
}
#endif /* __VISCONV_UVCONTAINER_H__ */
