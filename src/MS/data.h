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


#ifndef __DATA_H__
#define __DATA_H__
#include <unistd.h>
#include <stdio.h>
#include <iostream>
#include <casacore/tables/Tables/Table.h>
#include <casacore/tables/Tables/TableRecord.h>
#include <casacore/tables/Tables/ScalarColumn.h>
#include <casacore/tables/Tables/ArrayColumn.h>
#include <casacore/casa/Arrays/Array.h>
#include <complex>
#include <string>
#include <vector>

#include "coords.h"

using namespace casacore;

namespace Data
{

    struct IOData {
       unsigned long Nrows; /* rows in the main table */
       double time0; /* TIME of the first row (s, MJD UTC) */
       int Nchan; /* total no of fine channels */
       std::vector<double> freqs; /* channel freqs, size Nchan x 1 */
       double deltaf; /* fine channel width (Hz) */
       double totalBandwidth; /* TOTAL_BANDWIDTH (Hz) */
       double ra0; /* pointing center (rad) */
       double dec0;
       std::vector<int> bands; /* coarse band numbers, 1 based */
       int NchanBand; /* fine channels per coarse band */
    };

    /* one row of the main table */
    struct RowData {
       double uvw[3]; /* m */
       int ant1,ant2; /* 0 based */
       double time; /* s, MJD UTC */
       std::vector<std::complex<float> > vis; /* Nchan x 4, XX,XY,YX,YY per channel */
       std::vector<float> weights; /* Nchan x 4 */
    };

    /* columns of the main table needed to fill a RowData */
    class RowReader {
    public:
      RowReader(const Table &t, const String &visColumn, bool resetWeights, int Nchan);
      /* throws Visconv::FormatError if the cell shape is not 4 x Nchan */
      void loadRow(unsigned long row, RowData *r);
    private:
      ROScalarColumn<int> a1,a2;
      ROScalarColumn<double> timeCol;
      ROArrayColumn<double> uvwCol;
      ROArrayColumn<Complex> dataCol;
      ROArrayColumn<float> weightCol;
      bool useWeights;
      int Nchan;
    };

    /* read channel, pointing and coarse band info,
       oneToOne: treat all channels as a single band */
    void readAuxData(const char *fname, IOData *data, bool oneToOne);
    /* names and ITRF positions (size 3N) of all stations */
    void readAntennas(const char *fname, std::vector<std::string> &names, std::vector<double> &xyz);
    void readTimes(const char *fname, std::vector<double> &times);

    /* configuration, set from the command line */
    extern char *TableName; /* MS name */
    extern char *OutStem; /* output file name stem */
    extern String DataField; /* input column OFFSET_DATA/DATA/CORRECTED_DATA */
    extern int oneToOne; /* if 1, write a single uvfits file */
    extern int undoPhase; /* if 1, remove phase tracking */
    extern int resetWeights; /* if 1, all weights are 1 */
    extern int Nt; /* no of worker threads */
    extern Visconv::ArrayLocation arrayLocation;
    extern std::string telescopeName;
    extern int verbose; /* if >0, enable verbose output */
}
#endif //__DATA_H__
