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


#include "data.h"
#include "errors.h"
#include <casacore/tables/Tables/TableDesc.h>
#include <math.h>
#include <sstream>

using namespace casacore;
using std::cout;
using std::cerr;
using std::endl;

char *Data::TableName = NULL;
char *Data::OutStem = NULL;
String Data::DataField = "OFFSET_DATA";
int Data::oneToOne=0;
int Data::undoPhase=0;
int Data::resetWeights=0;
int Data::Nt=4;
Visconv::ArrayLocation Data::arrayLocation=Visconv::mwaLocation();
std::string Data::telescopeName="MWA";
int Data::verbose=0;

void
Data::readAuxData(const char *fname, Data::IOData *data, bool oneToOne) {

    Table _t=Table(fname);
    data->Nrows=_t.nrow();
    if (!data->Nrows) {
      throw Visconv::FormatError(std::string(fname)+": no rows in main table");
    }
    ROScalarColumn<double> timeCol(_t, "TIME");
    data->time0=timeCol.get(0);
    if (!_t.tableDesc().isColumn(Data::DataField)) {
      throw Visconv::FormatError(std::string(fname)+": no column "+Data::DataField);
    }

    //obtain the chanel freq information
    Table _freq = Table(_t.keywordSet().asTable("SPECTRAL_WINDOW"));
    ROArrayColumn<double> chan_freq(_freq, "CHAN_FREQ");
    ROArrayColumn<double> chan_width(_freq, "CHAN_WIDTH");
    ROScalarColumn<double> total_bw(_freq, "TOTAL_BANDWIDTH");
    Array<double> _f=chan_freq(0);
    Array<double> _w=chan_width(0);
    data->Nchan=(int)_f.nelements();
    if (data->Nchan<=1 || _w.nelements()!=_f.nelements()) {
      std::ostringstream msg;
      msg<<fname<<": found "<<data->Nchan<<" fine channels, need more than one";
      throw Visconv::FormatError(msg.str());
    }
    double *wd=_w.data();
    for (int ci=1; ci<data->Nchan; ci++) {
      if (fabs(wd[ci]-wd[0])>1e-3) {
        throw Visconv::FormatError(std::string(fname)+": not all fine channel widths (CHAN_WIDTH) are equal");
      }
    }
    double *fd=_f.data();
    data->freqs.assign(fd,fd+data->Nchan);
    data->deltaf=data->freqs[1]-data->freqs[0];
    data->totalBandwidth=total_bw.get(0);

    /* MWA tables have the tile pointing, else use the phase center */
    if (_t.keywordSet().fieldNumber("MWA_TILE_POINTING")!=-1) {
      Table _point = Table(_t.keywordSet().asTable("MWA_TILE_POINTING"));
      ROArrayColumn<double> dir_col(_point, "DIRECTION");
      Array<double> dir = dir_col(0);
      double *c = dir.data();
      data->ra0=c[0];
      data->dec0=c[1];
    } else {
      Table _field = Table(_t.keywordSet().asTable("FIELD"));
      ROArrayColumn<double> ref_dir(_field, "PHASE_DIR");
      Array<double> dir = ref_dir(0);
      double *c = dir.data();
      data->ra0=c[0];
      data->dec0=c[1];
    }
    cout<<"Pointing center ("<< data->ra0 << ", " << data->dec0 <<")"<<endl;

    data->bands.clear();
    if (!oneToOne && _t.keywordSet().fieldNumber("MWA_SUBBAND")!=-1) {
      Table _sub = Table(_t.keywordSet().asTable("MWA_SUBBAND"));
      ROScalarColumn<int> number(_sub, "NUMBER");
      for (uInt ci=0; ci<number.nrow(); ci++) {
        /* stored 0 based */
        data->bands.push_back(number(ci)+1);
      }
    }
    if (data->bands.empty()) {
      if (!oneToOne) {
        cerr<<"Warning: no MWA_SUBBAND table, writing a single band"<<endl;
      }
      data->bands.push_back(1);
    }
    if (data->Nchan%(int)data->bands.size()) {
      std::ostringstream msg;
      msg<<fname<<": "<<data->Nchan<<" channels cannot be split into "<<data->bands.size()<<" coarse bands";
      throw Visconv::FormatError(msg.str());
    }
    data->NchanBand=data->Nchan/(int)data->bands.size();

    cout<<"Rows: "<<data->Nrows<<" Channels: "<<data->Nchan<<" Coarse bands: "<<data->bands.size()<<endl;
    cout<<"Freq: "<<data->freqs[0]<<" Hz, channel width "<<data->deltaf<<" Hz, bandwidth "<<data->totalBandwidth<<" Hz"<<endl;
}

void
Data::readAntennas(const char *fname, std::vector<std::string> &names, std::vector<double> &xyz) {
    Table _t=Table(fname);
    Table _ant = Table(_t.keywordSet().asTable("ANTENNA"));
    ROScalarColumn<String> a1(_ant, "NAME");
    ROArrayColumn<double> position(_ant, "POSITION");
    uInt N=a1.nrow();
    names.resize(N);
    xyz.resize(3*N);
    for (uInt ci=0; ci<N; ci++) {
      names[ci]=a1(ci);
      if (names[ci].empty()) {
        char buff[16];
        snprintf(buff,16,"ANT%03u",ci+1);
        cerr<<"Warning: station "<<ci<<" has no name, using "<<buff<<endl;
        names[ci]=buff;
      }
      Array<double> _pos=position(ci);
      double *tx=_pos.data();
      xyz[3*ci]=tx[0];
      xyz[3*ci+1]=tx[1];
      xyz[3*ci+2]=tx[2];
    }
    cout <<"Stations: "<<N<<endl;
}

void
Data::readTimes(const char *fname, std::vector<double> &times) {
    Table _t=Table(fname);
    ROScalarColumn<double> timeCol(_t, "TIME");
    Vector<double> tv=timeCol.getColumn();
    times.assign(tv.begin(),tv.end());
}

Data::RowReader::RowReader(const Table &t, const String &visColumn, bool resetWeights, int Nchan_)
  : a1(t,"ANTENNA1"), a2(t,"ANTENNA2"), timeCol(t,"TIME"), uvwCol(t,"UVW"), dataCol(t,visColumn),
    useWeights(false), Nchan(Nchan_) {
    if (!resetWeights) {
      if (t.tableDesc().isColumn("WEIGHT_SPECTRUM")) {
        weightCol.attach(t,"WEIGHT_SPECTRUM");
        useWeights=true;
      } else {
        cerr<<"Warning: no WEIGHT_SPECTRUM column, all weights set to 1"<<endl;
      }
    }
}

void
Data::RowReader::loadRow(unsigned long row, Data::RowData *r) {
    r->ant1=a1(row);
    r->ant2=a2(row);
    r->time=timeCol(row);
    Array<double> uvw=uvwCol(row);
    double *c=uvw.data();
    r->uvw[0]=c[0];
    r->uvw[1]=c[1];
    r->uvw[2]=c[2];

    Array<Complex> data=dataCol(row);
    size_t nval=(size_t)Nchan*4;
    if (data.nelements()!=nval) {
      std::ostringstream msg;
      msg<<"Row "<<row<<" of "<<dataCol.columnDesc().name()<<" has "<<data.nelements()<<" values, expected "<<nval;
      throw Visconv::FormatError(msg.str());
    }
    /* cell is 4 x Nchan, polarization varies fastest */
    Complex *ptr=data.data();
    r->vis.assign(ptr,ptr+nval);

    if (useWeights && weightCol.isDefined(row)) {
      Array<float> w=weightCol(row);
      if (w.nelements()!=nval) {
        std::ostringstream msg;
        msg<<"Row "<<row<<" of WEIGHT_SPECTRUM has "<<w.nelements()<<" values, expected "<<nval;
        throw Visconv::FormatError(msg.str());
      }
      float *wptr=w.data();
      r->weights.assign(wptr,wptr+nval);
    } else {
      r->weights.assign(nval,1.0f);
    }
}
