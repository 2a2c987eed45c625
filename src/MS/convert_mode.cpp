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
#include "constants.h"
#include "errors.h"
#include "uvcontainer.h"
#include "vistransform.h"
#include <math.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "visconvmain.h"

using namespace std;
using namespace Data;

int
run_conversion(void) {
    IOData iodata;
    readAuxData(TableName,&iodata,oneToOne!=0);

    vector<double> times;
    readTimes(TableName,times);
    unsigned int Ntime=Visconv::countTimeSteps(times);
    unsigned int Nbase=Visconv::computeNumBaselines(iodata.Nrows,Ntime);
    vector<string> antnames;
    vector<double> antxyz;
    readAntennas(TableName,antnames,antxyz);
    cout<<"Timeslots: "<<Ntime<<" Baselines: "<<Nbase<<endl;
    try {
      unsigned int N=Visconv::computeNumAntennas(Nbase);
      if (N!=antnames.size()) {
        cerr<<"Warning: "<<N<<" stations in the data, "<<antnames.size()<<" in the ANTENNA table"<<endl;
      }
    } catch (const Visconv::ValueError &e) {
      cerr<<"Warning: "<<e.what()<<endl;
    }

    int Nb=(int)iodata.bands.size();
    double coarseWidth=iodata.totalBandwidth/(double)Nb;
    /* fine channels are integer Hz */
    double fineWidth=floor(iodata.deltaf+0.5);
    int centreChan=(int)floor(coarseWidth/iodata.deltaf/2.0+0.5);
    double epoch=Visconv::casacoreTimeToMJD(iodata.time0);

    vector<string> fnames(Nb);
    vector<Visconv::UvHeader> hdrs(Nb);
    vector<double> centreFreqs(Nb);
    for (int ci=0; ci<Nb; ci++) {
      if (oneToOne) {
        fnames[ci]=OutStem;
      } else {
        char buff[32];
        snprintf(buff,32,"_band%02d.uvfits",iodata.bands[ci]);
        fnames[ci]=string(OutStem)+buff;
      }
      centreFreqs[ci]=iodata.freqs[0]+(double)(iodata.bands[ci]-1)*coarseWidth+coarseWidth/2.0-iodata.deltaf/2.0;
      Visconv::UvHeader &h=hdrs[ci];
      h.Nrows=(long)iodata.Nrows;
      h.Nchan=iodata.NchanBand;
      h.epoch=epoch;
      h.chanWidth=fineWidth;
      h.centreFreq=centreFreqs[ci];
      h.centreChan=centreChan;
      h.ra0=iodata.ra0;
      h.dec0=iodata.dec0;
      h.telescope=telescopeName;
      if (verbose) {
        cout<<"Band "<<iodata.bands[ci]<<": "<<fnames[ci]<<" centre "<<centreFreqs[ci]<<" Hz, channel "<<centreChan<<endl;
      }
    }
    Visconv::createUvContainers(fnames,hdrs,Nt);

    vector<unique_ptr<Visconv::UvContainer> > uvfits;
    for (int ci=0; ci<Nb; ci++) {
      uvfits.push_back(Visconv::UvContainer::open(fnames[ci]));
    }

    /* DATE parameter is relative to the truncated JD */
    double jdTrunc=floor(Visconv::mjdToJD(epoch))+0.5;

    Table t=Table(TableName);
    RowReader reader(t,DataField,resetWeights!=0,iodata.Nchan);
    RowData r;
    vector<float> samples;
    size_t step=(size_t)iodata.NchanBand*UVFITS_NPOL*UVFITS_FLOATS_PER_POL;
    vector<float> bandsamples(step);
    unsigned long progress=iodata.Nrows/PROGRESS_STEPS;
    if (!progress) {
      progress=1;
    }
    for (unsigned long row=0; row<iodata.Nrows; row++) {
      reader.loadRow(row,&r);
      Visconv::UvGroupParams p;
      p.u=(float)(r.uvw[0]/CONST_C);
      p.v=(float)(r.uvw[1]/CONST_C);
      p.w=(float)(r.uvw[2]/CONST_C);
      p.baseline=(float)Visconv::encodeBaseline((unsigned int)r.ant1+1,(unsigned int)r.ant2+1);
      p.date=(float)(Visconv::mjdToJD(Visconv::casacoreTimeToMJD(r.time))-jdTrunc);

      if (undoPhase) {
        Visconv::applyPhaseRotor(r.vis,UVFITS_NPOL,(double)p.w,iodata.freqs,Visconv::PHASE_REMOVE);
      }
      Visconv::reorderPolarisations(r.vis,r.weights,samples);

      /* each band gets its slice of channels */
      for (int ci=0; ci<Nb; ci++) {
        bandsamples.assign(samples.begin()+ci*step,samples.begin()+(ci+1)*step);
        uvfits[ci]->writeRow((long)row,p,bandsamples);
      }
      if (!((row+1)%progress)) {
        cout<<(row+1)*100/iodata.Nrows<<"% ("<<row+1<<"/"<<iodata.Nrows<<" rows)"<<endl;
      }
    }

    for (int ci=0; ci<Nb; ci++) {
      uvfits[ci]->appendAntennaTable(epoch,centreFreqs[ci],antnames,antxyz,arrayLocation,telescopeName);
      uvfits[ci]->close();
    }

    cout<<"Finished writing "<<Nb<<" uvfits files."<<endl;
    return 0;
}
