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

#include "vistransform.h"
#include "constants.h"
#include "errors.h"
#include <cmath>
#include <set>
#include <sstream>
#include <stdio.h>
#include <casacore/casa/Quanta/MVTime.h>

namespace Visconv
{

std::string
truncateDate(double mjd) {
  casacore::MVTime t(mjd);
  char buff[64];
  snprintf(buff,sizeof(buff),"%04d-%02d-%02dT00:00:00.0",(int)t.year(),(int)t.month(),(int)t.monthday());
  return std::string(buff);
}

void
applyPhaseRotor(std::vector<std::complex<float> > &vis, int Npol,
  double wsec, const std::vector<double> &freqs, PhaseDirection dir) {
  if (Npol<=0 || vis.size()!=freqs.size()*(size_t)Npol) {
    std::ostringstream msg;
    msg<<"Visibility row has "<<vis.size()<<" samples, expected "<<freqs.size()<<" channels x "<<Npol<<" pols";
    throw ValueError(msg.str());
  }
  for (size_t ci=0; ci<freqs.size(); ci++) {
    double angle=VISCONV_TWOPI*wsec*freqs[ci];
    std::complex<float> rotor((float)cos(angle),(float)(dir*sin(angle)));
    std::complex<float> *p=&vis[ci*Npol];
    for (int cj=0; cj<Npol; cj++) {
      p[cj]*=rotor;
    }
  }
}

void
applyPhaseRotorPacked(std::vector<float> &samples,
  double wsec, const std::vector<double> &freqs, PhaseDirection dir) {
  const size_t step=UVFITS_NPOL*UVFITS_FLOATS_PER_POL;
  if (samples.size()!=freqs.size()*step) {
    std::ostringstream msg;
    msg<<"Packed row has "<<samples.size()<<" values, expected "<<freqs.size()*step;
    throw ValueError(msg.str());
  }
  for (size_t ci=0; ci<freqs.size(); ci++) {
    double angle=VISCONV_TWOPI*wsec*freqs[ci];
    float c=(float)cos(angle);
    float s=(float)(dir*sin(angle));
    /* real parts of XX,YY,XY,YX, imag follows */
    for (int cj=0; cj<UVFITS_NPOL; cj++) {
      float *p=&samples[ci*step+cj*UVFITS_FLOATS_PER_POL];
      float re=p[0];
      float im=p[1];
      p[0]=re*c-im*s;
      p[1]=re*s+im*c;
    }
  }
}

void
reorderPolarisations(const std::vector<std::complex<float> > &vis,
  const std::vector<float> &weights, std::vector<float> &out) {
  if (vis.size()%UVFITS_NPOL || weights.size()!=vis.size()) {
    std::ostringstream msg;
    msg<<"Cannot reorder "<<vis.size()<<" visibilities with "<<weights.size()<<" weights";
    throw ValueError(msg.str());
  }
  /* input XX=0,XY=1,YX=2,YY=3, output XX,YY,XY,YX */
  static const int order[UVFITS_NPOL]={0,3,1,2};
  size_t Nchan=vis.size()/UVFITS_NPOL;
  out.resize(Nchan*UVFITS_NPOL*UVFITS_FLOATS_PER_POL);
  float *o=out.empty()?0:&out[0];
  for (size_t ci=0; ci<Nchan; ci++) {
    for (int cj=0; cj<UVFITS_NPOL; cj++) {
      const std::complex<float> &v=vis[ci*UVFITS_NPOL+order[cj]];
      *o++=v.real();
      *o++=v.imag();
      *o++=weights[ci*UVFITS_NPOL+order[cj]];
    }
  }
}

unsigned int
computeNumBaselines(unsigned long Nrows, unsigned int Ntime) {
  if (!Ntime) {
    throw ValueError("Cannot compute baselines with zero time steps");
  }
  return (unsigned int)(Nrows/Ntime);
}

unsigned int
countTimeSteps(const std::vector<double> &times) {
  std::set<long long> tset;
  for (size_t ci=0; ci<times.size(); ci++) {
    tset.insert(llround(times[ci]*1e3));
  }
  return (unsigned int)tset.size();
}

unsigned int
computeNumAntennas(unsigned int Nbase, bool autocorr) {
  double disc=sqrt(1.0+8.0*(double)Nbase);
  long N=(autocorr?lround((disc-1.0)*0.5):lround((disc+1.0)*0.5));
  unsigned long check=(autocorr?(unsigned long)(N*(N+1)/2):(unsigned long)(N*(N-1)/2));
  if (N<=0 || check!=Nbase) {
    std::ostringstream msg;
    msg<<Nbase<<" baselines do not correspond to a whole number of antennas";
    throw ValueError(msg.str());
  }
  return (unsigned int)N;
}

}
