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

#ifndef __VISCONV_VISTRANSFORM_H__
#define __VISCONV_VISTRANSFORM_H__

#include <complex>
#include <string>
#include <vector>

namespace Visconv
{

    /* sign of the imaginary part of the phase rotor,
       removing phase tracking multiplies by exp(+i 2pi w f) */
    enum PhaseDirection {
      PHASE_ADD=-1,
      PHASE_REMOVE=1
    };

    /* YYYY-MM-DDT00:00:00.0 for the (UTC) calendar day of mjd */
    std::string truncateDate(double mjd);

    /* multiply all Npol samples of channel i by
       cos(2pi wsec freqs[i]) + dir i sin(2pi wsec freqs[i])
       vis: size Nchan*Npol, channel major, wsec: w/c (s) */
    void applyPhaseRotor(std::vector<std::complex<float> > &vis, int Npol,
      double wsec, const std::vector<double> &freqs, PhaseDirection dir);

    /* same, for samples already in the random group layout,
       size Nchan*4*3 (real,imag,weight) */
    void applyPhaseRotorPacked(std::vector<float> &samples,
      double wsec, const std::vector<double> &freqs, PhaseDirection dir);

    /* vis, weights: size Nchan*4, ordered XX,XY,YX,YY per channel
       out: size Nchan*4*3, ordered XX,YY,XY,YX with (real,imag,weight) */
    void reorderPolarisations(const std::vector<std::complex<float> > &vis,
      const std::vector<float> &weights, std::vector<float> &out);

    /* rows per time step */
    unsigned int computeNumBaselines(unsigned long Nrows, unsigned int Ntime);

    /* distinct times, quantized to ms */
    unsigned int countTimeSteps(const std::vector<double> &times);

    /* invert N(N+1)/2 (autocorr) or N(N-1)/2, throws ValueError if not exact */
    unsigned int computeNumAntennas(unsigned int Nbase, bool autocorr=true);
}
#endif /* __VISCONV_VISTRANSFORM_H__ */
