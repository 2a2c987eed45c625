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

#ifndef __VISCONV_FLAGARCHIVE_H__
#define __VISCONV_FLAGARCHIVE_H__

#include <stdint.h>
#include <string>
#include <vector>

namespace Visconv
{

    /* one channel to be flagged entirely, written as REFLG_<ordinal>=channel */
    struct ReflagEntry {
      unsigned int ordinal; /* 0,1,2,... in ascending channel order */
      unsigned int channel; /* 0-based fine channel index */
    };
    typedef std::vector<ReflagEntry> ReflagDirective;

    /* channel index addressed by bit 'bit' (0=LSB) of byte column 'column'
       of a flag row, i.e. bits are stored most significant first */
    unsigned int bitToChannel(unsigned int column, unsigned int bit);

    /* packed bit flag table (mwaf):
       baselines (autocorrelations included) x scans rows,
       each row 'width' bytes, one bit per fine channel */
    class BitFlagArchive {
    public:
      /* bits: size Nbase*Nscans*width, source: file the bits came from
         (needed by writeWithReflag), throws FormatError if sizes do not agree */
      BitFlagArchive(unsigned int Nchan, unsigned int Nant, unsigned int Nscans,
        unsigned int width, const std::vector<unsigned char> &bits,
        const std::string &source=std::string());

      /* read NCHANS, NANTENNA, NSCANS from the primary header, and the
         first column of the binary table extension as raw bytes */
      static BitFlagArchive load(const std::string &fname);

      unsigned int channelCount() const { return Nchan_; }
      unsigned int antennaCount() const { return N_; }
      unsigned int scanCount() const { return Nscans_; }
      unsigned int rowWidth() const { return width_; }
      unsigned int baselineCount() const { return N_*(N_+1)/2; }
      /* rows = baselines x scans */
      size_t rowCount() const { return (size_t)baselineCount()*Nscans_; }
      const std::vector<unsigned char> &rawBits() const { return bits_; }
      const std::string &source() const { return source_; }

      /* number of set bits for each channel over all rows, size Nchan,
         Nt: threads to split the byte columns over */
      std::vector<uint32_t> decodeChannelHistograms(int Nt=1) const;

      /* copy the source file to dest and add one REFLG_nn key per entry
         of the directive to the flag extension */
      void writeWithReflag(const std::string &dest, const ReflagDirective &directive) const;

    private:
      unsigned int Nchan_;
      unsigned int N_;
      unsigned int Nscans_;
      unsigned int width_;
      std::vector<unsigned char> bits_;
      std::string source_;
    };
}
#endif /* __VISCONV_FLAGARCHIVE_H__ */
