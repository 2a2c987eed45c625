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

#include "uvcontainer.h"
#include "constants.h"
#include "errors.h"
#include "fitsutil.h"
#include "vistransform.h"
#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdio.h>
#include <string.h>
#include <pthread.h>

namespace Visconv
{

/* structure for worker threads creating uvfits files */
typedef struct thread_data_create_ {
  int startfile; /* first file this thread handles */
  int endfile; /* one past the last file */
  const std::vector<std::string> *fnames;
  const std::vector<UvHeader> *hdrs;
  std::exception_ptr error; /* set if creation failed */
} thread_data_create_t;

/* wrappers to pass values to fits_write_key, status is accumulated */
static void
put_double(fitsfile *fptr, const char *key, double val, int *status) {
  fits_write_key(fptr,TDOUBLE,key,&val,NULL,status);
}

static void
put_int(fitsfile *fptr, const char *key, int val, int *status) {
  fits_write_key(fptr,TINT,key,&val,NULL,status);
}

static void
put_string(fitsfile *fptr, const char *key, const std::string &val, int *status) {
  fits_write_key(fptr,TSTRING,key,const_cast<char*>(val.c_str()),NULL,status);
}

UvHeader::UvHeader()
  : Nrows(0), Nchan(0), Nparams(UVFITS_NPARAMS), epoch(0.0), chanWidth(0.0),
    centreFreq(0.0), centreChan(0), ra0(0.0), dec0(0.0), telescope("MWA") {
}

unsigned int
encodeBaseline(unsigned int ant1, unsigned int ant2) {
  if (ant2>UVFITS_MAX_SHORT_ANT) {
    return ant1*2048+ant2+65536;
  }
  return ant1*256+ant2;
}

void
decodeBaseline(unsigned int baseline, unsigned int *ant1, unsigned int *ant2) {
  if (baseline>65536) {
    baseline-=65536;
    *ant1=baseline/2048;
    *ant2=baseline%2048;
  } else {
    *ant1=baseline/256;
    *ant2=baseline%256;
  }
}

UvContainer::UvContainer(fitsfile *fptr, const std::string &fname, const UvHeader &hdr, double dateZero)
  : fptr_(fptr), fname_(fname), hdr_(hdr), dateZero_(dateZero) {
}

UvContainer::~UvContainer() {
  if (fptr_) {
    int status=0;
    fits_close_file(fptr_,&status);
    if (status) {
      char errtext[FLEN_STATUS]={0};
      fits_get_errstatus(status,errtext);
      std::cerr<<"Warning: closing "<<fname_<<" failed: "<<errtext<<std::endl;
    }
  }
}

std::unique_ptr<UvContainer>
UvContainer::create(const std::string &fname, const UvHeader &hdr) {
  if (hdr.Nrows<=0 || hdr.Nchan<=0) {
    std::ostringstream msg;
    msg<<"Cannot create "<<fname<<" with "<<hdr.Nrows<<" rows and "<<hdr.Nchan<<" channels";
    throw ValueError(msg.str());
  }
  removeIfExists(fname);

  fitsfile *fptr=0;
  int status=0;
  fits_create_file(&fptr,fname.c_str(),&status);
  checkFitsStatus(status,"Creating "+fname);
  FitsCloser closer(fptr);

  /* random groups: NAXIS1=0, complex(3) x pol(4) x freq x ra x dec */
  long naxes[6]={0,UVFITS_FLOATS_PER_POL,UVFITS_NPOL,hdr.Nchan,1,1};
  fits_write_grphdr(fptr,1,FLOAT_IMG,6,naxes,UVFITS_NPARAMS,hdr.Nrows,1,&status);
  checkFitsStatus(status,"Writing group header of "+fname);

  put_double(fptr,"BSCALE",1.0,&status);

  double dateZero=floor(mjdToJD(hdr.epoch))+0.5;
  static const char *ptypes[UVFITS_NPARAMS]={"UU","VV","WW","BASELINE","DATE"};
  char key[FLEN_KEYWORD];
  for (int ci=0; ci<UVFITS_NPARAMS; ci++) {
    snprintf(key,FLEN_KEYWORD,"PTYPE%d",ci+1);
    put_string(fptr,key,ptypes[ci],&status);
    snprintf(key,FLEN_KEYWORD,"PSCAL%d",ci+1);
    put_double(fptr,key,1.0,&status);
    snprintf(key,FLEN_KEYWORD,"PZERO%d",ci+1);
    /* only DATE is offset */
    put_double(fptr,key,(ci==UVFITS_NPARAMS-1?dateZero:0.0),&status);
  }
  put_string(fptr,"DATE-OBS",truncateDate(hdr.epoch),&status);

  put_string(fptr,"CTYPE2","COMPLEX",&status);
  put_double(fptr,"CRVAL2",1.0,&status);
  put_double(fptr,"CRPIX2",1.0,&status);
  put_double(fptr,"CDELT2",1.0,&status);

  /* linear polarizations XX,YY,XY,YX */
  put_string(fptr,"CTYPE3","STOKES",&status);
  put_int(fptr,"CRVAL3",-5,&status);
  put_int(fptr,"CDELT3",-1,&status);
  put_double(fptr,"CRPIX3",1.0,&status);

  put_string(fptr,"CTYPE4","FREQ",&status);
  put_double(fptr,"CRVAL4",hdr.centreFreq,&status);
  put_double(fptr,"CDELT4",hdr.chanWidth,&status);
  put_double(fptr,"CRPIX4",(double)(hdr.centreChan+1),&status);

  double ra_deg=hdr.ra0*180.0/M_PI;
  double dec_deg=hdr.dec0*180.0/M_PI;
  put_string(fptr,"CTYPE5","RA",&status);
  put_double(fptr,"CRVAL5",ra_deg,&status);
  put_int(fptr,"CDELT5",1,&status);
  put_int(fptr,"CRPIX5",1,&status);

  put_string(fptr,"CTYPE6","DEC",&status);
  put_double(fptr,"CRVAL6",dec_deg,&status);
  put_int(fptr,"CDELT6",1,&status);
  put_int(fptr,"CRPIX6",1,&status);

  put_double(fptr,"OBSRA",ra_deg,&status);
  put_double(fptr,"OBSDEC",dec_deg,&status);
  put_double(fptr,"EPOCH",2000.0,&status);

  put_string(fptr,"OBJECT",(hdr.object.empty()?std::string("Undefined"):hdr.object),&status);
  put_string(fptr,"TELESCOP",hdr.telescope,&status);
  put_string(fptr,"INSTRUME",hdr.telescope,&status);

  /* AIPS expects this */
  fits_write_history(fptr,"AIPS WTSCAL =  1.0",&status);
  fits_write_comment(fptr,"Created by visconv v" VISCONV_VERSION,&status);
  put_string(fptr,"SOFTWARE","visconv",&status);
  put_string(fptr,"VERSION","v" VISCONV_VERSION,&status);
  checkFitsStatus(status,"Writing header of "+fname);

  UvHeader h=hdr;
  h.Nparams=UVFITS_NPARAMS;
  return std::unique_ptr<UvContainer>(new UvContainer(closer.release(),fname,h,dateZero));
}

std::unique_ptr<UvContainer>
UvContainer::open(const std::string &fname, bool readwrite) {
  fitsfile *fptr=0;
  int status=0;
  fits_open_file(&fptr,fname.c_str(),(readwrite?READWRITE:READONLY),&status);
  checkFitsStatus(status,"Opening "+fname);
  FitsCloser closer(fptr);

  int groups=0;
  fits_read_key(fptr,TLOGICAL,"GROUPS",&groups,NULL,&status);
  if (status==KEY_NO_EXIST) {
    fits_clear_errmsg();
    status=0;
  }
  checkFitsStatus(status,"Reading GROUPS of "+fname);
  if (!groups) {
    throw FormatError(fname+": not a random group file");
  }

  UvHeader hdr;
  hdr.Nrows=readLongKey(fptr,"GCOUNT");
  hdr.Nparams=(int)readLongKey(fptr,"PCOUNT");
  long floatsPerPol=readLongKey(fptr,"NAXIS2");
  long Npol=readLongKey(fptr,"NAXIS3");
  hdr.Nchan=(int)readLongKey(fptr,"NAXIS4");
  if (floatsPerPol!=UVFITS_FLOATS_PER_POL || Npol!=UVFITS_NPOL) {
    std::ostringstream msg;
    msg<<fname<<": expected "<<UVFITS_FLOATS_PER_POL<<" floats x "<<UVFITS_NPOL
       <<" polarizations per channel, got "<<floatsPerPol<<" x "<<Npol;
    throw FormatError(msg.str());
  }
  if (hdr.Nparams<3) {
    throw FormatError(fname+": fewer than 3 group parameters, no UVW");
  }

  hdr.centreFreq=readDoubleKey(fptr,"CRVAL4");
  hdr.chanWidth=readDoubleKey(fptr,"CDELT4");
  /* CRPIX might be written as a float */
  hdr.centreChan=(int)lround(readDoubleKey(fptr,"CRPIX4"))-1;
  /* pointing is optional, fall back to the RA/DEC axes */
  double ra_deg=0.0,dec_deg=0.0;
  if (!readDoubleKey(fptr,"OBSRA",&ra_deg)) {
    readDoubleKey(fptr,"CRVAL5",&ra_deg);
  }
  if (!readDoubleKey(fptr,"OBSDEC",&dec_deg)) {
    readDoubleKey(fptr,"CRVAL6",&dec_deg);
  }
  hdr.ra0=ra_deg*M_PI/180.0;
  hdr.dec0=dec_deg*M_PI/180.0;
  hdr.object=readStringKey(fptr,"OBJECT","");
  hdr.telescope=readStringKey(fptr,"TELESCOP","");

  double dateZero=0.0;
  if (hdr.Nparams>=UVFITS_NPARAMS) {
    char key[FLEN_KEYWORD];
    snprintf(key,FLEN_KEYWORD,"PZERO%d",UVFITS_NPARAMS);
    fits_read_key(fptr,TDOUBLE,key,&dateZero,NULL,&status);
    if (status==KEY_NO_EXIST) {
      fits_clear_errmsg();
      status=0;
    }
    checkFitsStatus(status,"Reading PZERO of "+fname);
  }
  /* only the truncated epoch survives in the file */
  hdr.epoch=(dateZero>0.0?dateZero-MJD_TO_JD:0.0);

  return std::unique_ptr<UvContainer>(new UvContainer(closer.release(),fname,hdr,dateZero));
}

std::vector<double>
UvContainer::channelFrequencies() const {
  std::vector<double> freqs(hdr_.Nchan);
  for (int ci=0; ci<hdr_.Nchan; ci++) {
    freqs[ci]=hdr_.centreFreq+(double)(ci-hdr_.centreChan)*hdr_.chanWidth;
  }
  return freqs;
}

void
UvContainer::selectPrimary() {
  int hdunum=0;
  fits_get_hdu_num(fptr_,&hdunum);
  if (hdunum!=1) {
    int status=0;
    fits_movabs_hdu(fptr_,1,NULL,&status);
    checkFitsStatus(status,"Moving to primary HDU of "+fname_);
  }
}

void
UvContainer::writeRow(long row, const UvGroupParams &params, const std::vector<float> &samples) {
  if (hdr_.Nparams!=UVFITS_NPARAMS) {
    std::ostringstream msg;
    msg<<fname_<<" has "<<hdr_.Nparams<<" group parameters, cannot write "<<UVFITS_NPARAMS;
    throw ValueError(msg.str());
  }
  std::vector<float> p(UVFITS_NPARAMS);
  p[0]=params.u;
  p[1]=params.v;
  p[2]=params.w;
  p[3]=params.baseline;
  p[4]=params.date;
  writeGroup(row,p,samples);
}

void
UvContainer::writeGroup(long row, const std::vector<float> &params, const std::vector<float> &samples) {
  if (!fptr_) {
    throw IOError(fname_+" is closed");
  }
  if (row<0 || row>=hdr_.Nrows) {
    std::ostringstream msg;
    msg<<"Row "<<row<<" outside of "<<fname_<<" ("<<hdr_.Nrows<<" rows)";
    throw ValueError(msg.str());
  }
  if (params.size()!=(size_t)hdr_.Nparams || samples.size()!=rowLength()) {
    std::ostringstream msg;
    msg<<"Row "<<row<<" of "<<fname_<<" has "<<params.size()<<" parameters and "<<samples.size()
       <<" values, expected "<<hdr_.Nparams<<" and "<<rowLength();
    throw ValueError(msg.str());
  }
  selectPrimary();
  /* parameters and data of a group are contiguous, write them at once */
  std::vector<float> group(params);
  group.insert(group.end(),samples.begin(),samples.end());
  int status=0;
  fits_write_grppar_flt(fptr_,row+1,1,(long)group.size(),&group[0],&status);
  std::ostringstream ctx;
  ctx<<"Writing row "<<row<<" of "<<fname_;
  checkFitsStatus(status,ctx.str());
}

void
UvContainer::readRow(long row, std::vector<float> &params, std::vector<float> &samples) {
  if (!fptr_) {
    throw IOError(fname_+" is closed");
  }
  if (row<0 || row>=hdr_.Nrows) {
    std::ostringstream msg;
    msg<<"Row "<<row<<" outside of "<<fname_<<" ("<<hdr_.Nrows<<" rows)";
    throw ValueError(msg.str());
  }
  selectPrimary();
  params.resize(hdr_.Nparams);
  samples.resize(rowLength());
  int status=0;
  int anynul=0;
  fits_read_grppar_flt(fptr_,row+1,1,hdr_.Nparams,&params[0],&status);
  fits_read_img_flt(fptr_,row+1,1,(LONGLONG)samples.size(),0.0f,&samples[0],&anynul,&status);
  std::ostringstream ctx;
  ctx<<"Reading row "<<row<<" of "<<fname_;
  checkFitsStatus(status,ctx.str());
}

void
UvContainer::appendAntennaTable(double epoch, double centreFreq, const std::vector<std::string> &names,
  const std::vector<double> &xyz, const ArrayLocation &loc, const std::string &arrayName) {
  if (!fptr_) {
    throw IOError(fname_+" is closed");
  }
  if (xyz.size()!=3*names.size()) {
    std::ostringstream msg;
    msg<<names.size()<<" antenna names but "<<xyz.size()<<" position values";
    throw ValueError(msg.str());
  }
  int status=0;
  int nhdus=0;
  fits_get_num_hdus(fptr_,&nhdus,&status);
  checkFitsStatus(status,"Counting HDUs of "+fname_);
  if (nhdus!=1) {
    throw ValueError(fname_+" already has an antenna table");
  }

  double arrayxyz[3];
  int err;
  if ((err=geodeticToGeocentric(loc,arrayxyz))!=0) {
    throw ConversionError("geodeticToGeocentric",err);
  }
  double gst;
  if ((err=greenwichSiderealTime(epoch,&gst))!=0) {
    throw ConversionError("greenwichSiderealTime",err);
  }

  char *ttype[]={(char*)"ANNAME",(char*)"STABXYZ",(char*)"NOSTA",(char*)"MNTSTA",(char*)"STAXOF",
     (char*)"POLTYA",(char*)"POLAA",(char*)"POLCALA",(char*)"POLTYB",(char*)"POLAB",(char*)"POLCALB"};
  char *tform[]={(char*)"8A",(char*)"3D",(char*)"1J",(char*)"1J",(char*)"1E",
     (char*)"1A",(char*)"1E",(char*)"3E",(char*)"1A",(char*)"1E",(char*)"3E"};
  char *tunit[]={(char*)"",(char*)"METERS",(char*)"",(char*)"",(char*)"METERS",
     (char*)"",(char*)"DEGREES",(char*)"",(char*)"",(char*)"DEGREES",(char*)""};
  fits_create_tbl(fptr_,BINARY_TBL,0,11,ttype,tform,tunit,"AIPS AN",&status);
  checkFitsStatus(status,"Creating antenna table of "+fname_);

  put_double(fptr_,"ARRAYX",arrayxyz[0],&status);
  put_double(fptr_,"ARRAYY",arrayxyz[1],&status);
  put_double(fptr_,"ARRAYZ",arrayxyz[2],&status);
  put_double(fptr_,"FREQ",centreFreq,&status);
  put_double(fptr_,"GSTIA0",gst,&status);
  put_double(fptr_,"DEGPDY",VISCONV_DEGPDY,&status);
  put_string(fptr_,"RDATE",truncateDate(epoch),&status);
  put_double(fptr_,"POLARX",0.0,&status);
  put_double(fptr_,"POLARY",0.0,&status);
  put_double(fptr_,"UT1UTC",0.0,&status);
  put_double(fptr_,"DATUTC",0.0,&status);
  put_string(fptr_,"TIMSYS","UTC",&status);
  put_string(fptr_,"ARRNAM",arrayName,&status);
  put_int(fptr_,"NUMORB",0,&status); /* orbital parameters */
  put_int(fptr_,"NOPCAL",3,&status); /* pol. calibration values per IF */
  put_int(fptr_,"FREQID",-1,&status);
  put_double(fptr_,"IATUTC",VISCONV_IATUTC,&status);
  /* station coordinates are right handed */
  put_string(fptr_,"XYZHAND","RIGHT",&status);
  checkFitsStatus(status,"Writing antenna table header of "+fname_);

  char *polx=(char*)"X";
  char *poly=(char*)"Y";
  float pola=0.0f;
  float polb=90.0f;
  float polcal[3]={0.0f,0.0f,0.0f};
  int mount=0;
  for (size_t ci=0; ci<names.size(); ci++) {
    LONGLONG row=(LONGLONG)ci+1;
    char *name=const_cast<char*>(names[ci].c_str());
    double local[3];
    ecefToLocal(&xyz[3*ci],arrayxyz,loc.longitude,local);
    int nosta=(int)row;
    fits_write_col(fptr_,TSTRING,1,row,1,1,&name,&status);
    fits_write_col(fptr_,TDOUBLE,2,row,1,3,local,&status);
    fits_write_col(fptr_,TINT,3,row,1,1,&nosta,&status);
    fits_write_col(fptr_,TINT,4,row,1,1,&mount,&status);
    /* STAXOF stays 0 */
    fits_write_col(fptr_,TSTRING,6,row,1,1,&polx,&status);
    fits_write_col(fptr_,TFLOAT,7,row,1,1,&pola,&status);
    fits_write_col(fptr_,TFLOAT,8,row,1,3,polcal,&status);
    fits_write_col(fptr_,TSTRING,9,row,1,1,&poly,&status);
    fits_write_col(fptr_,TFLOAT,10,row,1,1,&polb,&status);
    fits_write_col(fptr_,TFLOAT,11,row,1,3,polcal,&status);
    if (status) {
      std::ostringstream ctx;
      ctx<<"Writing antenna "<<names[ci]<<" to "<<fname_;
      checkFitsStatus(status,ctx.str());
    }
  }

  selectPrimary();
}

void
UvContainer::updateKey(const char *key, double value) {
  if (!fptr_) {
    throw IOError(fname_+" is closed");
  }
  selectPrimary();
  int status=0;
  fits_update_key(fptr_,TDOUBLE,key,&value,NULL,&status);
  checkFitsStatus(status,std::string("Updating ")+key+" of "+fname_);
  if (!strcmp(key,"CRVAL4")) {
    hdr_.centreFreq=value;
  } else if (!strcmp(key,"CDELT4")) {
    hdr_.chanWidth=value;
  }
}

void
UvContainer::close() {
  if (!fptr_) {
    return;
  }
  int status=0;
  fits_close_file(fptr_,&status);
  fptr_=0;
  checkFitsStatus(status,"Closing "+fname_);
}

void
removePhaseTracking(UvContainer &uv, bool verbose) {
  const UvHeader &hdr=uv.header();
  /* frequencies of the unshifted axis */
  std::vector<double> freqs=uv.channelFrequencies();
  uv.updateKey("CRVAL4",hdr.centreFreq-hdr.chanWidth/2.0);

  std::vector<float> params;
  std::vector<float> samples;
  long progress=hdr.Nrows/10;
  if (!progress) {
    progress=1;
  }
  for (long row=0; row<hdr.Nrows; row++) {
    uv.readRow(row,params,samples);
    /* w is already in seconds */
    applyPhaseRotorPacked(samples,(double)params[2],freqs,PHASE_REMOVE);
    uv.writeGroup(row,params,samples);
    if (verbose && !((row+1)%progress)) {
      std::cout<<(row+1)*100/hdr.Nrows<<"% ("<<row+1<<"/"<<hdr.Nrows<<" rows)"<<std::endl;
    }
  }
}

static void *
create_threadfn(void *data) {
  thread_data_create_t *t=(thread_data_create_t*)data;
  for (int ci=t->startfile; ci<t->endfile; ci++) {
    try {
      std::unique_ptr<UvContainer> uv=UvContainer::create((*t->fnames)[ci],(*t->hdrs)[ci]);
      uv->close();
    } catch (const std::exception &) {
      t->error=std::current_exception();
      return NULL;
    }
  }
  return NULL;
}

void
createUvContainers(const std::vector<std::string> &fnames, const std::vector<UvHeader> &hdrs, int Nt) {
  if (fnames.size()!=hdrs.size()) {
    std::ostringstream msg;
    msg<<fnames.size()<<" file names but "<<hdrs.size()<<" headers";
    throw ValueError(msg.str());
  }
  int Nf=(int)fnames.size();
  if (!Nf) {
    return;
  }
  if (Nt<1) {
    Nt=1;
  }
  if (Nt>Nf) {
    Nt=Nf;
  }
  std::vector<thread_data_create_t> threaddata(Nt);
  std::vector<pthread_t> th_array(Nt);
  pthread_attr_t attr;
  pthread_attr_init(&attr);
  pthread_attr_setdetachstate(&attr,PTHREAD_CREATE_JOINABLE);

  int Nthf0=(Nf+Nt-1)/Nt;
  int ci=0;
  int nth;
  int err=0;
  for (nth=0; nth<Nt && ci<Nf; nth++) {
    threaddata[nth].startfile=ci;
    threaddata[nth].endfile=(ci+Nthf0<Nf?ci+Nthf0:Nf);
    threaddata[nth].fnames=&fnames;
    threaddata[nth].hdrs=&hdrs;
    if ((err=pthread_create(&th_array[nth],&attr,create_threadfn,(void*)&threaddata[nth]))!=0) {
      break;
    }
    ci=threaddata[nth].endfile;
  }
  int Nthreads=nth;
  for (nth=0; nth<Nthreads; nth++) {
    pthread_join(th_array[nth],NULL);
  }
  pthread_attr_destroy(&attr);
  if (err) {
    throw Error(std::string("Cannot create thread: ")+strerror(err));
  }

  /* first failure keeps its own type */
  for (nth=0; nth<Nthreads; nth++) {
    if (threaddata[nth].error) {
      std::rethrow_exception(threaddata[nth].error);
    }
  }
}

}
