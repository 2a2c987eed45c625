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
#include <exception>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "visconvmain.h"


using namespace std;
using namespace Data;

void
print_copyright(void) {
  cout<<"ms-to-uvfits (visconv " VISCONV_VERSION ") (C) 2024 The visconv developers"<<endl;
}


void
print_help(void) {
   cout << "Usage:" << endl;
   cout<<"ms-to-uvfits -d MS -o stem"<<endl;
   cout<<"or"<<endl;
   cout<<"ms-to-uvfits -d MS -o out.uvfits -1"<<endl;
   cout<<endl;
   cout << "-d MS name" << endl;
   cout << "-o output: stem of the files stem_band01.uvfits, stem_band02.uvfits, ..., or the file name with -1" << endl;
   cout << "-c input column (OFFSET_DATA/DATA/CORRECTED_DATA/...) : default " <<Data::DataField<< endl;
   cout << "-1 : write all channels to a single uvfits file, ignore MWA_SUBBAND" << endl;
   cout << "-u : undo phase tracking" << endl;
   cout << "-r : reset weights to 1, do not use WEIGHT_SPECTRUM" << endl;
   cout << "-n no of worker threads : default "<<Data::Nt << endl;
   cout << "-L lon,lat,height : array location (deg,deg,m) : default MWA" << endl;
   cout << "-T telescope name : default "<<Data::telescopeName << endl;
   cout << "-v : verbose" << endl;
   cout << "-h : this help" << endl;
   cout <<"Report bugs on the visconv issue tracker"<<endl;
}

static void
parse_location(const char *arg) {
  double lon,lat,h;
  if (sscanf(arg,"%lf,%lf,%lf",&lon,&lat,&h)!=3) {
    cout<<"Error: cannot parse location '"<<arg<<"', expected lon,lat,height"<<endl;
    print_help();
    exit(1);
  }
  arrayLocation.longitude=lon*M_PI/180.0;
  arrayLocation.latitude=lat*M_PI/180.0;
  arrayLocation.height=h;
}

void
ParseCmdLine(int ac, char **av) {
    print_copyright();
    int c;
    if(ac < 2)
    {
        print_help();
        exit(0);
    }
    while((c=getopt(ac, av, ":c:d:n:o:L:T:1ruvh"))!= -1)
    {
        switch(c)
        {
            case 'd':
                TableName = optarg;
                break;
            case 'o':
                OutStem = optarg;
                break;
            case 'c':
                DataField = optarg;
                break;
            case '1':
                oneToOne=1;
                break;
            case 'u':
                undoPhase=1;
                break;
            case 'r':
                resetWeights=1;
                break;
            case 'n':
                Nt= atoi(optarg);
                if (Nt<1) { Nt=1; }
                break;
            case 'L':
                parse_location(optarg);
                break;
            case 'T':
                telescopeName= optarg;
                break;
            case 'v':
                verbose=1;
                break;
            case 'h':
                print_help();
                exit(1);
            case ':':
                cout<<"Error: A value is missing for one of the options"<<endl;
                print_help();
                exit(1);
            default:
                print_help();
                exit(1);
        }
    }

    if (TableName && OutStem) {
     cout<<" MS: "<<TableName<<endl;
    } else {
     print_help();
     exit(1);
    }
    cout<<"Reading column "<<DataField<<(undoPhase?", undoing phase tracking":"")
        <<(resetWeights?", weights set to 1":"")<<"."<<endl;
}

int
main(int argc, char **argv) {
    ParseCmdLine(argc, argv);

    try {
      run_conversion();
    } catch (const std::exception &e) {
      cerr<<"Error: "<<e.what()<<endl;
      return 1;
    }
   return 0;
}
