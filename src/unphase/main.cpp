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


#include <stdlib.h>
#include <unistd.h>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "errors.h"
#include "fitsutil.h"
#include "uvcontainer.h"

using namespace std;

static char *infile=NULL;
static char *outfile=NULL;
static int overwrite=0;
static int verbose=0;

static void
print_copyright(void) {
  cout<<"unphase-uvfits (visconv " VISCONV_VERSION ") (C) 2024 The visconv developers"<<endl;
}

static void
print_help(void) {
   cout << "Usage:" << endl;
   cout<<"unphase-uvfits -i in.uvfits -o out.uvfits"<<endl;
   cout<<"or"<<endl;
   cout<<"unphase-uvfits -i in.uvfits -w"<<endl;
   cout<<endl;
   cout << "Remove phase tracking from the visibilities of a uvfits file" << endl;
   cout << "-i input uvfits file" << endl;
   cout << "-o output uvfits file, the input is copied first" << endl;
   cout << "-w : overwrite the input file" << endl;
   cout << "-v : verbose" << endl;
   cout << "-h : this help" << endl;
   cout <<"Report bugs on the visconv issue tracker"<<endl;
}

static void
ParseCmdLine(int ac, char **av) {
    print_copyright();
    int c;
    if(ac < 2)
    {
        print_help();
        exit(0);
    }
    while((c=getopt(ac, av, ":i:o:wvh"))!= -1)
    {
        switch(c)
        {
            case 'i':
                infile= optarg;
                break;
            case 'o':
                outfile= optarg;
                break;
            case 'w':
                overwrite=1;
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
    if (!infile) {
     print_help();
     exit(1);
    }
}

int
main(int argc, char **argv) {
    ParseCmdLine(argc, argv);

    try {
      string target;
      if (!outfile && !overwrite) {
        throw Visconv::ValueError("No output given, nor told to overwrite, use one of -o or -w");
      } else if (outfile && overwrite) {
        throw Visconv::ValueError("An output was given together with -w, use one of -o or -w");
      } else if (outfile) {
        Visconv::copyFile(infile,outfile);
        target=outfile;
      } else {
        target=infile;
      }

      unique_ptr<Visconv::UvContainer> uv=Visconv::UvContainer::open(target);
      cout<<target<<": "<<uv->header().Nrows<<" rows, "<<uv->header().Nchan<<" channels"<<endl;
      Visconv::removePhaseTracking(*uv,verbose!=0);
      uv->close();
      cout<<"Done."<<endl;
    } catch (const std::exception &e) {
      cerr<<"Error: "<<e.what()<<endl;
      return 1;
    }
   return 0;
}
