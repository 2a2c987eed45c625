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


#include <glob.h>
#include <stdlib.h>
#include <unistd.h>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "Visconv.h"

using namespace std;

static double threshold=0.8; /* fraction of flagged samples above which a channel is flagged */
static const char *pattern="./1?????????_??.mwaf";
static int Nt=1; /* threads for decoding */
static int verbose=0;

static void
print_copyright(void) {
  cout<<"reflag-mwaf (visconv " VISCONV_VERSION ") (C) 2024 The visconv developers"<<endl;
}

static void
print_help(void) {
   cout << "Usage:" << endl;
   cout<<"reflag-mwaf [-t threshold] [-p pattern]"<<endl;
   cout<<endl;
   cout << "Flag whole channels in mwaf files, writing RTS_<name> next to each file" << endl;
   cout << "-t threshold: flag a channel when the flagged fraction is above this, 0<t<=1 : default "<<threshold << endl;
   cout << "-p pattern: files to process : default "<<pattern << endl;
   cout << "-n no of worker threads : default "<<Nt << endl;
   cout << "-v : verbose" << endl;
   cout << "-h : this help" << endl;
   cout <<"Report bugs on the visconv issue tracker"<<endl;
}

static void
ParseCmdLine(int ac, char **av) {
    print_copyright();
    int c;
    while((c=getopt(ac, av, ":t:p:n:vh"))!= -1)
    {
        switch(c)
        {
            case 't':
                threshold= atof(optarg);
                break;
            case 'p':
                pattern= optarg;
                break;
            case 'n':
                Nt= atoi(optarg);
                if (Nt<1) { Nt=1; }
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
}

/* sorted list of files matching pat */
static vector<string>
find_files(const char *pat) {
  vector<string> files;
  glob_t g;
  int err=glob(pat,0,NULL,&g);
  if (err==0) {
    for (size_t ci=0; ci<g.gl_pathc; ci++) {
      files.push_back(g.gl_pathv[ci]);
    }
  } else if (err!=GLOB_NOMATCH) {
    globfree(&g);
    throw Visconv::IOError(string("Cannot search for ")+pat);
  }
  globfree(&g);
  return files;
}

int
main(int argc, char **argv) {
    ParseCmdLine(argc, argv);

    try {
      if (threshold<=0.0) {
        throw Visconv::ValueError("Not running with a threshold of 0 or less");
      } else if (threshold>1.0) {
        throw Visconv::ValueError("The threshold cannot be bigger than 1");
      }

      vector<string> files=find_files(pattern);
      if (files.empty()) {
        throw Visconv::IOError(string("No files found matching: ")+pattern);
      }

      for (size_t ci=0; ci<files.size(); ci++) {
        Visconv::BitFlagArchive archive=Visconv::BitFlagArchive::load(files[ci]);
        Visconv::OccupancyStats stats=Visconv::computeOccupancy(archive,Nt);
        string outname=Visconv::reflaggedName(files[ci]);
        Visconv::ReflagDirective dir=Visconv::reflag(archive,stats,outname,threshold);
        cout<<files[ci]<<" -> "<<outname<<": "<<dir.size()<<" channels flagged";
        if (!dir.empty()) {
          cout<<" (";
          for (size_t cj=0; cj<dir.size(); cj++) {
            cout<<(cj?",":"")<<dir[cj].channel;
          }
          cout<<")";
        }
        cout<<endl;
        if (verbose) {
          for (size_t cj=0; cj<stats.flagFraction.size(); cj++) {
            cout<<"  channel "<<cj<<": "<<stats.flagCounts[cj]<<"/"<<stats.totalSamples
                <<" ("<<stats.flagFraction[cj]<<")"<<endl;
          }
        }
      }
    } catch (const std::exception &e) {
      cerr<<"Error: "<<e.what()<<endl;
      return 1;
    }
   return 0;
}
