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


#ifndef __VISCONVMAIN_H__
#define __VISCONVMAIN_H__

/* print progress every 1/PROGRESS_STEPS of the rows */
#ifndef PROGRESS_STEPS
#define PROGRESS_STEPS 10
#endif


/********* main.cpp ***************************************************/
extern void
print_copyright(void);
extern void
print_help(void);
extern void
ParseCmdLine(int ac, char **av);


/********* convert_mode.cpp *******************************************/
extern int
run_conversion(void);
#endif /* __VISCONVMAIN_H__ */
