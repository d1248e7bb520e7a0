/*
 * MITRegrid: Great-Circle Refinement of MITgcm Corner-Point Grids
 * Copyright (c) 2013-2016 by Elizabeth Fischer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

// Regrids a rectangular region of an existing mitgrid file

#include <string>
#include <iostream>
#include <boost/program_options.hpp>
#include <everytrace.h>
#include <ibmisc/stdio.hpp>
#include <mitregrid/error.hpp>
#include <mitregrid/cmdline.hpp>
#include <mitregrid/geodesy.hpp>
#include <mitregrid/mitgridfile.hpp>
#include <mitregrid/regrid.hpp>

using namespace std;
using namespace ibmisc;
using namespace mitregrid;
namespace po = boost::program_options;

int main(int argc, char **argv)
{
    everytrace_init();

    // Parse command line arguments
    std::string ifname, ofname;
    int ni, nj;
    RegridParams params;

    try {
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help,h", "produce help message")
            ("verbose,v", po::bool_switch(&params.verbose), "print diagnostic output")
        ;

        po::options_description hidden("Positional arguments");
        hidden.add_options()
            ("mitgridfile", po::value<string>(&ifname)->required(), "input mitgrid file")
            ("ni", po::value<int>(&ni)->required(), "cells in x direction")
            ("nj", po::value<int>(&nj)->required(), "cells in y direction")
            ("lon1", po::value<double>(&params.lon1)->required(), "corner 1 longitude")
            ("lat1", po::value<double>(&params.lat1)->required(), "corner 1 latitude")
            ("lon2", po::value<double>(&params.lon2)->required(), "corner 2 longitude")
            ("lat2", po::value<double>(&params.lat2)->required(), "corner 2 latitude")
            ("lon_subscale", po::value<int>(&params.lon_subscale)->required(), "x-direction subscale factor")
            ("lat_subscale", po::value<int>(&params.lat_subscale)->required(), "y-direction subscale factor")
            ("outfile", po::value<string>(&ofname)->required(), "output mitgrid file")
        ;

        po::positional_options_description positional;
        positional.add("mitgridfile", 1);
        positional.add("ni", 1);
        positional.add("nj", 1);
        positional.add("lon1", 1);
        positional.add("lat1", 1);
        positional.add("lon2", 1);
        positional.add("lat2", 1);
        positional.add("lon_subscale", 1);
        positional.add("lat_subscale", 1);
        positional.add("outfile", 1);

        po::options_description all;
        all.add(desc).add(hidden);

        if (argc == 1) {
            cout << "Usage: mitregrid MITGRIDFILE NI NJ LON1 LAT1 LON2 LAT2 "
                "LON_SUBSCALE LAT_SUBSCALE OUTFILE [-v]" << endl;
            cout << desc << endl;
            return 1;
        }

        po::variables_map vm;
        po::store(po::command_line_parser(
            protect_negative_numbers(argc, argv, {})).
            options(all).positional(positional).run(), vm);

        if (vm.count("help")) {
            cerr << desc << endl;
            return 1;
        }
        po::notify(vm);

    } catch(std::exception &exp) {
        cout << "Error parsing arguments:" << endl << exp.what() << endl;
        return 1;
    }

    try {
        SphereGeod const geod;
        MitGrid const grid(regrid(ifname, ni, nj, params, geod));
        write_mitgridfile(ofname, grid, grid.ni, grid.nj, params.verbose);

        std::string const summary(strprintf(
            "%s: ni=%d nj=%d", ofname.c_str(), grid.ni, grid.nj));
        printf("%s\n", summary.c_str());
    } catch(mitregrid::Exception &exp) {
        // Message already printed by mitregrid_error
        return exp.retcode();
    }

    return 0;
}
