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

// Creates a new mitgrid file over a lon/lat rectangle

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

    std::string ofname;
    RegridParams params;

    // -------------------------------------------------------------
    // Parse Command Line Args
    try {
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help,h", "produce help message")
            ("lon1", po::value<double>(&params.lon1)->required(), "corner 1 longitude")
            ("lat1", po::value<double>(&params.lat1)->required(), "corner 1 latitude")
            ("lon2", po::value<double>(&params.lon2)->required(), "corner 2 longitude")
            ("lat2", po::value<double>(&params.lat2)->required(), "corner 2 latitude")
            ("lon_subscale", po::value<int>(&params.lon_subscale)->required(), "x-direction subscale factor")
            ("lat_subscale", po::value<int>(&params.lat_subscale)->required(), "y-direction subscale factor")
            ("outfile", po::value<string>(&ofname)->required(), "output mitgrid file")
            ("verbose,v", po::bool_switch(&params.verbose), "print diagnostic output")
        ;

        if (argc == 1) {
            cout << desc << endl;
            return 1;
        }

        po::variables_map vm;
        po::store(po::command_line_parser(
            protect_negative_numbers(argc, argv,
                {"lon1", "lat1", "lon2", "lat2",
                "lon_subscale", "lat_subscale", "outfile"})).
            options(desc).run(), vm);

        if (vm.count("help")) {
            cerr << desc << endl;
            return 1;
        }
        po::notify(vm);

    } catch(std::exception &exp) {
        cout << "Error parsing arguments:" << endl << exp.what() << endl;
        return 1;
    }

    // ------------------------------------------------------
    try {
        SphereGeod const geod;
        MitGrid const grid(mkgrid(params, geod));
        write_mitgridfile(ofname, grid, grid.ni, grid.nj, params.verbose);

        std::string const summary(strprintf(
            "%s: ni=%d nj=%d", ofname.c_str(), grid.ni, grid.nj));
        printf("%s\n", summary.c_str());
    } catch(mitregrid::Exception &exp) {
        return exp.retcode();
    }

    return 0;
}
