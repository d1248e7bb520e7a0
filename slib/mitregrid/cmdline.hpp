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

#ifndef MITREGRID_CMDLINE_HPP
#define MITREGRID_CMDLINE_HPP

#include <string>
#include <vector>

namespace mitregrid {

/** True if tok parses completely as a floating point number. */
extern bool is_number(std::string const &tok);

/** Rewrites argv[1..argc-1] so boost::program_options accepts negative
numbers (western longitudes, southern latitudes), which it otherwise
takes for short options:
<pre>
    --opt -30     -->  --opt=-30    (if opt is in value_options)
    -30           -->  moved after a trailing "--", as a positional
</pre>
Options keep their order, as do positionals.
@return Arguments for po::command_line_parser, without the program name. */
extern std::vector<std::string> protect_negative_numbers(
    int argc, char const * const *argv,
    std::vector<std::string> const &value_options);

}   // namespace mitregrid
#endif  // Guard
