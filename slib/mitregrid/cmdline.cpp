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

#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <mitregrid/cmdline.hpp>

namespace mitregrid {

bool is_number(std::string const &tok)
{
    try {
        boost::lexical_cast<double>(tok);
        return true;
    } catch(boost::bad_lexical_cast const &) {
        return false;
    }
}

std::vector<std::string> protect_negative_numbers(
    int argc, char const * const *argv,
    std::vector<std::string> const &value_options)
{
    std::vector<std::string> options;
    std::vector<std::string> positionals;

    bool end_of_options = false;
    for (int i=1; i<argc; ++i) {
        std::string const tok(argv[i]);

        if (end_of_options) {
            positionals.push_back(tok);
        } else if (tok == "--") {
            end_of_options = true;
        } else if (tok.size() > 1 && tok[0] == '-' && !is_number(tok)) {
            std::string opt(tok);
            if (tok.compare(0, 2, "--") == 0
                && tok.find('=') == std::string::npos
                && i+1 < argc
                && std::find(value_options.begin(), value_options.end(),
                    tok.substr(2)) != value_options.end())
            {
                opt += "=";
                opt += argv[++i];
            }
            options.push_back(opt);
        } else {
            positionals.push_back(tok);
        }
    }

    std::vector<std::string> ret(options);
    if (positionals.size() > 0) {
        ret.push_back("--");
        ret.insert(ret.end(), positionals.begin(), positionals.end());
    }
    return ret;
}

}   // namespace mitregrid
