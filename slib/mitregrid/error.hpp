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

#ifndef MITREGRID_ERROR_HPP
#define MITREGRID_ERROR_HPP

#include <string>
#include <everytrace.hpp>

/** @defgroup mitregrid mitregrid.hpp
@brief Basic stuff common to all mitregrid */
namespace mitregrid {

/** Return codes passed to mitregrid_error().  They travel with the
thrown Exception, and the command line tools use them as exit codes. */
enum ErrorCode {
    INVALID_SUBSCALE = 10,    // Subscale factor < 1
    INVALID_REGION = 11,      // Degenerate region, or halo outside source grid
    GEODESY_FAILURE = 12,     // Non-finite input to a geodesic computation
    SHAPE_MISMATCH = 13,      // Assembled field disagrees with its staggering
    IO_ERROR = 14             // mitgrid file could not be read or written
};

/** Thrown by the default error handler. */
class Exception : public everytrace::Exception {
    int _retcode;
    std::string _msg;
public:
    Exception(int retcode, std::string const &msg)
        : _retcode(retcode), _msg(msg) {}
    virtual ~Exception() {}

    int retcode() const { return _retcode; }
    virtual const char *what() const noexcept
        { return _msg.c_str(); }
};

typedef void (*error_ptr) (int retcode, char const *format, ...);

/** Prints the message to stderr and throws mitregrid::Exception. */
extern void default_error(int retcode, char const *format, ...);

/** Use the default error handler by default; user or other
    library can change if needed.  Handlers must not return. */
extern error_ptr mitregrid_error;

}   // namespace
/** @} */

#endif // Guard
