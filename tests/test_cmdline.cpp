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

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <iostream>
#include <boost/program_options.hpp>
#include <mitregrid/cmdline.hpp>

using namespace std;
using namespace mitregrid;
namespace po = boost::program_options;

TEST(CmdlineTest, is_number)
{
    EXPECT_TRUE(is_number("3"));
    EXPECT_TRUE(is_number("-30.5"));
    EXPECT_TRUE(is_number("-3e2"));
    EXPECT_FALSE(is_number("-v"));
    EXPECT_FALSE(is_number("--lon1"));
    EXPECT_FALSE(is_number("grid.bin"));
    EXPECT_FALSE(is_number(""));
}

TEST(CmdlineTest, positionals)
{
    char const *argv[] = {"mitregrid",
        "grid.bin", "3", "3", "-30.5", "1", "-29", "2", "1", "1", "out.bin", "-v"};
    int const argc = sizeof(argv) / sizeof(argv[0]);

    std::vector<std::string> const args(protect_negative_numbers(argc, argv, {}));
    std::vector<std::string> const expected {"-v", "--",
        "grid.bin", "3", "3", "-30.5", "1", "-29", "2", "1", "1", "out.bin"};
    EXPECT_EQ(expected, args);

    // boost::program_options now sees the negative numbers as values
    double lon1, lon2;
    bool verbose = false;
    po::options_description desc;
    desc.add_options()
        ("verbose,v", po::bool_switch(&verbose), "")
        ("file", po::value<std::string>(), "")
        ("ni", po::value<int>(), "")
        ("nj", po::value<int>(), "")
        ("lon1", po::value<double>(&lon1), "")
        ("lat1", po::value<double>(), "")
        ("lon2", po::value<double>(&lon2), "");
    po::positional_options_description positional;
    positional.add("file", 1).add("ni", 1).add("nj", 1)
        .add("lon1", 1).add("lat1", 1).add("lon2", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(
        std::vector<std::string>(args.begin(), args.begin() + 8)).
        options(desc).positional(positional).run(), vm);
    po::notify(vm);

    EXPECT_TRUE(verbose);
    EXPECT_EQ(-30.5, lon1);
    EXPECT_EQ(-29., lon2);
}

TEST(CmdlineTest, option_values)
{
    char const *argv[] = {"mitmkgrid",
        "--lon1", "-30", "--lat1=-5", "-v", "--outfile", "x.bin", "--lat2", "10"};
    int const argc = sizeof(argv) / sizeof(argv[0]);

    std::vector<std::string> const args(protect_negative_numbers(argc, argv,
        {"lon1", "lat1", "lat2", "outfile"}));
    std::vector<std::string> const expected {
        "--lon1=-30", "--lat1=-5", "-v", "--outfile=x.bin", "--lat2=10"};
    EXPECT_EQ(expected, args);
}

TEST(CmdlineTest, end_of_options)
{
    char const *argv[] = {"prog", "-v", "--", "-h", "-1"};
    std::vector<std::string> const args(protect_negative_numbers(5, argv, {}));
    std::vector<std::string> const expected {"-v", "--", "-h", "-1"};
    EXPECT_EQ(expected, args);
}


int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
