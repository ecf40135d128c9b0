/*    evalmix: density and distribution function of a fitted mixture
 *
 *    Copyright (C) 2022 University of Southern California and
 *                       Andrew D. Smith
 *
 *    Authors: Andrew D. Smith
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation, either version 3 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>
#include <iostream>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>

#include "smithlab_utils.hpp"
#include "smithlab_os.hpp"
#include "OptionParser.hpp"

#include "MixtureParams.hpp"
#include "FittedMixture.hpp"
#include "load_sample.hpp"

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::endl;
using std::runtime_error;

int
main_evalmix(int argc, const char **argv) {

  try {

    string outfile;
    string points_file;
    double lo = 0.0, hi = 0.0;
    size_t n_points = 200;
    bool VERBOSE = false;

    /****************** COMMAND LINE OPTIONS ********************/
    OptionParser opt_parse(strip_path(argv[0]),
                           "evaluate the density and distribution function "
                           "of a mixture given by a params file, at points "
                           "from a file or on an even grid",
                           "<params-file>");
    opt_parse.add_opt("out", 'o', "output file (default: stdout)",
                      false, outfile);
    opt_parse.add_opt("points", 'x', "file of points to evaluate at",
                      false, points_file);
    opt_parse.add_opt("from", 'a', "grid start", false, lo);
    opt_parse.add_opt("to", 'b', "grid end", false, hi);
    opt_parse.add_opt("grid", 'n', "number of grid points", false, n_points);
    opt_parse.add_opt("verbose", 'v', "print more run info", false, VERBOSE);
    opt_parse.set_show_defaults();
    vector<string> leftover_args;
    opt_parse.parse(argc, argv, leftover_args);
    if (argc == 1 || opt_parse.help_requested()) {
      cerr << opt_parse.help_message() << endl
           << opt_parse.about_message() << endl;
      return EXIT_SUCCESS;
    }
    if (opt_parse.about_requested()) {
      cerr << opt_parse.about_message() << endl;
      return EXIT_SUCCESS;
    }
    if (opt_parse.option_missing()) {
      cerr << opt_parse.option_missing_message() << endl;
      return EXIT_SUCCESS;
    }
    if (leftover_args.size() != 1) {
      cerr << opt_parse.help_message() << endl;
      return EXIT_FAILURE;
    }
    const string params_file(leftover_args.front());
    /****************** END COMMAND LINE OPTIONS *****************/

    const FittedMixture mixture(read_params_file(params_file));
    if (VERBOSE)
      cerr << "[MIXTURE] " << mixture << endl;

    vector<double> points;
    if (!points_file.empty())
      load_sample(points_file, points);
    else {
      // default grid covers both components
      const ExpGaussParams &p = mixture.params();
      if (!(hi > lo)) {
        lo = std::min(0.0, p.mu - 4.0*p.sigma);
        hi = std::max(8.0*p.beta, p.mu + 4.0*p.sigma);
      }
      points = evaluation_grid(lo, hi, n_points);
    }

    const vector<double> density(mixture.pdf(points));
    const vector<double> distribution(mixture.cdf(points));

    std::ofstream of;
    if (!outfile.empty()) of.open(outfile.c_str());
    if (!outfile.empty() && !of)
      throw runtime_error("failed to open output file: " + outfile);
    std::ostream out(outfile.empty() ? cout.rdbuf() : of.rdbuf());
    out.precision(10);
    for (size_t i = 0; i < points.size(); ++i)
      out << points[i] << '\t' << density[i] << '\t'
          << distribution[i] << '\n';
  }
  catch (const SMITHLABException &e) {
    cerr << "ERROR: " << e.what() << endl;
    return EXIT_FAILURE;
  }
  catch (const std::exception &e) {
    cerr << "ERROR: " << e.what() << endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
