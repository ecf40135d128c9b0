/*    simulate: draw a sample from an exponential-Gaussian mixture
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
#include <stdexcept>
#include <cstdlib>

#include "smithlab_utils.hpp"
#include "smithlab_os.hpp"
#include "OptionParser.hpp"

#include "MixtureParams.hpp"
#include "MixtureSampler.hpp"
#include "load_sample.hpp"

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::endl;
using std::runtime_error;

int
main_simulate(int argc, const char **argv) {

  try {

    string outfile;
    string params_in_file;
    size_t n_obs = 1000;
    unsigned long seed = 408;
    bool VERBOSE = false;

    ExpGaussParams params(1.0, 10.0, 1.0, 0.5);

    /****************** COMMAND LINE OPTIONS ********************/
    OptionParser opt_parse(strip_path(argv[0]),
                           "simulate observations from a mixture of an "
                           "exponential and a gaussian", "");
    opt_parse.add_opt("out", 'o', "output file (default: stdout)",
                      false, outfile);
    opt_parse.add_opt("n", 'n', "number of observations", false, n_obs);
    opt_parse.add_opt("beta", 'b', "exponential scale", false, params.beta);
    opt_parse.add_opt("mu", 'm', "gaussian mean", false, params.mu);
    opt_parse.add_opt("sigma", 'd', "gaussian sd", false, params.sigma);
    opt_parse.add_opt("prop", 'p', "proportion of exponential observations",
                      false, params.proportion);
    opt_parse.add_opt("params-in", 'P', "take parameters from this file",
                      false, params_in_file);
    opt_parse.add_opt("seed", 's', "random seed", false, seed);
    opt_parse.add_opt("verbose", 'v', "print more run info", false, VERBOSE);
    opt_parse.set_show_defaults();
    vector<string> leftover_args;
    opt_parse.parse(argc, argv, leftover_args);
    if (opt_parse.help_requested()) {
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
    if (!leftover_args.empty()) {
      cerr << opt_parse.help_message() << endl;
      return EXIT_FAILURE;
    }
    /****************** END COMMAND LINE OPTIONS *****************/

    if (!params_in_file.empty())
      params = read_params_file(params_in_file);

    const MixtureSampler sampler(params, seed);
    if (VERBOSE)
      cerr << "[SIMULATING " << n_obs << " FROM] " << sampler.params() << endl;
    const vector<double> sample(sampler.sample(n_obs));

    std::ofstream of;
    if (!outfile.empty()) of.open(outfile.c_str());
    if (!outfile.empty() && !of)
      throw runtime_error("failed to open output file: " + outfile);
    std::ostream out(outfile.empty() ? cout.rdbuf() : of.rdbuf());
    write_sample(out, sample);
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
