/*    fitmix: fit an exponential-Gaussian mixture to a sample by EM
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
#include "ExpGaussEM.hpp"
#include "load_sample.hpp"

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::endl;
using std::runtime_error;

static void
write_trace(const string &trace_file, const FitResult &result) {
  std::ofstream out(trace_file.c_str());
  if (!out)
    throw runtime_error("failed to open trace file: " + trace_file);
  out.precision(17);
  for (size_t i = 0; i < result.log_likelihood_trace.size(); ++i)
    out << i << '\t' << result.log_likelihood_trace[i] << '\n';
}

int
main_fitmix(int argc, const char **argv) {

  try {

    string outfile;
    string params_in_file;
    string trace_file;

    FitOptions options;
    size_t n_starts = 0;
    unsigned long seed = 408;

    /****************** COMMAND LINE OPTIONS ********************/
    OptionParser opt_parse(strip_path(argv[0]),
                           "fit a mixture of an exponential and a gaussian "
                           "to a sample of numbers by expectation "
                           "maximization", "<sample-file>");
    opt_parse.add_opt("out", 'o', "output params file (default: stdout)",
                      false, outfile);
    opt_parse.add_opt("itr", 'i', "max iterations", false,
                      options.max_iterations);
    opt_parse.add_opt("tolerance", 't', "log-likelihood change to stop at",
                      false, options.tolerance);
    opt_parse.add_opt("sigma-floor", '\0', "smallest gaussian sd allowed",
                      false, options.sigma_floor);
    opt_parse.add_opt("params-in", 'P', "starting parameters "
                      "(default: from the sample)", false, params_in_file);
    opt_parse.add_opt("starts", 'n', "number of additional random starts",
                      false, n_starts);
    opt_parse.add_opt("seed", 's', "random seed for additional starts",
                      false, seed);
    opt_parse.add_opt("trace", 'T', "write log-likelihood per iteration "
                      "to this file", false, trace_file);
    opt_parse.add_opt("verbose", 'v', "print more run info", false,
                      options.VERBOSE);
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
    const string sample_file(leftover_args.front());
    /****************** END COMMAND LINE OPTIONS *****************/

    vector<double> sample;
    load_sample(sample_file, sample);
    if (options.VERBOSE)
      cerr << "[OBSERVATIONS: " << sample.size() << "]" << endl;

    vector<ExpGaussParams> starts;
    if (!params_in_file.empty()) {
      options.set_initial_params(read_params_file(params_in_file));
      starts.push_back(options.initial_params);
    }
    else if (n_starts > 0)
      starts.push_back(initial_params(sample));

    if (n_starts > 0) {
      const vector<ExpGaussParams> random_starts =
        random_starting_points(sample, n_starts, seed);
      starts.insert(starts.end(), random_starts.begin(), random_starts.end());
    }

    const FitResult result = starts.empty() ?
      fit_mixture(sample, options) :
      fit_mixture_multistart(sample, starts, options);

    if (!result.converged)
      cerr << "warning: no convergence after " << result.iterations
           << " iterations" << endl;
    if (result.near_degenerate)
      cerr << "warning: exponential component lost support during "
           << "fitting; beta was held fixed" << endl;

    write_params_file(outfile, result);
    if (!trace_file.empty())
      write_trace(trace_file, result);
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
