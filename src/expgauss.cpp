/*    Copyright (C) 2022 University of Southern California and
 *                            Andrew D. Smith
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

#include <iostream>
#include <string>
#include <string.h>

using std::string;
using std::cerr;
using std::endl;

#define PROGRAM_NAME "expgauss"
#define PROGRAM_VERSION " 1.0.0"

int main_fitmix(int argc, const char **argv);
int main_simulate(int argc, const char **argv);
int main_evalmix(int argc, const char **argv);

void
print_help() {
  static const string sep = "  ";
  cerr << "Program: " << PROGRAM_NAME << "\n";
  cerr << "Version: " << PROGRAM_VERSION << "\n";
  cerr << "Usage: " << PROGRAM_NAME << " <command> [options]\n";
  cerr << "Commands:\n";
  cerr << sep+sep << "fit:           fit an exponential-gaussian mixture to a sample by EM\n";
  cerr << sep+sep << "eval:          density and cdf of a fitted mixture at given points\n";
  cerr << sep+sep << "simulate:      draw a sample from an exponential-gaussian mixture\n";
  cerr << "\n";
}

int
main(int argc, const char **argv) {
  int ret = 0;
  if (argc < 2) { print_help(); return ret; }

  if (strcmp(argv[1], "fit") == 0) ret = main_fitmix(argc - 1, argv + 1);
  else if (strcmp(argv[1], "eval") == 0) ret = main_evalmix(argc - 1, argv + 1);
  else if (strcmp(argv[1], "simulate") == 0) ret = main_simulate(argc - 1, argv + 1);
  else {
    cerr << "command not found: " << argv[1] << endl;
    ret = 1;
  }
  return ret;
}
