/*
    Copyright (C) 2020
    Author: Corbin Quick <qcorbin@hsph.harvard.edu>

    This file is a part of PAIRMETA.

    PAIRMETA is distributed "AS IS" in the hope that it will be
    useful, but WITHOUT ANY WARRANTY; without even the implied
    warranty of MERCHANTABILITY, NON-INFRINGEMENT, or FITNESS
    FOR A PARTICULAR PURPOSE.

    The above copyright notice and disclaimer of warranty must
    be included in all copies or substantial portions of PAIRMETA.
*/
#include <unordered_map>

#include "Main.hpp"

std::string help_string =
  "\n"
  "  PAIRMETA: Gene-pair meta-analysis aggregation engine\n"
  "\n"
  "  Usage and options:\n"
  "     ./pairmeta [mode] --help       Print help menu for [mode].\n"
  "\n"
  "  Aggregation modes:\n"
  "     ./pairmeta update {OPTIONS}    Fold one or more studies'\n"
  "                                     component estimates into\n"
  "                                     the pooled store.\n"
  "\n"
  "     ./pairmeta verify {OPTIONS}    Replay every contribution\n"
  "                                     ledger and check stored\n"
  "                                     sums and pooled rows.\n"
  "\n"
  "  Query modes:\n"
  "     ./pairmeta top {OPTIONS}       Ranked gene pairs for one\n"
  "                                     disease and technology.\n"
  "\n"
  "     ./pairmeta review {OPTIONS}    Record a review verdict\n"
  "                                     for a gene pair.\n"
  "\n"
  "  Utility modes:\n"
  "     ./pairmeta combine {OPTIONS}   Stouffer combination of\n"
  "                                     p-values.\n"
  "\n";

// ------------------------------------
//  Main function (determine running mode)
// ------------------------------------

int main(int argc, char* argv[])
{

// ------------------------------------
//  Restore cursor on exit or interrupt
// ------------------------------------

  auto lam_kill =
    [] (int i) { restore_cursor(); std::cerr << "\nKilled.\n" << "\n"; exit(0); };

  signal(SIGINT, lam_kill);
  signal(SIGABRT, lam_kill);
  signal(SIGTERM, lam_kill);

#ifndef __APPLE__
  // This function is not implemented in OS X's stdlib.
	at_quick_exit (restore_cursor);
#endif
  atexit (restore_cursor);


// ------------------------------------
//  PAIRMETA main menu: Parse running mode.
// ------------------------------------

  std::unordered_map<std::string, mode_fun> map{
    {"update", update},
    {"top", top},
    {"review", review},
    {"combine", combine},
    {"verify", verify}
  };

  // Argument parsing using https://github.com/Taywee/args
  args::ArgumentParser p0("pairmeta: Gene-pair meta-analysis aggregation engine.", "");
  args::HelpFlag help0(p0, "help", "Display this help menu", {'h', "help"});

  p0.Prog(argv[0]);

  std::string mode_summary = "\nupdate: fold studies into the store.\n\ntop: ranked gene pairs.\n\nreview: record a review verdict.\n\ncombine: Stouffer combination.\n\nverify: check the store.\n\n";

  args::MapPositional<std::string, mode_fun> mode(p0, "mode", mode_summary, map);
  mode.KickOut(true);

  const std::vector<std::string> args(argv + 1, argv + argc);

  try {
    auto next = p0.ParseArgs(args);

    if (mode) {
      return args::get(mode)(argv[0], next, std::end(args));
    } else {
      std::cout << help_string;
    }
  }
  catch (args::Help) {
    std::cout << help_string;
    return 0;
  }
  catch (args::Error e) {
    std::cerr << "\nUnknown command line argument(s).\nPrinting help menu:\n" << std::endl;
    std::cerr << help_string;
    return 1;
  }
  return 0;
}
