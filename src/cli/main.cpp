/*
* (C) 2009,2014,2015 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include "cli.h"

#include <keywrap/version.h>
#include <iostream>

int main(int argc, char* argv[]) {
   const std::string mismatch =
      Keywrap::runtime_version_check(KEYWRAP_VERSION_MAJOR, KEYWRAP_VERSION_MINOR, KEYWRAP_VERSION_PATCH);
   if(!mismatch.empty()) {
      std::cerr << mismatch;
   }

   const std::string arg1 = (argc >= 2) ? argv[1] : "help";
   const std::string cmd_name = (arg1 == "--help" || arg1 == "-h") ? "help" : arg1;

   auto cmd = Keywrap_CLI::Command::get_cmd(cmd_name);
   if(!cmd) {
      std::cerr << "Unknown command " << cmd_name << " (try --help)\n";
      return 1;
   }

   if(argc < 2) {
      std::cerr << cmd->help_text();
      return 1;
   }

   return cmd->run(std::vector<std::string>(argv + 2, argv + argc));
}
