/*
* (C) 2009,2010,2014,2015 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include "cli.h"

#include <keywrap/version.h>
#include <iomanip>
#include <sstream>
#include <utility>

namespace Keywrap_CLI {

class Print_Help final : public Command {
   public:
      Print_Help() : Command("help") {}

      std::string help_text() const override {
         std::ostringstream oss;

         oss << "Usage: keywrap <cmd> <cmd-options>\n"
             << "Every command accepts --help --verbose --output=\n"
             << "Keys, headers and wrapped values are hex\n";

         for(const auto& [group, title] : {std::pair<std::string, std::string>{"keywrap", "Key wrapping"},
                                          std::pair<std::string, std::string>{"info", "Informational"}}) {
            oss << "\n" << title << ":\n";

            for(const auto& name : Command::registered_cmds()) {
               auto cmd = Command::get_cmd(name);
               if(cmd && cmd->group() == group) {
                  oss << "   " << std::setw(16) << std::left << cmd->cmd_name() << "   " << cmd->description() << "\n";
               }
            }
         }

         return oss.str();
      }

      std::string group() const override { return ""; }

      std::string description() const override { return "Prints a help string"; }

      void go() override { output() << help_text(); }
};

KEYWRAP_REGISTER_COMMAND("help", Print_Help);

class Version_Info final : public Command {
   public:
      Version_Info() : Command("version --full") {}

      std::string group() const override { return "info"; }

      std::string description() const override { return "Print the library version"; }

      void go() override {
         output() << (flag_set("full") ? Keywrap::version_string() : Keywrap::short_version_string()) << "\n";
      }
};

KEYWRAP_REGISTER_COMMAND("version", Version_Info);

}  // namespace Keywrap_CLI
