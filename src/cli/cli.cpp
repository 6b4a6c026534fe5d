/*
* (C) 2015,2017 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include "cli.h"

#include <keywrap/exceptn.h>
#include <keywrap/hex.h>
#include <fstream>
#include <iostream>
#include <sstream>

namespace Keywrap_CLI {

Command::Command(const std::string& cmd_spec) : m_spec(cmd_spec) {
   std::istringstream words(cmd_spec);
   std::string word;

   // the first word is the command name
   words >> word;

   while(words >> word) {
      if(word.size() > 2 && word.compare(0, 2, "--") == 0) {
         const auto eq = word.find('=');
         if(eq == std::string::npos) {
            m_known_flags.insert(word.substr(2));
         } else {
            m_option_defaults[word.substr(2, eq - 2)] = word.substr(eq + 1);
         }
      } else {
         m_positional_names.push_back(word);
      }
   }

   m_known_flags.insert("help");
   m_known_flags.insert("verbose");
   m_option_defaults["output"] = "";
}

Command::~Command() = default;

std::string Command::cmd_name() const {
   return m_spec.substr(0, m_spec.find(' '));
}

std::string Command::help_text() const {
   return "Usage: " + m_spec;
}

void Command::parse_args(const std::vector<std::string>& params) {
   std::vector<std::string> positional;

   for(const auto& param : params) {
      if(param.size() < 3 || param.compare(0, 2, "--") != 0) {
         positional.push_back(param);
         continue;
      }

      const auto eq = param.find('=');
      const std::string name = param.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);

      if(eq == std::string::npos) {
         if(!m_known_flags.contains(name)) {
            throw CLI_Usage_Error("Unknown flag --" + name);
         }
         m_flags.insert(name);
      } else {
         if(!m_option_defaults.contains(name)) {
            throw CLI_Usage_Error("Unknown option --" + name);
         }
         if(!m_values.emplace(name, param.substr(eq + 1)).second) {
            throw CLI_Usage_Error("Option --" + name + " given twice");
         }
      }
   }

   if(flag_set("help")) {
      return;
   }

   if(positional.size() != m_positional_names.size()) {
      throw CLI_Usage_Error("Invalid argument count, got " + std::to_string(positional.size()) + " expected " +
                            std::to_string(m_positional_names.size()));
   }

   for(size_t i = 0; i != positional.size(); ++i) {
      m_values[m_positional_names[i]] = positional[i];
   }

   for(const auto& [name, value] : m_option_defaults) {
      m_values.emplace(name, value);
   }
}

int Command::run(const std::vector<std::string>& params) {
   try {
      parse_args(params);

      if(flag_set("help")) {
         output() << help_text() << "\n";
         return 0;
      }

      const std::string output_file = get_arg("output");
      if(!output_file.empty()) {
         m_output_file = std::make_unique<std::ofstream>(output_file);
         if(!m_output_file->good()) {
            throw CLI_Error("Could not open " + output_file + " for writing");
         }
      }

      this->go();
      return 0;
   } catch(CLI_Usage_Error& e) {
      error_output() << "Usage error: " << e.what() << "\n" << help_text() << "\n";
      return 1;
   } catch(Keywrap::Invalid_Authentication_Tag& e) {
      error_output() << "Integrity check failed: " << e.what() << "\n";
      return 2;
   } catch(std::exception& e) {
      error_output() << "Error: " << e.what() << "\n";
      return 2;
   }
}

bool Command::flag_set(const std::string& flag_name) const {
   return m_flags.contains(flag_name);
}

std::string Command::get_arg(const std::string& name) const {
   auto i = m_values.find(name);
   if(i == m_values.end()) {
      throw CLI_Error("Command " + cmd_name() + " has no argument named " + name);
   }
   return i->second;
}

Keywrap::secure_vector<uint8_t> Command::get_hex_arg(const std::string& name) const {
   const std::string val = get_arg(name);

   try {
      return Keywrap::hex_decode_locked(val);
   } catch(Keywrap::Invalid_Argument& e) {
      throw CLI_Usage_Error("Argument " + name + " is not valid hex: " + e.what());
   }
}

std::ostream& Command::output() {
   if(m_output_file) {
      return *m_output_file;
   }
   return std::cout;
}

std::ostream& Command::error_output() {
   return std::cerr;
}

Command::Registration::Registration(const std::string& name, const Command::cmd_maker_fn& maker_fn) {
   if(!Command::global_registry().emplace(name, maker_fn).second) {
      throw CLI_Error("Duplicated registration of command " + name);
   }
}

//static
std::map<std::string, Command::cmd_maker_fn>& Command::global_registry() {
   static std::map<std::string, Command::cmd_maker_fn> g_cmds;
   return g_cmds;
}

//static
std::vector<std::string> Command::registered_cmds() {
   std::vector<std::string> cmds;
   for(const auto& [name, maker] : Command::global_registry()) {
      cmds.push_back(name);
   }
   return cmds;
}

//static
std::unique_ptr<Command> Command::get_cmd(const std::string& name) {
   const auto& reg = Command::global_registry();
   auto i = reg.find(name);
   return (i != reg.end()) ? i->second() : nullptr;
}

}  // namespace Keywrap_CLI
