/*
* (C) 2015 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_CLI_H_
#define KEYWRAP_CLI_H_

#include "cli_exceptions.h"
#include <keywrap/secmem.h>
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace Keywrap_CLI {

/**
* A subcommand of the keywrap tool.
*
* The spec string names the command and then lists what it accepts:
*
*    cmd_name --flag --opt= --opt2=default arg1 arg2
*
* Words starting with -- and carrying no '=' are flags. Those with an
* '=' are options, whose default is the text after it. Everything else
* is a required positional argument. Every command also accepts --help,
* --verbose and --output=<file>.
*/
class Command {
   public:
      static std::unique_ptr<Command> get_cmd(const std::string& name);

      static std::vector<std::string> registered_cmds();

      explicit Command(const std::string& cmd_spec);

      virtual ~Command();

      /**
      * Parse params and run the command
      * @return 0 on success, 1 on a usage error, 2 if the command failed
      */
      int run(const std::vector<std::string>& params);

      virtual std::string group() const = 0;

      virtual std::string description() const = 0;

      virtual std::string help_text() const;

      std::string cmd_name() const;

   protected:
      virtual void go() = 0;

      std::ostream& output();

      std::ostream& error_output();

      bool verbose() const { return flag_set("verbose"); }

      bool flag_set(const std::string& flag_name) const;

      std::string get_arg(const std::string& name) const;

      /*
      * Decode a hex argument, or throw CLI_Usage_Error
      */
      Keywrap::secure_vector<uint8_t> get_hex_arg(const std::string& name) const;

   private:
      void parse_args(const std::vector<std::string>& params);

      typedef std::function<std::unique_ptr<Command>()> cmd_maker_fn;
      static std::map<std::string, cmd_maker_fn>& global_registry();

      std::string m_spec;
      std::vector<std::string> m_positional_names;
      std::set<std::string> m_known_flags;
      std::map<std::string, std::string> m_option_defaults;

      std::map<std::string, std::string> m_values;
      std::set<std::string> m_flags;
      std::unique_ptr<std::ostream> m_output_file;

   public:
      class Registration final {
         public:
            Registration(const std::string& name, const cmd_maker_fn& maker_fn);
      };
};

#define KEYWRAP_REGISTER_COMMAND(name, CLI_Class)                 \
   const Keywrap_CLI::Command::Registration reg_cmd_##CLI_Class( \
      name, []() -> std::unique_ptr<Keywrap_CLI::Command> { return std::make_unique<CLI_Class>(); })

}  // namespace Keywrap_CLI

#endif
