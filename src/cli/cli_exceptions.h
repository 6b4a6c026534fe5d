/*
* (C) 2015 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_CLI_EXCEPTIONS_H_
#define KEYWRAP_CLI_EXCEPTIONS_H_

#include <stdexcept>
#include <string>

namespace Keywrap_CLI {

class CLI_Error : public std::runtime_error {
   public:
      explicit CLI_Error(const std::string& s) : std::runtime_error(s) {}
};

/**
* Bad command line; the command exits with status 1
*/
class CLI_Usage_Error final : public CLI_Error {
   public:
      explicit CLI_Usage_Error(const std::string& what) : CLI_Error(what) {}
};

class CLI_Error_Unsupported final : public CLI_Error {
   public:
      CLI_Error_Unsupported(const std::string& what, const std::string& algo) :
            CLI_Error(what + " is not available with " + algo) {}
};

}  // namespace Keywrap_CLI

#endif
