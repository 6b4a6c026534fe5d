/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/exceptn.h>

#include <keywrap/internal/fmt.h>

namespace Keywrap {

Exception::Exception(std::string_view prefix, std::string_view msg) : m_msg(fmt("{} {}", prefix, msg)) {}

Invalid_Key_Length::Invalid_Key_Length(std::string_view name, size_t length) :
      Invalid_Argument(fmt("{} cannot accept a key of length {}", name, length)) {}

Invalid_Data_Length::Invalid_Data_Length(std::string_view algo, size_t length) :
      Invalid_Argument(fmt("{} cannot process an input of length {}", algo, length)) {}

Buffer_Too_Small::Buffer_Too_Small(std::string_view algo, size_t required, size_t provided) :
      Invalid_Argument(fmt("{} needs {} bytes of output space, got {}", algo, required, provided)),
      m_required(required) {}

Key_Not_Set::Key_Not_Set(std::string_view algo) : Invalid_State(fmt("Key not set in {}", algo)) {}

Lookup_Error::Lookup_Error(std::string_view type, std::string_view algo, std::string_view provider) :
      Exception(provider.empty() ? fmt("Unavailable {} {}", type, algo)
                                 : fmt("Unavailable {} {} for provider {}", type, algo, provider)) {}

}  // namespace Keywrap
