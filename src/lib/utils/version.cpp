/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/version.h>

#include <keywrap/internal/fmt.h>
#include <string_view>

namespace Keywrap {

namespace {

std::string full_version() {
   std::string s = fmt("Keywrap {} ({}", KEYWRAP_SHORT_VERSION_STRING, KEYWRAP_VERSION_RELEASE_TYPE);

   if(KEYWRAP_VERSION_DATESTAMP != 0) {
      s += fmt(", dated {}", KEYWRAP_VERSION_DATESTAMP);
   }

   const std::string_view rev = KEYWRAP_VERSION_VC_REVISION;
   if(!rev.empty()) {
      s += fmt(", revision {}", rev);
   }

   const std::string_view dist = KEYWRAP_DISTRIBUTION_INFO;
   if(!dist.empty()) {
      s += fmt(", distribution {}", dist);
   }

   return s + ")";
}

}  // namespace

const char* version_cstr() {
   static const std::string full = full_version();
   return full.c_str();
}

std::string version_string() {
   return version_cstr();
}

std::string short_version_string() {
   return KEYWRAP_SHORT_VERSION_STRING;
}

uint32_t version_datestamp() {
   return KEYWRAP_VERSION_DATESTAMP;
}

uint32_t version_major() {
   return KEYWRAP_VERSION_MAJOR;
}

uint32_t version_minor() {
   return KEYWRAP_VERSION_MINOR;
}

uint32_t version_patch() {
   return KEYWRAP_VERSION_PATCH;
}

std::string runtime_version_check(uint32_t major, uint32_t minor, uint32_t patch) {
   if(major == version_major() && minor == version_minor() && patch == version_patch()) {
      return "";
   }
   return fmt("Warning: this is Keywrap {}, but the application was built against {}.{}.{}\n",
              KEYWRAP_SHORT_VERSION_STRING,
              major,
              minor,
              patch);
}

}  // namespace Keywrap
