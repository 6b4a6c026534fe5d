/*
* Version information
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_VERSION_H_
#define KEYWRAP_VERSION_H_

#include <keywrap/types.h>
#include <string>

namespace Keywrap {

/**
* One line naming the library, its version and how it was built.
* No particular format should be assumed.
*/
KEYWRAP_PUBLIC_API(1, 0) std::string version_string();

/**
* version_string() as a pointer to static storage
*/
KEYWRAP_PUBLIC_API(1, 0) const char* version_cstr();

/**
* "MAJOR.MINOR.PATCH"
*/
KEYWRAP_PUBLIC_API(1, 0) std::string short_version_string();

/**
* Release date as YYYYMMDD, or 0 for an unreleased build
*/
KEYWRAP_PUBLIC_API(1, 0) uint32_t version_datestamp();

KEYWRAP_PUBLIC_API(1, 0) uint32_t version_major();
KEYWRAP_PUBLIC_API(1, 0) uint32_t version_minor();
KEYWRAP_PUBLIC_API(1, 0) uint32_t version_patch();

/**
* Compare the version of the library loaded at runtime with the one an
* application was compiled against (pass the KEYWRAP_VERSION_* macros).
* @return empty on an exact match, otherwise a warning message
*/
KEYWRAP_PUBLIC_API(1, 0) std::string runtime_version_check(uint32_t major, uint32_t minor, uint32_t patch);

}  // namespace Keywrap

#endif
