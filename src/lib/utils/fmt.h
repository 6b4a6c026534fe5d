/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_UTIL_FMT_H_
#define KEYWRAP_UTIL_FMT_H_

#include <keywrap/types.h>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>

namespace Keywrap {

namespace fmt_detail {

inline void format_into(std::ostringstream& out, std::string_view format) {
   out << format;
}

template <typename T, typename... Ts>
void format_into(std::ostringstream& out, std::string_view format, const T& arg, const Ts&... rest) {
   const size_t marker = format.find("{}");
   if(marker == std::string_view::npos) {
      out << format;
      return;
   }
   out << format.substr(0, marker) << arg;
   format_into(out, format.substr(marker + 2), rest...);
}

}  // namespace fmt_detail

/**
* Replace each "{}" in format with the next argument. There are no
* escapes or format flags; surplus arguments are ignored.
*/
template <typename... T>
std::string fmt(std::string_view format, const T&... args) {
   std::ostringstream out;
   out.imbue(std::locale::classic());
   fmt_detail::format_into(out, format, args...);
   return out.str();
}

}  // namespace Keywrap

#endif
