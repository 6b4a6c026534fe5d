/*
* Export annotations
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_API_ANNOTATIONS_H_
#define KEYWRAP_API_ANNOTATIONS_H_

#include <keywrap/build.h>

/**
* Marks a supported public symbol, first released in version maj.min
*/
#define KEYWRAP_PUBLIC_API(maj, min) KEYWRAP_DLL

/**
* Marks a symbol exported for the C API or the tests which applications
* should not rely on
*/
#define KEYWRAP_UNSTABLE_API KEYWRAP_DLL

#endif
