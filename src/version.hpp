#pragma once

// Build/version info.
//
// CMake defines FANCYSOKO_VERSION to the project version string.
// Without CMake it falls back to "dev".

#ifndef FANCYSOKO_VERSION
#define FANCYSOKO_VERSION "dev"
#endif

#ifndef FANCYSOKO_APPNAME
#define FANCYSOKO_APPNAME "FancySokoban"
#endif
