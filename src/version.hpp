#pragma once

// Build/version info.
//
// CMake defines PIPEQUEST_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef PIPEQUEST_VERSION
#define PIPEQUEST_VERSION "dev"
#endif

#ifndef PIPEQUEST_APPNAME
#define PIPEQUEST_APPNAME "PipeQuest"
#endif
