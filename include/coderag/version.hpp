/*
 * Version macros. The build system defines CODERAG_VERSION_* from the
 * project() version; the defaults below apply when it does not.
 */

#pragma once

#ifndef CODERAG_VERSION_MAJOR
#define CODERAG_VERSION_MAJOR 0
#endif

#ifndef CODERAG_VERSION_MINOR
#define CODERAG_VERSION_MINOR 1
#endif

#ifndef CODERAG_VERSION_PATCH
#define CODERAG_VERSION_PATCH 0
#endif

#ifndef CODERAG_VERSION_STRING
#define CODERAG_VERSION_STRING "0.1.0+dev"
#endif

#if defined(__cplusplus)
namespace coderag::version {
constexpr int major_v = CODERAG_VERSION_MAJOR;
constexpr int minor_v = CODERAG_VERSION_MINOR;
constexpr int patch_v = CODERAG_VERSION_PATCH;
constexpr const char* string_v = CODERAG_VERSION_STRING;
} // namespace coderag::version
#endif
