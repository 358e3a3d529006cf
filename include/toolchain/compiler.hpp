#pragma once

#include <string_view>

namespace pawup::toolchain {

#if defined(_WIN32)
#  if defined(_WIN64)
constexpr std::string_view COMPILER_EXE = "spcomp64.exe";
#  else
constexpr std::string_view COMPILER_EXE = "spcomp.exe";
#  endif
#else
constexpr std::string_view COMPILER_EXE = sizeof(void*) == 8 ? "spcomp64" : "spcomp";
#endif

// Target suffix used by the remote archives for this platform.
#if defined(_WIN32)
constexpr std::string_view PLATFORM_TARGET = "windows";
#elif defined(__APPLE__)
constexpr std::string_view PLATFORM_TARGET = "mac";
#else
constexpr std::string_view PLATFORM_TARGET = "linux";
#endif

inline bool isCompiler(const std::string_view fileName) { return fileName == COMPILER_EXE; }

}
