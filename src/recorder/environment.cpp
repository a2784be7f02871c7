#include "testrec/recorder/environment.hpp"

#include "testrec/common.hpp"
#include "testrec/log/log.hpp"

#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <sys/utsname.h>
#endif

namespace testrec::recorder {

auto library_version() -> std::string {
    return std::string("testrec ") + VERSION;
}

auto compiler_version() -> std::string {
    std::ostringstream oss;
#if defined(__clang__)
    oss << "Clang " << __clang_major__ << "." << __clang_minor__ << "." << __clang_patchlevel__;
#elif defined(__GNUC__)
    oss << "GCC " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__;
#elif defined(_MSC_VER)
    oss << "MSVC " << _MSC_FULL_VER;
#else
    oss << "unknown compiler";
#endif

    long standard = __cplusplus;
#ifdef _MSVC_LANG
    standard = _MSVC_LANG;
#endif
    if (standard > 202002L) {
        oss << " (C++23)";
    } else if (standard >= 202002L) {
        oss << " (C++20)";
    } else {
        oss << " (C++" << standard << ")";
    }
    return oss.str();
}

auto operating_system_version() -> std::string {
#ifdef _WIN32
    return "Windows";
#else
    struct utsname info;
    if (uname(&info) != 0) {
        TESTREC_LOG_DEBUG("environment", "uname failed: " << std::strerror(errno));
#if defined(__APPLE__)
        return "macOS";
#else
        return "Linux";
#endif
    }
    std::ostringstream oss;
    oss << info.sysname << " " << info.release << " " << info.machine;
    return oss.str();
#endif
}

} // namespace testrec::recorder
