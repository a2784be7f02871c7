#include "testrec/terminal.hpp"

#include <cstdlib>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define TESTREC_ISATTY(fd) _isatty(fd)
#define TESTREC_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define TESTREC_ISATTY(fd) isatty(fd)
#define TESTREC_FILENO(f) fileno(f)
#endif

namespace testrec {

std::string get_env(const char* name) {
#ifdef _WIN32
    std::string value;
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
#endif
}

bool is_terminal(std::FILE* stream) {
    if (!stream)
        return false;
    return TESTREC_ISATTY(TESTREC_FILENO(stream)) != 0;
}

bool terminal_supports_colors(std::FILE* stream) {
#ifdef _WIN32
    HANDLE handle = GetStdHandle(stream == stderr ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE)
        return false;

    DWORD mode = 0;
    if (!GetConsoleMode(handle, &mode))
        return false;

    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(handle, mode))
        return true;

    return is_terminal(stream);
#else
    if (!is_terminal(stream))
        return false;

    std::string term = get_env("TERM");
    return !term.empty() && term != "dumb";
#endif
}

bool terminal_supports_256_colors() {
    std::string term = get_env("TERM");
    if (term.find("256color") != std::string::npos)
        return true;

    std::string colorterm = get_env("COLORTERM");
    return colorterm == "truecolor" || colorterm == "24bit";
}

} // namespace testrec
