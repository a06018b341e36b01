#include "lexport/console.hpp"

#include "lexport/env.hpp"

#include <cstdio>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace lexport::console {

namespace {
    bool g_forced_off = false;

    bool IsTerminal(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            return isatty(fileno(stderr)) != 0;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_forced_off || env::IsEnabled("LEXPORT_NO_COLOR")) {
        return false;
    }
    return IsTerminal(os);
}

void SetColorsEnabled(bool enabled) {
    g_forced_off = !enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

Logger MakeLogger() {
    return [](LogLevel level, const std::string& message) {
        switch (level) {
            case LogLevel::Ok:
                std::cout << Green(message, std::cout) << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << Red(message, std::cerr) << std::endl;
                break;
            case LogLevel::Info:
                std::cout << message << std::endl;
                break;
        }
    };
}

}  // namespace lexport::console
