#include "tty.hpp"

#include <cstdlib>
#include <string>

#ifdef GOGREP_PLATFORM_POSIX
#include <unistd.h>
#endif

using namespace gogrep;

uint16_t
gogrep::tty_get_capabilities() {
#ifdef GOGREP_PLATFORM_POSIX
    // No colors when piping to less or redirecting to files.
    if (isatty(STDOUT_FILENO) == 0) {
        return TermColorSupport_None;
    }

    const char* term_var = getenv("TERM");
    if (term_var != nullptr && std::string(term_var) == "dumb") {
        return TermColorSupport_None;
    }

    uint16_t caps = TermColorSupport_Ansi4bit;

    // The COLORTERM variable is usually available to indicate 24bit color support.
    const char* colorterm_var = getenv("COLORTERM");
    if (colorterm_var != nullptr) {
        const std::string colorterm(colorterm_var);
        if (colorterm == "24bit" || colorterm == "truecolor") {
            caps |= TermColorSupport_Ansi24bit;
        }
    }
    return caps;
#else
    return TermColorSupport_None;
#endif
}
