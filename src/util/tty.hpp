#pragma once

#include <cstdint>

namespace gogrep {

const uint16_t TermColorSupport_None      = 0;
const uint16_t TermColorSupport_Ansi4bit  = 1;  // 16 color palette
const uint16_t TermColorSupport_Ansi24bit = 4;  // 24 bit true color

// Color support of stdout; none when stdout isn't a terminal.
uint16_t
tty_get_capabilities();

}  // namespace gogrep
