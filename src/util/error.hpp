#pragma once

namespace gogrep {

// clang-format off
enum class ErrorKind {
    None,
    Tokenize,   // Wildcard syntax or Go lexical error in a pattern
    Compile,    // Pattern is not valid Go under any hypothesis
    Load,       // Corpus path, read, syntax or import resolution failure
};
// clang-format on

}  // namespace gogrep
