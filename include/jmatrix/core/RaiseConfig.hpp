#pragma once

#include <string>

namespace jmatrix {

// Manual: library errors are thrown to the caller.
// Auto: library errors are reported to stderr and the process exits with the
// error number.
enum class RaiseMode {
    Manual,
    Auto
};

// Accepts auto|a|yes|y and manual|m|no|n, case-insensitively.
// Throws std::invalid_argument for anything else.
RaiseMode parse_raise_mode(const std::string& text);

const char* raise_mode_name(RaiseMode mode);

// Programmatic override if one is set, else JMATRIX_AUTORAISE, else Manual.
RaiseMode get_raise_mode();
void set_raise_mode(RaiseMode mode);
void reset_raise_mode();

} // namespace jmatrix
