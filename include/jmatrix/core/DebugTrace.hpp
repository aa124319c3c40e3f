#pragma once

#include <string>

namespace jmatrix::debug_trace {

// Test-only hook recording the canonical code ("NULLMT[203]") of the last
// error passed through raise_error().
// Stored as a thread_local string so concurrent callers don't clobber each other.
void set_last_error(const std::string& value);
void clear();
std::string get_last_error();

} // namespace jmatrix::debug_trace
