#include "jmatrix/core/DebugTrace.hpp"

namespace jmatrix::debug_trace {

thread_local std::string g_last_error;

void set_last_error(const std::string& value) {
    g_last_error = value;
}

void clear() {
    g_last_error.clear();
}

std::string get_last_error() {
    return g_last_error;
}

} // namespace jmatrix::debug_trace
