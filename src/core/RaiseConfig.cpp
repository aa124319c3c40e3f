#include "jmatrix/core/RaiseConfig.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace jmatrix {

namespace {

constexpr const char* RAISE_ENV_NAME = "JMATRIX_AUTORAISE";

// -1 means "no override"; otherwise the RaiseMode value.
std::atomic<int> g_raise_mode_override{-1};
std::atomic<bool> g_warned_bad_env{false};

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

RaiseMode raise_mode_from_env() {
    const char* env = std::getenv(RAISE_ENV_NAME);
    if (!env || *env == '\0') {
        return RaiseMode::Manual;
    }
    try {
        return parse_raise_mode(env);
    } catch (const std::invalid_argument& e) {
        if (!g_warned_bad_env.exchange(true)) {
            std::cerr << "[JMatrix] Warning: " << e.what() << ". Defaulting to manual." << std::endl;
        }
        return RaiseMode::Manual;
    }
}

}

RaiseMode parse_raise_mode(const std::string& text) {
    const std::string s = to_lower(text);
    if (s == "auto" || s == "a" || s == "yes" || s == "y") return RaiseMode::Auto;
    if (s == "manual" || s == "m" || s == "no" || s == "n") return RaiseMode::Manual;
    throw std::invalid_argument(std::string("Unknown value of '") + RAISE_ENV_NAME + "': " + text);
}

const char* raise_mode_name(RaiseMode mode) {
    switch (mode) {
        case RaiseMode::Auto: return "auto";
        case RaiseMode::Manual: return "manual";
        default: return "manual";
    }
}

RaiseMode get_raise_mode() {
    const int override_mode = g_raise_mode_override.load();
    if (override_mode >= 0) {
        return static_cast<RaiseMode>(override_mode);
    }
    return raise_mode_from_env();
}

void set_raise_mode(RaiseMode mode) {
    g_raise_mode_override.store(static_cast<int>(mode));
}

void reset_raise_mode() {
    g_raise_mode_override.store(-1);
}

} // namespace jmatrix
