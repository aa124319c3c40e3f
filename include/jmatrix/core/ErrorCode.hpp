#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace jmatrix {

// Closed set of error identities. Each variant carries an error number, a
// mnemonic code and a message; the "JM###" string and the canonical
// "CODE[###]" text are derived from those.
class ErrorCode {
public:
    // NOTE: enumerator values are the public error numbers; do not renumber.
    enum Value : int32_t {
        INVIDX = 201,
        INVTYP = 202,
        NULLMT = 203,
        UNKERR = 400
    };

    constexpr ErrorCode(Value value) : value_(value) {}

    constexpr Value value() const { return value_; }

    int32_t get_errno() const { return static_cast<int32_t>(value_); }
    std::string get_errno_str() const;
    std::string_view get_code() const;
    std::string_view get_message() const;

    // "<code>[<errno>]", e.g. "INVIDX[201]".
    std::string to_string() const;

    static const std::array<ErrorCode, 4>& values();

    // Strict lookup by mnemonic. Throws UnknownCodeError if nothing matches.
    static ErrorCode from_code(std::string_view code);

    static std::optional<ErrorCode> from_errno(int64_t number);

    // Lookup keyed on whatever the caller has at hand: integers match by
    // error number, strings go through from_code() (and throw on an unknown
    // mnemonic). Null keys and any other key kind yield std::nullopt.
    template <typename Key>
    static std::optional<ErrorCode> value_of(const Key& key) {
        using K = std::decay_t<Key>;
        if constexpr (std::is_same_v<K, bool> || std::is_same_v<K, std::nullptr_t>) {
            return std::nullopt;
        } else if constexpr (std::is_integral_v<K>) {
            return from_errno(static_cast<int64_t>(key));
        } else if constexpr (std::is_pointer_v<Key> && std::is_convertible_v<const Key&, std::string_view>) {
            if (key == nullptr) return std::nullopt;
            return from_code(std::string_view(key));
        } else if constexpr (std::is_convertible_v<const Key&, std::string_view>) {
            return from_code(std::string_view(key));
        } else {
            return std::nullopt;
        }
    }

    bool operator==(const ErrorCode& other) const = default;

private:
    Value value_;
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

} // namespace jmatrix
