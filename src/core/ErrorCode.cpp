#include "jmatrix/core/ErrorCode.hpp"
#include "jmatrix/core/Errors.hpp"

#include <algorithm>

namespace jmatrix {

namespace {

struct ErrorCodeInfo {
    ErrorCode::Value value;
    std::string_view code;
    std::string_view message;
};

constexpr std::array<ErrorCodeInfo, 4> ERROR_CODE_TABLE = {{
    {ErrorCode::INVIDX, "INVIDX", "Given index is out of bounds"},
    {ErrorCode::INVTYP, "INVTYP", "Matrix has invalid type of matrix"},
    {ErrorCode::NULLMT, "NULLMT", "Matrix is null"},
    {ErrorCode::UNKERR, "UNKERR", "Unknown error"},
}};

const ErrorCodeInfo& info_of(ErrorCode::Value value) {
    auto it = std::find_if(ERROR_CODE_TABLE.begin(), ERROR_CODE_TABLE.end(),
                           [value](const ErrorCodeInfo& info) { return info.value == value; });
    // Every enumerator has a table row, so only a corrupted value can miss.
    return it != ERROR_CODE_TABLE.end() ? *it : ERROR_CODE_TABLE.back();
}

}

std::string ErrorCode::get_errno_str() const {
    return "JM" + std::to_string(get_errno());
}

std::string_view ErrorCode::get_code() const {
    return info_of(value_).code;
}

std::string_view ErrorCode::get_message() const {
    return info_of(value_).message;
}

std::string ErrorCode::to_string() const {
    return std::string(get_code()) + "[" + std::to_string(get_errno()) + "]";
}

const std::array<ErrorCode, 4>& ErrorCode::values() {
    static const std::array<ErrorCode, 4> all = {
        ErrorCode(INVIDX), ErrorCode(INVTYP), ErrorCode(NULLMT), ErrorCode(UNKERR)};
    return all;
}

ErrorCode ErrorCode::from_code(std::string_view code) {
    for (const auto& info : ERROR_CODE_TABLE) {
        if (info.code == code) return ErrorCode(info.value);
    }
    raise_error(UnknownCodeError("No error code constant named '" + std::string(code) + "'"));
}

std::optional<ErrorCode> ErrorCode::from_errno(int64_t number) {
    for (const auto& info : ERROR_CODE_TABLE) {
        if (static_cast<int64_t>(info.value) == number) return ErrorCode(info.value);
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    return os << code.to_string();
}

} // namespace jmatrix
