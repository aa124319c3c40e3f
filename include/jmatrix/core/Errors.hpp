#pragma once

#include "jmatrix/core/ErrorCode.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace jmatrix {

// Base of every exception the library throws. An empty message falls back to
// the message of the attached error code.
class JMatrixError : public std::runtime_error {
public:
    JMatrixError(ErrorCode code, const std::string& message = "");

    virtual ~JMatrixError() = default;

    ErrorCode error_code() const noexcept { return code_; }

    virtual const char* type_name() const noexcept { return "jmatrix::JMatrixError"; }

    // "<type name> <<CODE>>: <message>"
    std::string describe() const;

private:
    ErrorCode code_;
};

// Non-positive or otherwise invalid dimensions, including dimension mismatches
// between operands.
class InvalidSizeError : public JMatrixError {
public:
    explicit InvalidSizeError(const std::string& message = "")
        : JMatrixError(ErrorCode::INVTYP, message) {}

    const char* type_name() const noexcept override { return "jmatrix::InvalidSizeError"; }
};

// Jagged or empty input arrays.
class InvalidTypeOrShapeError : public JMatrixError {
public:
    explicit InvalidTypeOrShapeError(const std::string& message = "")
        : JMatrixError(ErrorCode::INVTYP, message) {}

    const char* type_name() const noexcept override { return "jmatrix::InvalidTypeOrShapeError"; }
};

class NullContainerError : public JMatrixError {
public:
    explicit NullContainerError(const std::string& message = "")
        : JMatrixError(ErrorCode::NULLMT, message) {}

    const char* type_name() const noexcept override { return "jmatrix::NullContainerError"; }
};

class InvalidIndexError : public JMatrixError {
public:
    explicit InvalidIndexError(const std::string& message = "")
        : JMatrixError(ErrorCode::INVIDX, message) {}

    const char* type_name() const noexcept override { return "jmatrix::InvalidIndexError"; }
};

class UnknownCodeError : public JMatrixError {
public:
    explicit UnknownCodeError(const std::string& message = "")
        : JMatrixError(ErrorCode::UNKERR, message) {}

    const char* type_name() const noexcept override { return "jmatrix::UnknownCodeError"; }
};

// Writes the multi-line error report used by the auto-raise policy.
void report_error(std::ostream& os, const JMatrixError& error);

namespace detail {
// Records the error in the debug trace. Under RaiseMode::Auto this reports the
// error to stderr and exits the process with the error number instead of
// returning.
void on_raise(const JMatrixError& error);
}

// Single throw site for library errors; honours the configured raise mode.
template <typename E>
[[noreturn]] void raise_error(const E& error) {
    static_assert(std::is_base_of_v<JMatrixError, E>, "raise_error requires a JMatrixError subclass");
    detail::on_raise(error);
    throw error;
}

} // namespace jmatrix
