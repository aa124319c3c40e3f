#include "jmatrix/core/Errors.hpp"
#include "jmatrix/core/DebugTrace.hpp"
#include "jmatrix/core/RaiseConfig.hpp"

#include <cstdlib>
#include <iostream>

namespace jmatrix {

namespace {

std::string message_or_default(ErrorCode code, const std::string& message) {
    return message.empty() ? std::string(code.get_message()) : message;
}

}

JMatrixError::JMatrixError(ErrorCode code, const std::string& message)
    : std::runtime_error(message_or_default(code, message)), code_(code) {}

std::string JMatrixError::describe() const {
    return std::string(type_name()) + " <" + std::string(code_.get_code()) + ">: " + what();
}

void report_error(std::ostream& os, const JMatrixError& error) {
    const ErrorCode code = error.error_code();
    os << "\n/!\\ EXCEPTION\n"
       << ">>>>>>>>>>>>>\n"
       << error.describe() << "\n"
       << "\n[EXCEPTION INFO]\n"
       << "Type: " << error.type_name() << "\n"
       << "Code: " << code.to_string() << "\n"
       << "Message: " << error.what() << "\n";
}

namespace detail {

void on_raise(const JMatrixError& error) {
    debug_trace::set_last_error(error.error_code().to_string());

    if (get_raise_mode() == RaiseMode::Auto) {
        const int status = error.error_code().get_errno();
        report_error(std::cerr, error);
        std::cerr << "\n[JMatrix] Exited with error code: " << status << std::endl;
        std::exit(status);
    }
}

} // namespace detail

} // namespace jmatrix
