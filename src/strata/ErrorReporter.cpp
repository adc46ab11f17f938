#include "strata/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace strata {

ErrorReporter::ErrorReporter(): m_suppress(false) {}

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(ErrorKind kind, const std::string& subject) {
    std::string message;
    switch (kind) {
    case kArityMismatch:
        message = fmt::format("wrong number of arguments or results in call to '{}'", subject);
        break;
    case kInternalError:
        message = fmt::format("internal error: {}", subject);
        break;
    case kUndefinedFunction:
        message = fmt::format("undefined function '{}'", subject);
        break;
    case kUndefinedVariable:
        message = fmt::format("undefined variable '{}'", subject);
        break;
    }

    if (!m_suppress) {
        spdlog::error(message);
    }
    m_errors.emplace_back(Error{kind, subject, std::move(message)});
}

// static
const char* ErrorReporter::kindName(ErrorKind kind) {
    switch (kind) {
    case kArityMismatch:
        return "ArityMismatch";
    case kInternalError:
        return "InternalError";
    case kUndefinedFunction:
        return "UndefinedFunction";
    case kUndefinedVariable:
        return "UndefinedVariable";
    }
    return "Unknown";
}

} // namespace strata
