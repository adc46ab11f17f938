#ifndef SRC_STRATA_ERROR_REPORTER_HPP_
#define SRC_STRATA_ERROR_REPORTER_HPP_

#include <string>
#include <vector>

namespace strata {

// Collects the diagnostics of a compilation. Every error is fatal: the stage that reports it stops and returns
// nullptr, and so does every stage above it.
class ErrorReporter {
public:
    enum ErrorKind {
        kArityMismatch,
        kInternalError,
        kUndefinedFunction,
        kUndefinedVariable
    };

    struct Error {
        ErrorKind kind;
        // The offending variable or function name, or the message itself for internal errors.
        std::string subject;
        std::string message;
    };

    ErrorReporter();
    // If |suppress| is true errors are recorded but not logged, useful for tests that expect failures.
    explicit ErrorReporter(bool suppress);
    ~ErrorReporter();

    void addError(ErrorKind kind, const std::string& subject);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.empty(); }
    const std::vector<Error>& errors() const { return m_errors; }
    void clear() { m_errors.clear(); }

    static const char* kindName(ErrorKind kind);

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace strata

#endif // SRC_STRATA_ERROR_REPORTER_HPP_
