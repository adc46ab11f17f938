#include "strata/ErrorReporter.hpp"

#include "doctest/doctest.h"

namespace strata {

TEST_CASE("ErrorReporter") {
    SUBCASE("starts empty") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK_EQ(er.errorCount(), 0);
    }
    SUBCASE("records kind, subject and message") {
        ErrorReporter er(true);
        er.addError(ErrorReporter::kUndefinedVariable, "x");
        er.addError(ErrorReporter::kUndefinedFunction, "f");
        CHECK(!er.ok());
        REQUIRE_EQ(er.errorCount(), 2);
        CHECK_EQ(er.errors()[0].kind, ErrorReporter::kUndefinedVariable);
        CHECK_EQ(er.errors()[0].subject, "x");
        CHECK_EQ(er.errors()[0].message, "undefined variable 'x'");
        CHECK_EQ(er.errors()[1].kind, ErrorReporter::kUndefinedFunction);
        CHECK_EQ(er.errors()[1].message, "undefined function 'f'");
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addError(ErrorReporter::kArityMismatch, "g");
        CHECK_EQ(er.errors()[0].message, "wrong number of arguments or results in call to 'g'");
        er.clear();
        CHECK(er.ok());
    }
    SUBCASE("kind names") {
        CHECK_EQ(std::string(ErrorReporter::kindName(ErrorReporter::kArityMismatch)), "ArityMismatch");
        CHECK_EQ(std::string(ErrorReporter::kindName(ErrorReporter::kInternalError)), "InternalError");
        CHECK_EQ(std::string(ErrorReporter::kindName(ErrorReporter::kUndefinedFunction)), "UndefinedFunction");
        CHECK_EQ(std::string(ErrorReporter::kindName(ErrorReporter::kUndefinedVariable)), "UndefinedVariable");
    }
}

} // namespace strata
