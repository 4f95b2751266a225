#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter - Queue", "[utils][errors]") {
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Input, "Skipped candidate record", "record 3: missing 'text'");
    ErrorReporter::ReportError(ErrorCategory::Export, "Stage 'write-output' failed");
    ErrorReporter::ReportFatal(ErrorCategory::Configuration, "Logging unavailable");

    REQUIRE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Warning) == 3);
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Error) == 2);
    REQUIRE(ErrorReporter::GetLastError().isFatal());

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 3);
    REQUIRE(reports[0].category == ErrorCategory::Input);
    REQUIRE(reports[0].timestamp.back() == 'Z');
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - Bounded queue keeps the newest reports", "[utils][errors]") {
    ErrorReporter::ClearErrors();
    for (int i = 0; i < 150; ++i) {
        ErrorReporter::ReportWarning(ErrorCategory::Input, "report " + std::to_string(i));
    }

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 100);
    REQUIRE(reports.front().user_message == "report 50");
    REQUIRE(reports.back().user_message == "report 149");
}

TEST_CASE("ErrorReporter - Format", "[utils][errors]") {
    ErrorReport report;
    report.category = ErrorCategory::Input;
    report.severity = ErrorSeverity::Warning;
    report.user_message = "Skipped candidate record";
    report.technical_details = "record 3: missing 'text'";

    REQUIRE(ErrorReporter::Format(report) == "[Warning] [Input] Skipped candidate record: record 3: missing 'text'");

    report.technical_details.clear();
    REQUIRE(ErrorReporter::Format(report) == "[Warning] [Input] Skipped candidate record");
}
