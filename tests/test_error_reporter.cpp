#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <string>

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::ErrorSeverity;

TEST_CASE("ErrorReporter - queues reports until they are collected", "[error_reporter]")
{
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring bad key", "render.colors");
    ErrorReporter::ReportError(ErrorCategory::Io, "Cannot open input file", "missing.txt");
    REQUIRE(ErrorReporter::HasPendingErrors());

    const auto last = ErrorReporter::GetLastError();
    REQUIRE(last.category == ErrorCategory::Io);
    REQUIRE(last.severity == ErrorSeverity::Error);
    REQUIRE(last.technical_details == "missing.txt");
    REQUIRE_FALSE(last.is_fatal);

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].user_message == "Ignoring bad key");
    REQUIRE(reports[0].severity == ErrorSeverity::Warning);
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - fatal reports are flagged", "[error_reporter]")
{
    ErrorReporter::ReportFatal(ErrorCategory::Initialization, "Cannot start");
    REQUIRE(ErrorReporter::GetLastError().is_fatal);
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::GetLastError().user_message.empty());
}

TEST_CASE("ErrorReporter - queue keeps only the newest reports", "[error_reporter]")
{
    for (int i = 0; i < 150; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Normalization, "warning " + std::to_string(i));

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 100);
    REQUIRE(reports.front().user_message == "warning 50");
    REQUIRE(reports.back().user_message == "warning 149");
}

TEST_CASE("ErrorReporter - readable names", "[error_reporter]")
{
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Io) == "I/O");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Alignment) == "Alignment");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Warning) == "Warning");
    REQUIRE(ErrorReporter::GetTimestamp().size() == 19);
}
