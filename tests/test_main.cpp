// Catch2WithMain provides main(); this file holds suite-wide hooks

#include <catch2/catch_test_macros.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>

#include "processing/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"

namespace
{

// Reporter queue and tracing switches are process-wide; every test starts from a clean slate
class ProcessStateReset : public Catch::EventListenerBase
{
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testCaseStarting(const Catch::TestCaseInfo&) override
    {
        utils::ErrorReporter::ClearErrors();
        processing::Diagnostics::SetVerbose(false);
        processing::Diagnostics::SetMaxPreview(160);
    }
};

} // namespace

CATCH_REGISTER_LISTENER(ProcessStateReset)

TEST_CASE("Framework smoke test", "[smoke]")
{
    REQUIRE(utils::ErrorReporter::HasPendingErrors() == false);
}
