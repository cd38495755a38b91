// tests/test_diagnostics.cpp
// @brief DiagnosticEngine counting and printed diagnostic format.
// @invariant Diagnostics print in reporting order.
// @ownership Test owns the engine and output streams.

#include "TestHarness.hpp"

#include "quill/support/diagnostics.hpp"
#include "quill/support/expected.hpp"

#include <sstream>
#include <string>

using quill::support::DiagnosticEngine;
using quill::support::Expected;
using quill::support::Severity;

TEST(Diagnostics, CountsBySeverity)
{
    DiagnosticEngine de;
    de.note("a.rs", "loaded 3 bytes");
    de.warn("quill.ini", "line 2: bad");
    de.report(quill::support::makeError("b.rs", "permission denied"));
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    ASSERT_EQ(de.diagnostics().size(), 3u);
    EXPECT_TRUE(de.diagnostics()[0].severity == Severity::Note);
}

TEST(Diagnostics, PrintFormat)
{
    DiagnosticEngine de;
    de.report(quill::support::makeError("x.rs", "boom"));
    de.note("", "plain note");
    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(), "x.rs: error: boom\nnote: plain note\n");
}

TEST(Diagnostics, ExpectedCarriesValueOrError)
{
    Expected<std::string> ok(std::string("bytes"));
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "bytes");

    Expected<std::string> bad(quill::support::makeError("p", "no such file"));
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().message, "no such file");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    EXPECT_EQ(std::string(quill::support::severityToString(Severity::Warning)), "warning");
}

int main(int argc, char **argv)
{
    quill_test::init(&argc, &argv);
    return quill_test::run_all_tests();
}
