// =============================================================================
// Terminal Report Tests
// =============================================================================

#include <gtest/gtest.h>
#include "strmatch/report.hpp"
#include "strmatch/validator.hpp"
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

using namespace strmatch;

namespace {

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // anonymous namespace

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        request_ = std::make_unique<MatchRequest>(validate("AAAA", "AA"));
        comparison_ = run_comparison(*request_);
    }

    std::unique_ptr<MatchRequest> request_;
    Comparison comparison_;
};

TEST_F(ReportTest, FormatPositions) {
    EXPECT_EQ(format_positions({}), "None");
    EXPECT_EQ(format_positions({10}), "[10]");
    EXPECT_EQ(format_positions({0, 1, 2}), "[0, 1, 2]");
}

TEST_F(ReportTest, OverviewListsMatches) {
    std::ostringstream os;
    write_overview(os, *request_, comparison_);
    const std::string out = os.str();
    EXPECT_NE(out.find("Text length (n):     4"), std::string::npos);
    EXPECT_NE(out.find("Pattern length (m):  2"), std::string::npos);
    EXPECT_NE(out.find("Naive matches:       [0, 1, 2]"), std::string::npos);
    EXPECT_NE(out.find("Rabin-Karp matches:  [0, 1, 2]"), std::string::npos);
    EXPECT_NE(out.find("Results agree:       yes"), std::string::npos);
}

TEST_F(ReportTest, StepTableHasOneRowPerStep) {
    std::ostringstream naive_os;
    write_step_table(naive_os, comparison_.naive);
    // section line + header + 3 rows
    EXPECT_EQ(count_occurrences(naive_os.str(), "\n"), 1u + 1u + 1u + 3u);
    EXPECT_EQ(naive_os.str().find("phase"), std::string::npos);

    std::ostringstream rk_os;
    write_step_table(rk_os, comparison_.rabin_karp);
    // init + 3 checks + 2 rolls
    EXPECT_EQ(count_occurrences(rk_os.str(), "\n"), 1u + 1u + 1u + 6u);
    EXPECT_NE(rk_os.str().find("phase"), std::string::npos);
    EXPECT_EQ(count_occurrences(rk_os.str(), "roll"), 2u);
    EXPECT_EQ(count_occurrences(rk_os.str(), "init"), 1u);
}

TEST_F(ReportTest, DetailsAreCapped) {
    std::ostringstream os;
    write_details(os, comparison_.rabin_karp, 2);
    const std::string out = os.str();
    EXPECT_EQ(count_occurrences(out, "Index "), 2u);
    EXPECT_NE(out.find("initial p_hash="), std::string::npos);
    EXPECT_NE(out.find("... 4 more steps not shown"), std::string::npos);
}

TEST_F(ReportTest, FullReportIncludesDetailsOnRequest) {
    std::ostringstream plain;
    write_report(plain, *request_, comparison_);
    EXPECT_EQ(plain.str().find("Detailed Iterations"), std::string::npos);
    EXPECT_NE(plain.str().find("Totals"), std::string::npos);
    EXPECT_NE(plain.str().find("Runtime share"), std::string::npos);

    ReportOptions options;
    options.show_details = true;
    std::ostringstream detailed;
    write_report(detailed, *request_, comparison_, options);
    EXPECT_EQ(count_occurrences(detailed.str(), "Detailed Iterations"), 2u);
    EXPECT_NE(detailed.str().find("t[0]='A' == p[0]='A'"), std::string::npos);
}

TEST_F(ReportTest, LeavesStreamFormattingUntouched) {
    std::ostringstream os;
    write_report(os, *request_, comparison_);
    os << "[" << 3.14159 << "|" << 42 << "|" << std::setw(5) << 7 << "]";
    const std::string out = os.str();
    EXPECT_EQ(out.substr(out.size() - 18), "[3.14159|42|    7]");
}

TEST_F(ReportTest, WritersRestoreCallerFormatting) {
    std::ostringstream os;
    os << std::scientific << std::setprecision(3) << std::setfill('*');

    write_step_table(os, comparison_.rabin_karp);
    write_totals(os, comparison_);
    EXPECT_NE(os.str().find("Runtime share: naive "), std::string::npos);

    EXPECT_TRUE(os.flags() & std::ios_base::scientific);
    EXPECT_FALSE(os.flags() & std::ios_base::left);
    EXPECT_EQ(os.precision(), 3);
    EXPECT_EQ(os.fill(), '*');
}
