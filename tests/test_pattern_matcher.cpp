#include "pattern_matcher.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

std::vector<sorter::rule_def> sample_rules() {
    return {
        {R"(.*invoice.*\.pdf$)", "Documents/Finance/Invoices"},
        {R"(\.pdf$)",             "Documents"},
        {R"(^IMG_\d+)",           "Photos"},
    };
}

} // namespace

TEST(pattern_matcher, first_matching_rule_wins) {
    sorter::pattern_matcher matcher(sample_rules());

    auto dest = matcher.match("project_invoice_2024.pdf");
    ASSERT_TRUE(dest.has_value());
    EXPECT_EQ(*dest, "Documents/Finance/Invoices");

    dest = matcher.match("manual.pdf");
    ASSERT_TRUE(dest.has_value());
    EXPECT_EQ(*dest, "Documents");
}

TEST(pattern_matcher, search_is_unanchored) {
    sorter::pattern_matcher matcher(std::vector<sorter::rule_def>{{"report", "Reports"}});

    EXPECT_EQ(matcher.match("q3_report_final.docx"), "Reports");
    EXPECT_EQ(matcher.match("report"), "Reports");
}

TEST(pattern_matcher, declared_order_beats_specificity) {
    sorter::pattern_matcher matcher({
        {"\\.pdf$",      "Generic"},
        {"invoice.*pdf", "Invoices"},
    });

    EXPECT_EQ(matcher.match("invoice.pdf"), "Generic");
}

TEST(pattern_matcher, no_match_returns_nullopt) {
    sorter::pattern_matcher matcher(sample_rules());

    EXPECT_FALSE(matcher.match("notes.xyz").has_value());
    EXPECT_FALSE(matcher.match("").has_value());
}

TEST(pattern_matcher, empty_rule_list_never_matches) {
    sorter::pattern_matcher matcher({});

    EXPECT_EQ(matcher.size(), 0u);
    EXPECT_FALSE(matcher.match("anything.pdf").has_value());
}

TEST(pattern_matcher, invalid_pattern_throws_at_construction) {
    std::vector<sorter::rule_def> rules = {
        {"ok\\.txt$", "Text"},
        {"([unclosed", "Broken"},
    };

    try {
        sorter::pattern_matcher matcher(rules);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("([unclosed"), std::string::npos);
    }
}

TEST(pattern_matcher, patterns_are_case_sensitive) {
    sorter::pattern_matcher matcher(std::vector<sorter::rule_def>{{"\\.pdf$", "Documents"}});

    EXPECT_FALSE(matcher.match("SCAN.PDF").has_value());
    EXPECT_TRUE(matcher.match("scan.pdf").has_value());
}
