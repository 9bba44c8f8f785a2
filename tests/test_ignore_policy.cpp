#include "ignore_policy.hpp"
#include <gtest/gtest.h>

using sorter::should_ignore;

TEST(ignore_policy, hidden_marker_always_ignored) {
    sorter::ignore_spec empty;
    EXPECT_TRUE(should_ignore("entropy/._report.pdf", empty));
    EXPECT_TRUE(should_ignore("._", empty));

    sorter::ignore_spec full;
    full.use_os_defaults = true;
    full.exact_names = {"other"};
    EXPECT_TRUE(should_ignore("/tmp/root/._x", full));
}

TEST(ignore_policy, marker_only_counts_at_start_of_base_name) {
    sorter::ignore_spec empty;
    EXPECT_FALSE(should_ignore("entropy/report._pdf", empty));
    EXPECT_FALSE(should_ignore("entropy/_report.pdf", empty));
}

TEST(ignore_policy, os_defaults_only_when_enabled) {
    sorter::ignore_spec spec;
    EXPECT_FALSE(should_ignore("entropy/.DS_Store", spec));
    EXPECT_FALSE(should_ignore("entropy/Thumbs.db", spec));

    spec.use_os_defaults = true;
    EXPECT_TRUE(should_ignore("entropy/.DS_Store", spec));
    EXPECT_TRUE(should_ignore("entropy/Thumbs.db", spec));
    EXPECT_TRUE(should_ignore("entropy/desktop.ini", spec));
    EXPECT_FALSE(should_ignore("entropy/thumbs.db.bak", spec));
}

TEST(ignore_policy, exact_names_match_base_name_only) {
    sorter::ignore_spec spec;
    spec.exact_names = {"keep.me"};

    EXPECT_TRUE(should_ignore("entropy/keep.me", spec));
    EXPECT_FALSE(should_ignore("entropy/keep.me.too", spec));
    EXPECT_FALSE(should_ignore("entropy/Keep.me", spec));
}

TEST(ignore_policy, extensions_are_case_insensitive) {
    sorter::ignore_spec spec;
    spec.extensions = {".log"};

    EXPECT_TRUE(should_ignore("entropy/a.LOG", spec));
    EXPECT_TRUE(should_ignore("entropy/b.log", spec));
    EXPECT_FALSE(should_ignore("entropy/c.logs", spec));

    spec.extensions = {".TMP"};
    EXPECT_TRUE(should_ignore("entropy/download.tmp", spec));
}

TEST(ignore_policy, extension_is_last_suffix) {
    sorter::ignore_spec spec;
    spec.extensions = {".gz"};

    EXPECT_TRUE(should_ignore("entropy/backup.tar.gz", spec));
    EXPECT_FALSE(should_ignore("entropy/backup.gz.tar", spec));
}

TEST(ignore_policy, path_substring_matches_anywhere) {
    sorter::ignore_spec spec;
    spec.path_substrings = {"node_modules"};

    EXPECT_TRUE(should_ignore("entropy/node_modules/pkg.json", spec));
    EXPECT_TRUE(should_ignore("entropy/my_node_modules_backup.zip", spec));
    EXPECT_FALSE(should_ignore("entropy/modules.zip", spec));
}

TEST(ignore_policy, default_spec_ignores_nothing_else) {
    sorter::ignore_spec spec;
    EXPECT_FALSE(should_ignore("entropy/project_invoice_2024.pdf", spec));
    EXPECT_FALSE(should_ignore("entropy/.bashrc", spec));
}
