#include "suggestion_context.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using test_support::temp_dir;

TEST(suggestion_context, metadata_reports_extension_and_size) {
    temp_dir dir;
    auto file = dir.write("scan.pdf", "12345");

    EXPECT_EQ(sorter::file_metadata(file), "Extension: .pdf, Size: 5 bytes");
}

TEST(suggestion_context, metadata_of_missing_file_is_empty) {
    temp_dir dir;
    EXPECT_EQ(sorter::file_metadata(dir.path() / "gone.txt"), "");
}

TEST(suggestion_context, folder_snapshot_lists_nested_directories) {
    temp_dir dir;
    std::filesystem::create_directories(dir.path() / "Work" / "Reports");
    std::filesystem::create_directories(dir.path() / "Photos");
    dir.write("loose.txt");
    dir.write("Work/file.txt");

    EXPECT_EQ(sorter::folder_snapshot(dir.path()), "Photos\nWork\nWork/Reports\n");
}

TEST(suggestion_context, folder_snapshot_reflects_current_tree) {
    temp_dir dir;
    EXPECT_EQ(sorter::folder_snapshot(dir.path()), "");

    std::filesystem::create_directories(dir.path() / "Unsorted");
    EXPECT_EQ(sorter::folder_snapshot(dir.path()), "Unsorted\n");
}

TEST(suggestion_context, folder_snapshot_of_missing_root_is_empty) {
    temp_dir dir;
    EXPECT_EQ(sorter::folder_snapshot(dir.path() / "nope"), "");
}

TEST(suggestion_context, prompt_contains_all_parts) {
    sorter::prompt_inputs in;
    in.instructions = "Sort my files.";
    in.knowledge_base = "Taxes go to Finance.";
    in.filename = "w2.pdf";
    in.metadata = "Extension: .pdf, Size: 10 bytes";
    in.folder_snapshot = "Finance\n";
    in.preserve_structure = false;

    auto prompt = sorter::build_prompt(in);
    EXPECT_EQ(prompt.rfind("Sort my files.", 0), 0u);
    EXPECT_NE(prompt.find("Knowledge base:\nTaxes go to Finance."), std::string::npos);
    EXPECT_NE(prompt.find("Filename: w2.pdf"), std::string::npos);
    EXPECT_NE(prompt.find("Metadata: Extension: .pdf, Size: 10 bytes"), std::string::npos);
    EXPECT_NE(prompt.find("Existing folder structure: Finance\n"), std::string::npos);
    EXPECT_NE(prompt.find("Respond only with a folder path."), std::string::npos);
    EXPECT_NE(prompt.find("You may suggest new folders"), std::string::npos);
}

TEST(suggestion_context, prompt_forbids_new_folders_when_preserving) {
    sorter::prompt_inputs in;
    in.filename = "a.txt";
    in.preserve_structure = true;

    auto prompt = sorter::build_prompt(in);
    EXPECT_NE(prompt.find("Do not suggest new folders. Only pick from existing ones."), std::string::npos);
    EXPECT_EQ(prompt.find("You may suggest new folders"), std::string::npos);
}

TEST(suggestion_context, trim_strips_surrounding_whitespace) {
    EXPECT_EQ(sorter::trim("  Work/Reports  "), "Work/Reports");
    EXPECT_EQ(sorter::trim("\n\tPhotos\r\n"), "Photos");
    EXPECT_EQ(sorter::trim("   "), "");
    EXPECT_EQ(sorter::trim("a b"), "a b");
}
