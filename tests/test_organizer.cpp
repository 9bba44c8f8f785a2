#include "organizer.hpp"
#include "fake_suggestion_client.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <asio/io_context.hpp>
#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using sorter::suggestion_result;
using test_support::fake_suggestion_client;
using test_support::make_log;
using test_support::temp_dir;

namespace {

sorter::config make_config(const temp_dir& dir) {
    sorter::config cfg;
    cfg.watch_root = (dir.path() / "entropy").string();
    cfg.settle_delay_ms = 0;
    cfg.stats_interval_seconds = 0;
    cfg.rules = {{R"(.*invoice.*\.pdf$)", "Documents/Finance/Invoices"}};
    cfg.suggestions.model = "test-model";
    cfg.suggestions.rate_interval_ms = 0;
    return cfg;
}

// Run the io_context until `done` holds or the deadline passes.
template <typename Pred>
bool run_until(asio::io_context& ioc, Pred done, std::chrono::milliseconds limit = 5s) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        ioc.run_for(20ms);
    }
    return done();
}

} // namespace

TEST(organizer, creates_missing_watched_root) {
    temp_dir dir;
    asio::io_context ioc;
    auto cfg = make_config(dir);

    sorter::organizer engine(ioc, cfg, make_log());
    EXPECT_TRUE(fs::is_directory(cfg.watch_root));
}

TEST(organizer, invalid_rule_pattern_is_fatal) {
    temp_dir dir;
    asio::io_context ioc;
    auto cfg = make_config(dir);
    cfg.rules.push_back({"(broken", "Nowhere"});

    EXPECT_THROW({ sorter::organizer engine(ioc, cfg, make_log()); }, std::runtime_error);
}

TEST(organizer, routes_new_files_end_to_end) {
    temp_dir dir;
    asio::io_context ioc;
    auto cfg = make_config(dir);
    cfg.suggestions.enabled = true;
    auto client = std::make_shared<fake_suggestion_client>(
        std::vector<suggestion_result>{suggestion_result::ok("  Work/Reports  ")});

    sorter::organizer engine(ioc, cfg, make_log(), client);
    engine.start();

    const fs::path root = cfg.watch_root;
    dir.write("entropy/project_invoice_2024.pdf");
    dir.write("entropy/q3.docx");

    EXPECT_TRUE(run_until(ioc, [&] {
        return fs::exists(root / "Documents/Finance/Invoices/project_invoice_2024.pdf") &&
               fs::exists(root / "Work/Reports/q3.docx");
    }));

    engine.stop();
    ioc.run_for(50ms);

    EXPECT_EQ(client->calls().size(), 1u);
    auto st = engine.get_dispatcher().get_stats();
    EXPECT_EQ(st.rule_matched, 1u);
    EXPECT_EQ(st.suggested, 1u);
}

TEST(organizer, moves_into_subfolders_do_not_retrigger) {
    temp_dir dir;
    asio::io_context ioc;
    auto cfg = make_config(dir);

    sorter::organizer engine(ioc, cfg, make_log());
    engine.start();

    const fs::path root = cfg.watch_root;
    dir.write("entropy/notes.xyz");

    EXPECT_TRUE(run_until(ioc, [&] { return fs::exists(root / "Unsorted/notes.xyz"); }));
    ioc.run_for(200ms);

    engine.stop();
    auto st = engine.get_dispatcher().get_stats();
    EXPECT_EQ(st.events, 1u);
    EXPECT_EQ(st.moved, 1u);
}
