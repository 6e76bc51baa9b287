#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "config/list_loader.hpp"
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"

namespace {

using cmdgate::config::canonical_denied_entry;
using cmdgate::config::is_valid_allowed_entry;
using cmdgate::config::is_valid_denied_entry;
using cmdgate::config::load_allowed_commands_file;
using cmdgate::config::load_denied_commands_file;
using cmdgate::config::parse_allowed_commands;
using cmdgate::config::parse_denied_commands;
using cmdgate::core::config::CommandSet;
using cmdgate::core::errors::ErrorCategory;
using cmdgate::core::errors::get_error;
using cmdgate::core::errors::get_value;
using cmdgate::core::errors::is_error;

class TempWorkspace {
public:
    TempWorkspace() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::current_path() /
                (std::string(".tmp_list_loader_") + info->name());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(ListLoaderTest, ValidatesEntryFormats) {
    EXPECT_TRUE(is_valid_allowed_entry("service"));
    EXPECT_TRUE(is_valid_allowed_entry("kv_store-entry2"));
    EXPECT_FALSE(is_valid_allowed_entry("service list"));
    EXPECT_FALSE(is_valid_allowed_entry("rm;ls"));
    EXPECT_FALSE(is_valid_allowed_entry(""));
    EXPECT_FALSE(is_valid_allowed_entry(std::string(51, 'a')));

    EXPECT_TRUE(is_valid_denied_entry("log-tail"));
    EXPECT_TRUE(is_valid_denied_entry("stats realtime"));
    EXPECT_TRUE(is_valid_denied_entry("stats   realtime"));
    EXPECT_FALSE(is_valid_denied_entry("vcl custom create"));
    EXPECT_FALSE(is_valid_denied_entry("stats "));
    EXPECT_FALSE(is_valid_denied_entry("stats;realtime"));

    EXPECT_EQ(canonical_denied_entry("stats   realtime"), "stats realtime");
    EXPECT_EQ(canonical_denied_entry("stats"), "stats");
}

TEST(ListLoaderTest, LoadsAllowedFileSkippingCommentsAndBlanks) {
    TempWorkspace ws;
    const auto file = write_file(ws.root() / "allowed.txt",
                                 "# allowed commands\n"
                                 "service\n"
                                 "\n"
                                 "   backend  \r\n"
                                 "  # indented comment\n"
                                 "service\n");
    auto result = load_allowed_commands_file(file);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), (CommandSet{"backend", "service"}));
}

TEST(ListLoaderTest, ReportsLineNumberOfBadEntry) {
    TempWorkspace ws;
    const auto file = write_file(ws.root() / "allowed.txt", "service\n# note\nrm -rf\n");
    auto result = load_allowed_commands_file(file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_list_entry");
    EXPECT_TRUE(contains(get_error(result).message, "line 3"));
}

TEST(ListLoaderTest, RejectsOverlongFileEntry) {
    TempWorkspace ws;
    const auto file = write_file(ws.root() / "allowed.txt", std::string(51, 'a') + "\n");
    auto result = load_allowed_commands_file(file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "list_entry_too_long");
    EXPECT_TRUE(contains(get_error(result).message, "line 1"));
}

TEST(ListLoaderTest, EmptyAllowedFileIsAnErrorButEmptyDeniedFileIsNot) {
    TempWorkspace ws;
    const auto file = write_file(ws.root() / "only_comments.txt", "# nothing here\n\n");

    auto allowed = load_allowed_commands_file(file);
    ASSERT_TRUE(is_error(allowed));
    EXPECT_EQ(get_error(allowed).code, "empty_list");

    auto denied = load_denied_commands_file(file);
    ASSERT_FALSE(is_error(denied));
    EXPECT_TRUE(get_value(denied).empty());
}

TEST(ListLoaderTest, MissingFileFailsToOpen) {
    TempWorkspace ws;
    auto result = load_denied_commands_file(ws.root() / "missing.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "list_open_failed");
}

TEST(ListLoaderTest, LoadsDeniedFileInCanonicalForm) {
    TempWorkspace ws;
    const auto file = write_file(ws.root() / "denied.txt", "stats    realtime\nlog-tail\n");
    auto result = load_denied_commands_file(file);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), (CommandSet{"log-tail", "stats realtime"}));
}

TEST(ListLoaderTest, ParsesInlineLists) {
    auto allowed = parse_allowed_commands(" service, backend ,,stats ");
    ASSERT_FALSE(is_error(allowed));
    EXPECT_EQ(get_value(allowed), (CommandSet{"backend", "service", "stats"}));

    auto denied = parse_denied_commands("stats realtime,log-tail");
    ASSERT_FALSE(is_error(denied));
    EXPECT_EQ(get_value(denied), (CommandSet{"log-tail", "stats realtime"}));
}

TEST(ListLoaderTest, CanonicalizesInlineDeniedEntries) {
    auto denied = parse_denied_commands("stats   realtime, vcl  custom");
    ASSERT_FALSE(is_error(denied));
    EXPECT_EQ(get_value(denied), (CommandSet{"stats realtime", "vcl custom"}));
}

TEST(ListLoaderTest, RejectsBadInlineLists) {
    auto empty = parse_allowed_commands("");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_list");

    auto only_commas = parse_allowed_commands(" , ,");
    ASSERT_TRUE(is_error(only_commas));
    EXPECT_TRUE(contains(get_error(only_commas).message, "no valid commands"));

    auto bad = parse_allowed_commands("service,rm;ls");
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).message, "invalid command format: rm;ls");

    auto too_deep = parse_denied_commands("vcl custom create");
    ASSERT_TRUE(is_error(too_deep));
    EXPECT_EQ(get_error(too_deep).code, "invalid_list_entry");
}

}  // namespace
