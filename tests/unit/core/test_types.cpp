/**
 * @file test_types.cpp
 * @brief Unit tests for error codes, result, batch event types and file lists
 */

#include <gtest/gtest.h>

#include <kcenon/batch_transfer/core/batch_types.h>
#include <kcenon/batch_transfer/core/file_list.h>
#include <kcenon/batch_transfer/core/types.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

namespace kcenon::batch_transfer::test {

// =============================================================================
// error_code / result
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::success), 0);
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::invalid_request), -142);
    EXPECT_EQ(static_cast<int>(error_code::connect_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::upload_failed), -165);
    EXPECT_EQ(static_cast<int>(error_code::unknown_run), -180);
    EXPECT_EQ(static_cast<int>(error_code::wait_timeout), -183);
    EXPECT_EQ(static_cast<int>(error_code::profile_not_found), -200);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -220);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::connect_failed), "connect failed");
    EXPECT_STREQ(to_string(error_code::no_pending_checkpoint), "no pending checkpoint");
    EXPECT_STREQ(to_string(error_code::profile_parse_error), "profile parse error");
}

TEST_F(ErrorCodeTest, ErrorDefaultsMessageFromCode) {
    error err(error_code::session_closed);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "session closed");

    error none;
    EXPECT_FALSE(static_cast<bool>(none));
}

TEST_F(ErrorCodeTest, ResultHoldsValueOrError) {
    result<int> ok = 42;
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 42);

    result<int> failed = unexpected{error{error_code::unknown_run, "no such run"}};
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::unknown_run);
    EXPECT_EQ(failed.error().message, "no such run");

    result<void> done;
    EXPECT_TRUE(done.has_value());
}

TEST_F(ErrorCodeTest, ResultSupportsMoveOnlyValues) {
    result<std::unique_ptr<int>> owned = std::make_unique<int>(7);
    ASSERT_TRUE(owned.has_value());
    auto taken = std::move(owned).value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 7);
}

// =============================================================================
// Batch types
// =============================================================================

class BatchTypesTest : public ::testing::Test {};

TEST_F(BatchTypesTest, PolicyDefaults) {
    batch_policy policy;
    EXPECT_EQ(policy.start_delay, std::chrono::seconds(0));
    EXPECT_EQ(policy.inter_file_delay, std::chrono::seconds(0));
    EXPECT_EQ(policy.checkpoint_after, 0u);
    EXPECT_EQ(policy.reconnect_threshold, std::chrono::seconds(55));
}

TEST_F(BatchTypesTest, SessionOptionsDefaults) {
    session_options options;
    options.host = "files.example.org";
    EXPECT_EQ(options.port, 22);
    EXPECT_EQ(options.auth, auth_method::password);
    EXPECT_EQ(options.endpoint_string(), "files.example.org:22");
    EXPECT_STREQ(to_string(auth_method::private_key), "key");
}

TEST_F(BatchTypesTest, RunHandleValidity) {
    run_handle none;
    EXPECT_FALSE(none.is_valid());

    run_handle a{3};
    run_handle b{3};
    EXPECT_TRUE(a.is_valid());
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == run_handle{4});
}

TEST_F(BatchTypesTest, EnumToString) {
    EXPECT_STREQ(to_string(event_severity::warning), "warning");
    EXPECT_STREQ(to_string(log_kind::file_skipped), "file_skipped");
    EXPECT_STREQ(to_string(log_kind::reconnect_failed), "reconnect_failed");
    EXPECT_STREQ(to_string(finish_reason::stopped_at_checkpoint), "stopped_at_checkpoint");
    EXPECT_STREQ(to_string(finish_reason::cancelled_before_start), "cancelled_before_start");
    EXPECT_STREQ(to_string(finish_reason::aborted), "aborted");
}

TEST_F(BatchTypesTest, CountdownTick_DisplayString) {
    countdown_tick start{countdown_phase::start_delay, "Starting in", 125, std::nullopt};
    EXPECT_EQ(start.to_display_string(), "Starting in  02m 05s");

    countdown_tick next{countdown_phase::inter_file_delay, "Next upload in", 9, 4};
    EXPECT_EQ(next.to_display_string(), "Next upload in  00m 09s  [4]");
}

TEST_F(BatchTypesTest, CountdownTick_ClearRendersEmpty) {
    countdown_tick clear;
    EXPECT_TRUE(clear.is_clear());
    EXPECT_TRUE(clear.to_display_string().empty());
}

TEST_F(BatchTypesTest, OnlyRunFinishedIsTerminal) {
    EXPECT_FALSE(is_terminal(batch_event{log_event{}}));
    EXPECT_FALSE(is_terminal(batch_event{countdown_tick{}}));
    EXPECT_FALSE(is_terminal(batch_event{confirmation_requested{1, 2}}));
    EXPECT_TRUE(is_terminal(batch_event{run_finished{}}));
}

// =============================================================================
// File lists
// =============================================================================

class FileListTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("batch_transfer_test_file_list_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_ / "nested");

        for (const char* name : {"b.csv", "a.csv", "c.CSV", "notes.txt", "nested/d.csv"}) {
            std::ofstream(test_dir_ / name) << "x";
        }
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

TEST_F(FileListTest, CollectFiles_SortedAndFiltered) {
    auto files = collect_files(test_dir_, ".csv");

    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files.value().size(), 3u);
    EXPECT_EQ(files.value()[0].filename().string(), "a.csv");
    EXPECT_EQ(files.value()[1].filename().string(), "b.csv");
    EXPECT_EQ(files.value()[2].filename().string(), "c.CSV");
}

TEST_F(FileListTest, CollectFiles_EmptyExtensionAcceptsAll) {
    auto files = collect_files(test_dir_, "");
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value().size(), 4u);
}

TEST_F(FileListTest, CollectFiles_MissingDirectoryIsError) {
    auto files = collect_files(test_dir_ / "absent");
    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error().code, error_code::file_not_found);
}

TEST_F(FileListTest, AppendUnique_PreservesOrder) {
    std::vector<std::filesystem::path> list{"b.csv", "a.csv"};

    auto added = append_unique(list, {"a.csv", "c.csv", "b.csv", "d.csv", "c.csv"});

    EXPECT_EQ(added, 2u);
    std::vector<std::string> names;
    for (const auto& path : list) {
        names.push_back(path.string());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"b.csv", "a.csv", "c.csv", "d.csv"}));
}

}  // namespace kcenon::batch_transfer::test
