/**
 * @file test_transfer_orchestrator.cpp
 * @brief Unit tests for the batch run state machine
 */

#include <gtest/gtest.h>

#include <kcenon/batch_transfer/orchestrator/transfer_orchestrator.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../fake_session.h"

namespace kcenon::batch_transfer::test {

namespace {

auto logs_of(const std::vector<batch_event>& events) -> std::vector<log_event> {
    std::vector<log_event> logs;
    for (const auto& event : events) {
        if (const auto* log = std::get_if<log_event>(&event)) {
            logs.push_back(*log);
        }
    }
    return logs;
}

auto count_kind(const std::vector<batch_event>& events, log_kind kind) -> std::size_t {
    auto logs = logs_of(events);
    return static_cast<std::size_t>(std::count_if(
        logs.begin(), logs.end(), [kind](const log_event& log) { return log.kind == kind; }));
}

// Position of the first log of @p kind (optionally for a given 1-based file)
auto index_of(const std::vector<batch_event>& events, log_kind kind,
              std::optional<std::size_t> file_index = std::nullopt) -> std::ptrdiff_t {
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto* log = std::get_if<log_event>(&events[i]);
        if (log == nullptr || log->kind != kind) {
            continue;
        }
        if (file_index && log->context.file_index != file_index) {
            continue;
        }
        return static_cast<std::ptrdiff_t>(i);
    }
    return -1;
}

auto count_confirmations(const std::vector<batch_event>& events) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [](const auto& e) {
        return std::holds_alternative<confirmation_requested>(e);
    }));
}

}  // namespace

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("batch_transfer_test_orchestrator_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);

        remote_ = std::make_shared<fake_remote>();
        connector_ = std::make_shared<fake_connector>(remote_);

        request_.session.host = "sftp.example.com";
        request_.session.username = "tester";
        request_.session.password = "secret";
        request_.session.remote_dir = "/upload";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_files(std::size_t count) -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> files;
        for (std::size_t i = 0; i < count; ++i) {
            auto path = test_dir_ / ("file_" + std::to_string(i + 1) + ".csv");
            std::ofstream file(path);
            file << "id,value\n" << i << ",42\n";
            files.push_back(path);
        }
        return files;
    }

    /**
     * @brief Run the orchestrator synchronously, recording every event
     *
     * @p on_event sees each event as it is emitted and may cancel or
     * answer the checkpoint.
     */
    auto run(std::function<void(const batch_event&)> on_event = nullptr) -> run_finished {
        transfer_orchestrator orchestrator(connector_, orchestrator_config{tick_});
        return orchestrator.run(
            request_,
            [&](batch_event event) {
                events_.push_back(event);
                if (on_event) {
                    on_event(events_.back());
                }
            },
            cancel_, gate_);
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<fake_remote> remote_;
    std::shared_ptr<fake_connector> connector_;
    batch_request request_;
    cancellation_source cancel_;
    checkpoint_gate gate_;
    std::vector<batch_event> events_;
    std::chrono::milliseconds tick_{1};
};

// ============================================================================
// Remote path
// ============================================================================

TEST_F(TransferOrchestratorTest, RemotePathFor_JoinsDirectoryAndBaseName) {
    EXPECT_EQ(remote_path_for("/upload", "data/a.csv"), "/upload/a.csv");
    EXPECT_EQ(remote_path_for("/upload/", "/tmp/x/a.csv"), "/upload/a.csv");
    EXPECT_EQ(remote_path_for("incoming//", "a.csv"), "incoming/a.csv");
}

TEST_F(TransferOrchestratorTest, RemotePathFor_EmptyDirectoryUsesBareName) {
    EXPECT_EQ(remote_path_for("", "/tmp/x/a.csv"), "a.csv");
    EXPECT_EQ(remote_path_for("/", "a.csv"), "a.csv");
}

// ============================================================================
// Core scenarios
// ============================================================================

TEST_F(TransferOrchestratorTest, AllUploadsSucceed_InFileOrder) {
    request_.files = create_files(5);

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(finished.summary.attempted, 5u);
    EXPECT_EQ(finished.summary.succeeded, 5u);

    std::vector<std::size_t> succeeded;
    for (const auto& log : logs_of(events_)) {
        if (log.kind == log_kind::upload_succeeded) {
            succeeded.push_back(log.context.file_index.value_or(0));
        }
    }
    EXPECT_EQ(succeeded, (std::vector<std::size_t>{1, 2, 3, 4, 5}));

    ASSERT_FALSE(events_.empty());
    ASSERT_TRUE(is_terminal(events_.back()));
    for (std::size_t i = 0; i + 1 < events_.size(); ++i) {
        EXPECT_FALSE(is_terminal(events_[i]));
    }

    EXPECT_EQ(remote_->uploaded_names(),
              (std::vector<std::string>{"file_1.csv", "file_2.csv", "file_3.csv",
                                        "file_4.csv", "file_5.csv"}));
    EXPECT_EQ(remote_->uploads[0].second, "/upload/file_1.csv");
    EXPECT_EQ(remote_->open_sessions, 0);
}

TEST_F(TransferOrchestratorTest, CheckpointDeclined_StopsAfterTestBatch) {
    request_.files = create_files(5);
    request_.policy.checkpoint_after = 2;

    auto finished = run([&](const batch_event& event) {
        if (std::holds_alternative<confirmation_requested>(event)) {
            EXPECT_TRUE(gate_.answer(false).has_value());
        }
    });

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::stopped_at_checkpoint);
    EXPECT_EQ(finished.summary.attempted, 2u);
    EXPECT_EQ(count_confirmations(events_), 1u);
    EXPECT_EQ(count_kind(events_, log_kind::checkpoint_stop), 1u);
    EXPECT_EQ(remote_->uploads.size(), 2u);
    EXPECT_EQ(remote_->open_sessions, 0);
}

TEST_F(TransferOrchestratorTest, SessionDropped_ReconnectsBeforeNextUpload) {
    request_.files = create_files(5);
    remote_->active_results = {true, true, false};

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(remote_->connect_calls, 2);
    EXPECT_EQ(remote_->uploads.size(), 5u);

    auto reconnected = index_of(events_, log_kind::reconnected);
    auto third_upload = index_of(events_, log_kind::upload_started, 3);
    ASSERT_GE(reconnected, 0);
    ASSERT_GE(third_upload, 0);
    EXPECT_LT(index_of(events_, log_kind::connection_lost), reconnected);
    EXPECT_LT(reconnected, third_upload);
    EXPECT_LT(index_of(events_, log_kind::upload_started, 2), reconnected);

    // The dropped session was closed before the new one was opened.
    EXPECT_EQ(remote_->close_calls, 2);
    EXPECT_EQ(remote_->open_sessions, 0);
}

TEST_F(TransferOrchestratorTest, InitialConnectFails_NoUploads) {
    request_.files = create_files(3);
    remote_->connect_results = {false};

    auto finished = run();

    EXPECT_FALSE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::connect_failed);
    EXPECT_TRUE(remote_->uploads.empty());
    EXPECT_EQ(remote_->connect_calls, 1);

    auto failed = index_of(events_, log_kind::connect_failed);
    ASSERT_GE(failed, 0);
    const auto& log = std::get<log_event>(events_[static_cast<std::size_t>(failed)]);
    EXPECT_EQ(log.severity, event_severity::error);
    ASSERT_TRUE(log.context.error_message.has_value());
    EXPECT_NE(log.message.find("Connection failed: "), std::string::npos);
}

// ============================================================================
// Edge cases
// ============================================================================

TEST_F(TransferOrchestratorTest, EmptyFileList_FinishesCleanly) {
    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(remote_->connect_calls, 1);
    EXPECT_EQ(remote_->close_calls, 1);

    std::size_t terminal = 0;
    for (const auto& event : events_) {
        if (is_terminal(event)) {
            ++terminal;
        }
        if (const auto* log = std::get_if<log_event>(&event)) {
            EXPECT_FALSE(log->context.file_index.has_value());
        }
    }
    EXPECT_EQ(terminal, 1u);
}

TEST_F(TransferOrchestratorTest, MissingFile_SkippedAndLoopAdvances) {
    request_.files = create_files(3);
    request_.files[1] = test_dir_ / "does_not_exist.csv";

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.summary.skipped, 1u);
    EXPECT_EQ(finished.summary.attempted, 2u);
    EXPECT_EQ(remote_->uploaded_names(),
              (std::vector<std::string>{"file_1.csv", "file_3.csv"}));

    auto skipped = index_of(events_, log_kind::file_skipped, 2);
    ASSERT_GE(skipped, 0);
    const auto& log = std::get<log_event>(events_[static_cast<std::size_t>(skipped)]);
    EXPECT_EQ(log.severity, event_severity::warning);
    EXPECT_EQ(log.message, "[02/3] SKIP (not found): does_not_exist.csv");
    EXPECT_LT(skipped, index_of(events_, log_kind::upload_started, 3));
}

TEST_F(TransferOrchestratorTest, UploadFailure_IsNotFatal) {
    request_.files = create_files(3);
    remote_->failing_uploads = {"file_2.csv"};

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(finished.summary.attempted, 3u);
    EXPECT_EQ(finished.summary.succeeded, 2u);
    EXPECT_EQ(finished.summary.failed, 1u);

    auto failed = index_of(events_, log_kind::upload_failed, 2);
    ASSERT_GE(failed, 0);
    const auto& log = std::get<log_event>(events_[static_cast<std::size_t>(failed)]);
    EXPECT_EQ(log.severity, event_severity::error);
    EXPECT_EQ(log.context.error_message, std::optional<std::string>("permission denied"));
    EXPECT_EQ(log.context.remote_path, std::optional<std::string>("/upload/file_2.csv"));
}

TEST_F(TransferOrchestratorTest, CheckpointOnSkippedFile_StillFires) {
    request_.files = create_files(3);
    request_.files[1] = test_dir_ / "does_not_exist.csv";
    request_.policy.checkpoint_after = 2;

    std::size_t completed_at_confirmation = 0;
    auto finished = run([&](const batch_event& event) {
        if (const auto* ask = std::get_if<confirmation_requested>(&event)) {
            completed_at_confirmation = ask->completed_files;
            EXPECT_TRUE(gate_.answer(true).has_value());
        }
    });

    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(count_confirmations(events_), 1u);
    EXPECT_EQ(completed_at_confirmation, 2u);
    EXPECT_EQ(remote_->uploaded_names(),
              (std::vector<std::string>{"file_1.csv", "file_3.csv"}));

    auto skipped = index_of(events_, log_kind::file_skipped, 2);
    auto reached = index_of(events_, log_kind::checkpoint_reached);
    ASSERT_GE(skipped, 0);
    EXPECT_LT(skipped, reached);
    EXPECT_LT(reached, index_of(events_, log_kind::upload_started, 3));
}

TEST_F(TransferOrchestratorTest, UploadThrows_CountedAsFailureAndLoopContinues) {
    request_.files = create_files(3);
    remote_->after_upload = [](const std::filesystem::path& path) {
        if (path.filename() == "file_2.csv") {
            throw std::runtime_error("adapter blew up");
        }
    };

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(finished.summary.attempted, 3u);
    EXPECT_EQ(finished.summary.succeeded, 2u);
    EXPECT_EQ(finished.summary.failed, 1u);
    EXPECT_EQ(remote_->open_sessions, 0);

    auto failed = index_of(events_, log_kind::upload_failed, 2);
    ASSERT_GE(failed, 0);
    const auto& log = std::get<log_event>(events_[static_cast<std::size_t>(failed)]);
    EXPECT_EQ(log.severity, event_severity::error);
    ASSERT_TRUE(log.context.error_message.has_value());
    EXPECT_NE(log.context.error_message->find("adapter blew up"), std::string::npos);
    ASSERT_FALSE(events_.empty());
    EXPECT_TRUE(is_terminal(events_.back()));
}

TEST_F(TransferOrchestratorTest, ConnectorThrows_ReportedAsConnectFailure) {
    request_.files = create_files(2);
    remote_->connect_throws = true;

    auto finished = run();

    EXPECT_FALSE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::connect_failed);
    EXPECT_EQ(count_kind(events_, log_kind::connect_failed), 1u);
    EXPECT_TRUE(remote_->uploads.empty());
}

TEST_F(TransferOrchestratorTest, CloseThrows_RunStillFinishes) {
    request_.files = create_files(1);
    remote_->close_throws = true;

    auto finished = run();

    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(finished.summary.succeeded, 1u);
    EXPECT_EQ(remote_->close_calls, 1);
    ASSERT_FALSE(events_.empty());
    EXPECT_TRUE(is_terminal(events_.back()));
}

TEST_F(TransferOrchestratorTest, CheckpointBeyondFileCount_NeverFires) {
    request_.files = create_files(2);
    request_.policy.checkpoint_after = 5;

    auto finished = run();

    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(count_confirmations(events_), 0u);
}

TEST_F(TransferOrchestratorTest, CheckpointAccepted_ContinuesWithRemainingFiles) {
    request_.files = create_files(4);
    request_.policy.checkpoint_after = 1;

    std::size_t uploads_at_confirmation = 0;
    auto finished = run([&](const batch_event& event) {
        if (const auto* ask = std::get_if<confirmation_requested>(&event)) {
            EXPECT_EQ(ask->completed_files, 1u);
            EXPECT_EQ(ask->total_files, 4u);
            uploads_at_confirmation = remote_->uploads.size();
            EXPECT_TRUE(gate_.is_pending());
            EXPECT_TRUE(gate_.answer(true).has_value());
        }
    });

    EXPECT_EQ(uploads_at_confirmation, 1u);
    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(count_confirmations(events_), 1u);
    EXPECT_EQ(count_kind(events_, log_kind::checkpoint_continue), 1u);
    EXPECT_EQ(remote_->uploads.size(), 4u);

    // Nothing from the file loop between the first upload and the request.
    auto first_done = index_of(events_, log_kind::upload_succeeded, 1);
    auto second_start = index_of(events_, log_kind::upload_started, 2);
    std::ptrdiff_t confirmation = -1;
    for (std::size_t i = 0; i < events_.size(); ++i) {
        if (std::holds_alternative<confirmation_requested>(events_[i])) {
            confirmation = static_cast<std::ptrdiff_t>(i);
        }
    }
    EXPECT_LT(first_done, confirmation);
    EXPECT_LT(confirmation, second_start);
}

TEST_F(TransferOrchestratorTest, CancelWhileCheckpointPending_StopsByUser) {
    request_.files = create_files(3);
    request_.policy.checkpoint_after = 2;

    auto finished = run([&](const batch_event& event) {
        if (std::holds_alternative<confirmation_requested>(event)) {
            cancel_.request();
        }
    });

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::stopped_by_user);
    EXPECT_EQ(remote_->uploads.size(), 2u);
    EXPECT_FALSE(gate_.is_pending());
    EXPECT_EQ(remote_->open_sessions, 0);
}

// ============================================================================
// Delays and cancellation
// ============================================================================

TEST_F(TransferOrchestratorTest, CancelDuringStartDelay_NeverConnects) {
    request_.files = create_files(2);
    request_.policy.start_delay = std::chrono::seconds(60);

    auto finished = run([&](const batch_event& event) {
        if (const auto* tick = std::get_if<countdown_tick>(&event)) {
            if (!tick->is_clear() && tick->remaining_seconds <= 58) {
                cancel_.request();
            }
        }
    });

    EXPECT_FALSE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::cancelled_before_start);
    EXPECT_EQ(remote_->connect_calls, 0);
    EXPECT_EQ(count_kind(events_, log_kind::scheduled), 1u);

    // The countdown is cleared before the run finishes.
    ASSERT_GE(events_.size(), 3u);
    const auto* last_tick = std::get_if<countdown_tick>(&events_[events_.size() - 3]);
    ASSERT_NE(last_tick, nullptr);
    EXPECT_TRUE(last_tick->is_clear());
}

TEST_F(TransferOrchestratorTest, StartDelay_TicksDownThenConnects) {
    request_.files = create_files(1);
    request_.policy.start_delay = std::chrono::seconds(3);

    auto finished = run();

    EXPECT_EQ(finished.reason, finish_reason::completed);

    std::vector<std::uint32_t> remaining;
    for (const auto& event : events_) {
        if (const auto* tick = std::get_if<countdown_tick>(&event)) {
            if (!tick->is_clear()) {
                EXPECT_EQ(tick->phase, countdown_phase::start_delay);
                EXPECT_EQ(tick->label, "Starting in");
                remaining.push_back(tick->remaining_seconds);
            }
        }
    }
    EXPECT_EQ(remaining, (std::vector<std::uint32_t>{3, 2, 1}));
    EXPECT_LT(index_of(events_, log_kind::scheduled), index_of(events_, log_kind::connecting));
}

TEST_F(TransferOrchestratorTest, InterFileDelay_LabelledWithNextIndex) {
    request_.files = create_files(2);
    request_.policy.inter_file_delay = std::chrono::seconds(2);

    auto finished = run();

    EXPECT_EQ(finished.reason, finish_reason::completed);

    std::vector<std::string> displayed;
    bool cleared = false;
    for (const auto& event : events_) {
        if (const auto* tick = std::get_if<countdown_tick>(&event)) {
            if (tick->is_clear()) {
                cleared = true;
            } else {
                EXPECT_EQ(tick->next_file_index, std::optional<std::size_t>(2));
                displayed.push_back(tick->to_display_string());
            }
        }
    }
    EXPECT_EQ(displayed, (std::vector<std::string>{"Next upload in  00m 02s  [2]",
                                                   "Next upload in  00m 01s  [2]"}));
    EXPECT_TRUE(cleared);
}

TEST_F(TransferOrchestratorTest, CancelDuringInterFileDelay_StopsByUser) {
    request_.files = create_files(3);
    request_.policy.inter_file_delay = std::chrono::seconds(30);

    auto finished = run([&](const batch_event& event) {
        if (std::holds_alternative<countdown_tick>(event)) {
            cancel_.request();
        }
    });

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::stopped_by_user);
    EXPECT_EQ(remote_->uploads.size(), 1u);
    EXPECT_EQ(count_kind(events_, log_kind::stopped_by_user), 1u);
    EXPECT_EQ(remote_->open_sessions, 0);
}

TEST_F(TransferOrchestratorTest, RepeatedCancel_SameAsSingleCancel) {
    request_.files = create_files(4);
    remote_->after_upload = [&](const std::filesystem::path& file) {
        if (file.filename() == "file_2.csv") {
            EXPECT_TRUE(cancel_.request());
            EXPECT_FALSE(cancel_.request());
        }
    };

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::stopped_by_user);
    EXPECT_EQ(remote_->uploads.size(), 2u);
    EXPECT_EQ(count_kind(events_, log_kind::stopped_by_user), 1u);
}

TEST_F(TransferOrchestratorTest, CancelledBeforeRun_DoesNotConnect) {
    request_.files = create_files(2);
    cancel_.request();

    auto finished = run();

    EXPECT_FALSE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::cancelled_before_start);
    EXPECT_EQ(remote_->connect_calls, 0);
}

// ============================================================================
// Reconnect policy
// ============================================================================

TEST_F(TransferOrchestratorTest, LongDelay_ReconnectsWhenSessionDropped) {
    request_.files = create_files(2);
    request_.policy.inter_file_delay = std::chrono::seconds(2);
    request_.policy.reconnect_threshold = std::chrono::seconds(2);
    // file 1 check, post-delay check
    remote_->active_results = {true, false};

    auto finished = run();

    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(remote_->connect_calls, 2);
    EXPECT_EQ(remote_->uploads.size(), 2u);

    auto lost = index_of(events_, log_kind::connection_lost);
    ASSERT_GE(lost, 0);
    EXPECT_EQ(std::get<log_event>(events_[static_cast<std::size_t>(lost)]).message,
              "Reconnecting after long delay ...");
    EXPECT_LT(lost, index_of(events_, log_kind::upload_started, 2));
}

TEST_F(TransferOrchestratorTest, ShortDelay_NoProactiveReconnect) {
    request_.files = create_files(2);
    request_.policy.inter_file_delay = std::chrono::seconds(1);
    request_.policy.reconnect_threshold = std::chrono::seconds(55);

    auto finished = run();

    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(remote_->connect_calls, 1);
    EXPECT_EQ(count_kind(events_, log_kind::connection_lost), 0u);
}

TEST_F(TransferOrchestratorTest, ReconnectFails_RunEndsAndSessionClosed) {
    request_.files = create_files(4);
    remote_->active_results = {true, true, false};
    remote_->connect_results = {true, false};

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::reconnect_failed);
    EXPECT_EQ(remote_->uploads.size(), 2u);
    EXPECT_EQ(count_kind(events_, log_kind::reconnect_failed), 1u);
    EXPECT_EQ(remote_->open_sessions, 0);
}

// ============================================================================
// Connection details
// ============================================================================

TEST_F(TransferOrchestratorTest, Connected_ReportsRemoteHome) {
    auto finished = run();
    EXPECT_EQ(finished.reason, finish_reason::completed);

    auto connected = index_of(events_, log_kind::connected);
    ASSERT_GE(connected, 0);
    EXPECT_EQ(std::get<log_event>(events_[static_cast<std::size_t>(connected)]).message,
              "Connected (remote home: /home/tester)");
}

TEST_F(TransferOrchestratorTest, HomeLookupFailure_StillConnects) {
    request_.files = create_files(1);
    remote_->home_fails = true;

    auto finished = run();

    EXPECT_EQ(finished.reason, finish_reason::completed);
    auto connected = index_of(events_, log_kind::connected);
    ASSERT_GE(connected, 0);
    EXPECT_EQ(std::get<log_event>(events_[static_cast<std::size_t>(connected)]).message,
              "Connected");
}

TEST_F(TransferOrchestratorTest, CloseError_IsSuppressed) {
    request_.files = create_files(1);
    remote_->close_fails = true;

    auto finished = run();

    EXPECT_TRUE(finished.completed_normally);
    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(remote_->close_calls, 1);
    for (const auto& log : logs_of(events_)) {
        EXPECT_NE(log.severity, event_severity::error);
    }
}

TEST_F(TransferOrchestratorTest, EmptySink_IsAccepted) {
    request_.files = create_files(1);
    transfer_orchestrator orchestrator(connector_, orchestrator_config{tick_});

    auto finished = orchestrator.run(request_, nullptr, cancel_, gate_);

    EXPECT_EQ(finished.reason, finish_reason::completed);
    EXPECT_EQ(remote_->uploads.size(), 1u);
}

// ============================================================================
// probe_connection
// ============================================================================

TEST_F(TransferOrchestratorTest, ProbeConnection_ReturnsHomeAndCloses) {
    auto home = probe_connection(*connector_, request_.session);

    ASSERT_TRUE(home.has_value());
    EXPECT_EQ(home.value(), "/home/tester");
    EXPECT_EQ(remote_->close_calls, 1);
    EXPECT_EQ(remote_->open_sessions, 0);
}

TEST_F(TransferOrchestratorTest, ProbeConnection_ReportsConnectFailure) {
    remote_->connect_results = {false};

    auto home = probe_connection(*connector_, request_.session);

    ASSERT_FALSE(home.has_value());
    EXPECT_EQ(home.error().code, error_code::connect_failed);
}

TEST_F(TransferOrchestratorTest, ProbeConnection_ClosesWhenHomeFails) {
    remote_->home_fails = true;

    auto home = probe_connection(*connector_, request_.session);

    ASSERT_FALSE(home.has_value());
    EXPECT_EQ(remote_->close_calls, 1);
    EXPECT_EQ(remote_->open_sessions, 0);
}

}  // namespace kcenon::batch_transfer::test
