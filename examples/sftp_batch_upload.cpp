/**
 * @file sftp_batch_upload.cpp
 * @brief Scheduled, paced batch upload over SFTP
 *
 * This example demonstrates:
 * - Building a batch from files and directories
 * - Loading and saving connection profiles
 * - Start delay, inter-file delay and a test-batch checkpoint
 * - Rendering the event stream with a single-line countdown
 * - Ctrl-C as cancellation
 */

#include <kcenon/batch_transfer/batch_transfer.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::batch_transfer;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

/**
 * @brief Install the SIGINT handler without SA_RESTART
 *
 * A blocking prompt read then fails on Ctrl-C instead of resuming.
 */
void install_interrupt_handler() {
    struct sigaction action {};
    action.sa_handler = on_sigint;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
}

auto severity_prefix(event_severity severity) -> const char* {
    switch (severity) {
        case event_severity::warning: return "[WARN] ";
        case event_severity::error: return "[ERROR] ";
        default: return "";
    }
}

/**
 * @brief Renders batch events on a terminal
 *
 * Countdown ticks overwrite a single status line; other events are printed
 * on their own lines.
 */
class console_renderer {
public:
    void render(const log_event& event) {
        if (event.severity == event_severity::debug) {
            return;
        }
        clear_status();
        std::cout << severity_prefix(event.severity) << event.message << std::endl;
    }

    void render(const countdown_tick& tick) {
        if (tick.is_clear()) {
            clear_status();
            return;
        }
        auto line = tick.to_display_string();
        std::cout << "\r" << line;
        if (line.size() < status_width_) {
            std::cout << std::string(status_width_ - line.size(), ' ');
        }
        std::cout << std::flush;
        status_width_ = line.size();
    }

    void clear_status() {
        if (status_width_ == 0) {
            return;
        }
        std::cout << "\r" << std::string(status_width_, ' ') << "\r" << std::flush;
        status_width_ = 0;
    }

private:
    std::size_t status_width_ = 0;
};

/**
 * @brief Ask whether to continue after the test batch
 * @return std::nullopt when the prompt was interrupted or input ended
 */
auto ask_to_continue(const confirmation_requested& request) -> std::optional<bool> {
    std::cout << std::endl
              << "Test batch of " << request.completed_files << "/" << request.total_files
              << " files uploaded. Continue? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer) || g_interrupted != 0) {
        std::cin.clear();
        return std::nullopt;
    }
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

void print_usage(const char* program) {
    std::cout << "SFTP Batch Upload - Batch Transfer System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] [file1] [file2] ..." << std::endl;
    std::cout << std::endl;
    std::cout << "Connection:" << std::endl;
    std::cout << "  --host <host>            SFTP server hostname" << std::endl;
    std::cout << "  --port <port>            SFTP server port (default: 22)" << std::endl;
    std::cout << "  --user <name>            Login name" << std::endl;
    std::cout << "  --password <secret>      Password (or BATCH_TRANSFER_PASSWORD)" << std::endl;
    std::cout << "  --key <path>             Private key file (switches to key auth)" << std::endl;
    std::cout << "  --passphrase <secret>    Private key passphrase" << std::endl;
    std::cout << "  --remote-dir <dir>       Remote destination directory" << std::endl;
    std::cout << std::endl;
    std::cout << "Profiles:" << std::endl;
    std::cout << "  --profiles-file <path>   Profile file (default: "
              << profile_store::default_path().string() << ")" << std::endl;
    std::cout << "  --profile <name>         Use a saved profile (default profile if omitted)"
              << std::endl;
    std::cout << "  --save-profile <name>    Save the connection settings as a profile"
              << std::endl;
    std::cout << "  --list-profiles          List saved profiles and exit" << std::endl;
    std::cout << std::endl;
    std::cout << "Batch:" << std::endl;
    std::cout << "  --dir <dir>              Add files of a directory" << std::endl;
    std::cout << "  --ext <ext>              Extension filter for --dir (default: .csv)"
              << std::endl;
    std::cout << "  --start-delay <minutes>  Wait before connecting (default: 0)" << std::endl;
    std::cout << "  --delay <seconds>        Wait between files (default: 0)" << std::endl;
    std::cout << "  --checkpoint <n>         Ask to continue after n files (default: off)"
              << std::endl;
    std::cout << "  --test-connection        Connect, show the remote home and exit"
              << std::endl;
    std::cout << "  --log-level <level>      Library log level: trace, debug, info, warn,"
              << std::endl;
    std::cout << "                           error or off (default: warn)" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --host sftp.example.com --user deploy --dir ./out"
              << std::endl;
    std::cout << "  " << program << " --profile prod --delay 60 --checkpoint 3 a.csv b.csv"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    session_options session;
    bool host_given = false;
    bool port_given = false;
    bool user_given = false;
    bool password_given = false;
    bool key_given = false;
    bool remote_dir_given = false;

    std::optional<std::string> profile_name;
    std::optional<std::string> save_profile_name;
    std::filesystem::path profiles_file = profile_store::default_path();
    bool list_profiles = false;
    bool test_connection = false;

    std::vector<std::string> directories;
    std::string extension = ".csv";
    std::vector<std::filesystem::path> files;
    batch_policy policy;
    log_level library_level = log_level::warn;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--host") {
                if (++i >= argc) {
                    std::cerr << "Error: --host requires an argument" << std::endl;
                    return 1;
                }
                session.host = argv[i];
                host_given = true;
            } else if (arg == "--port") {
                if (++i >= argc) {
                    std::cerr << "Error: --port requires an argument" << std::endl;
                    return 1;
                }
                session.port = static_cast<uint16_t>(std::stoi(argv[i]));
                port_given = true;
            } else if (arg == "--user") {
                if (++i >= argc) {
                    std::cerr << "Error: --user requires an argument" << std::endl;
                    return 1;
                }
                session.username = argv[i];
                user_given = true;
            } else if (arg == "--password") {
                if (++i >= argc) {
                    std::cerr << "Error: --password requires an argument" << std::endl;
                    return 1;
                }
                session.password = argv[i];
                password_given = true;
            } else if (arg == "--key") {
                if (++i >= argc) {
                    std::cerr << "Error: --key requires an argument" << std::endl;
                    return 1;
                }
                session.key_path = argv[i];
                session.auth = auth_method::private_key;
                key_given = true;
            } else if (arg == "--passphrase") {
                if (++i >= argc) {
                    std::cerr << "Error: --passphrase requires an argument" << std::endl;
                    return 1;
                }
                session.key_passphrase = argv[i];
            } else if (arg == "--remote-dir") {
                if (++i >= argc) {
                    std::cerr << "Error: --remote-dir requires an argument" << std::endl;
                    return 1;
                }
                session.remote_dir = argv[i];
                remote_dir_given = true;
            } else if (arg == "--profiles-file") {
                if (++i >= argc) {
                    std::cerr << "Error: --profiles-file requires an argument" << std::endl;
                    return 1;
                }
                profiles_file = argv[i];
            } else if (arg == "--profile") {
                if (++i >= argc) {
                    std::cerr << "Error: --profile requires an argument" << std::endl;
                    return 1;
                }
                profile_name = argv[i];
            } else if (arg == "--save-profile") {
                if (++i >= argc) {
                    std::cerr << "Error: --save-profile requires an argument" << std::endl;
                    return 1;
                }
                save_profile_name = argv[i];
            } else if (arg == "--list-profiles") {
                list_profiles = true;
            } else if (arg == "--dir") {
                if (++i >= argc) {
                    std::cerr << "Error: --dir requires an argument" << std::endl;
                    return 1;
                }
                directories.emplace_back(argv[i]);
            } else if (arg == "--ext") {
                if (++i >= argc) {
                    std::cerr << "Error: --ext requires an argument" << std::endl;
                    return 1;
                }
                extension = argv[i];
                if (!extension.empty() && extension[0] != '.') {
                    extension.insert(extension.begin(), '.');
                }
            } else if (arg == "--start-delay") {
                if (++i >= argc) {
                    std::cerr << "Error: --start-delay requires an argument" << std::endl;
                    return 1;
                }
                policy.start_delay = std::chrono::minutes(std::stoi(argv[i]));
            } else if (arg == "--delay") {
                if (++i >= argc) {
                    std::cerr << "Error: --delay requires an argument" << std::endl;
                    return 1;
                }
                policy.inter_file_delay = std::chrono::seconds(std::stoi(argv[i]));
            } else if (arg == "--checkpoint") {
                if (++i >= argc) {
                    std::cerr << "Error: --checkpoint requires an argument" << std::endl;
                    return 1;
                }
                policy.checkpoint_after = static_cast<std::size_t>(std::stoul(argv[i]));
            } else if (arg == "--test-connection") {
                test_connection = true;
            } else if (arg == "--log-level") {
                if (++i >= argc) {
                    std::cerr << "Error: --log-level requires an argument" << std::endl;
                    return 1;
                }
                auto parsed = parse_log_level(argv[i]);
                if (!parsed) {
                    std::cerr << "Error: unknown log level '" << argv[i] << "'" << std::endl;
                    return 1;
                }
                library_level = *parsed;
            } else if (arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            } else {
                files.emplace_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    // Run progress is rendered from the event stream; the library log only
    // carries diagnostics at or above the chosen level.
    get_logger().set_level(library_level);

    // ------------------------------------------------------------------------
    // Profiles
    // ------------------------------------------------------------------------
    profile_store profiles(profiles_file);
    auto loaded = profiles.load();
    if (!loaded.has_value()) {
        std::cerr << "Error: " << loaded.error().message << std::endl;
        return 1;
    }

    if (list_profiles) {
        if (profiles.size() == 0) {
            std::cout << "No saved profiles in " << profiles.path().string() << std::endl;
        }
        for (const auto& name : profiles.names()) {
            auto entry = profiles.find(name);
            std::cout << (name == profiles.default_name() ? "* " : "  ") << name;
            if (entry) {
                std::cout << "  " << entry->username << "@" << entry->endpoint_string()
                          << "  (" << to_string(entry->auth) << ")";
            }
            std::cout << std::endl;
        }
        return 0;
    }

    std::optional<session_options> base;
    if (profile_name) {
        base = profiles.find(*profile_name);
        if (!base) {
            std::cerr << "Error: no profile named '" << *profile_name << "'" << std::endl;
            return 1;
        }
    } else if (!host_given) {
        base = profiles.default_profile();
    }

    // Command-line values override the profile.
    if (base) {
        session_options merged = *base;
        if (host_given) merged.host = session.host;
        if (port_given) merged.port = session.port;
        if (user_given) merged.username = session.username;
        if (password_given) merged.password = session.password;
        if (key_given) {
            merged.auth = auth_method::private_key;
            merged.key_path = session.key_path;
        }
        if (!session.key_passphrase.empty()) merged.key_passphrase = session.key_passphrase;
        if (remote_dir_given) merged.remote_dir = session.remote_dir;
        session = merged;
    }

    if (session.auth == auth_method::password && session.password.empty()) {
        if (const char* env = std::getenv("BATCH_TRANSFER_PASSWORD")) {
            session.password = env;
        }
    }

    if (save_profile_name) {
        auto saved = profiles.upsert(*save_profile_name, session);
        if (saved.has_value()) {
            saved = profiles.save();
        }
        if (!saved.has_value()) {
            std::cerr << "Error: " << saved.error().message << std::endl;
            return 1;
        }
        std::cout << "Saved profile '" << *save_profile_name << "' to "
                  << profiles.path().string() << std::endl;
    }

    auto connector = std::make_shared<sftp_connector>();

    if (test_connection) {
        std::cout << "Connecting to " << session.endpoint_string() << " ..." << std::endl;
        auto home = probe_connection(*connector, session);
        if (!home.has_value()) {
            std::cerr << "Connection failed: " << home.error().message << std::endl;
            return 1;
        }
        std::cout << "Connection OK (remote home: " << home.value() << ")" << std::endl;
        return 0;
    }

    // ------------------------------------------------------------------------
    // Batch
    // ------------------------------------------------------------------------
    for (const auto& dir : directories) {
        auto listed = collect_files(dir, extension);
        if (!listed.has_value()) {
            std::cerr << "Error: " << listed.error().message << std::endl;
            return 1;
        }
        append_unique(files, listed.value());
    }
    {
        std::vector<std::filesystem::path> unique;
        append_unique(unique, files);
        files = std::move(unique);
    }

    if (files.empty()) {
        std::cerr << "Error: no files to upload" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    auto built = batch_controller::builder().with_connector(connector).build();
    if (!built.has_value()) {
        std::cerr << "Error: " << built.error().message << std::endl;
        return 1;
    }
    auto& controller = built.value();

    batch_request request;
    request.session = session;
    request.files = files;
    request.policy = policy;

    std::cout << "Uploading " << files.size() << " file(s) to " << session.username << "@"
              << session.endpoint_string()
              << (session.remote_dir.empty() ? "" : ":" + session.remote_dir) << std::endl;

    auto handle = controller.start(request);
    if (!handle.has_value()) {
        std::cerr << "Error: " << handle.error().message << std::endl;
        return 1;
    }

    install_interrupt_handler();

    console_renderer renderer;
    std::optional<run_finished> finished;
    bool cancel_sent = false;

    while (!finished) {
        if (g_interrupted != 0 && !cancel_sent) {
            renderer.clear_status();
            std::cout << "Interrupted, stopping ..." << std::endl;
            auto cancelled = controller.cancel(handle.value());
            if (!cancelled.has_value()) {
                std::cerr << "Error: " << cancelled.error().message << std::endl;
            }
            cancel_sent = true;
        }

        auto events = controller.drain_events(handle.value());
        if (events.empty()) {
            auto next = controller.next_event(handle.value(), std::chrono::milliseconds(200));
            if (next) {
                events.push_back(std::move(*next));
            } else if (!controller.is_running(handle.value())) {
                break;
            }
        }

        for (const auto& event : events) {
            if (const auto* log = std::get_if<log_event>(&event)) {
                renderer.render(*log);
            } else if (const auto* tick = std::get_if<countdown_tick>(&event)) {
                renderer.render(*tick);
            } else if (const auto* ask = std::get_if<confirmation_requested>(&event)) {
                renderer.clear_status();
                auto proceed = ask_to_continue(*ask);
                if (!proceed) {
                    if (g_interrupted != 0) {
                        // cancel() at the top of the loop releases the checkpoint.
                        continue;
                    }
                    std::cout << std::endl << "Input closed, stopping." << std::endl;
                    proceed = false;
                }
                auto answered = controller.answer_checkpoint(handle.value(), *proceed);
                if (!answered.has_value()) {
                    std::cerr << "Error: " << answered.error().message << std::endl;
                }
            } else if (const auto* done = std::get_if<run_finished>(&event)) {
                finished = *done;
            }
        }
    }

    renderer.clear_status();
    if (!finished) {
        auto outcome = controller.wait(handle.value());
        if (!outcome.has_value()) {
            std::cerr << "Error: " << outcome.error().message << std::endl;
            return 1;
        }
        finished = outcome.value();
    }

    std::cout << std::endl;
    std::cout << "=== Batch Summary ===" << std::endl;
    std::cout << "Result:     " << to_string(finished->reason) << std::endl;
    std::cout << "Uploaded:   " << finished->summary.succeeded << std::endl;
    std::cout << "Failed:     " << finished->summary.failed << std::endl;
    std::cout << "Skipped:    " << finished->summary.skipped << std::endl;

    if (!finished->completed_normally || finished->summary.failed > 0) {
        return 1;
    }
    return 0;
}
