/**
 * tunnel: peer-to-peer file transfer client.
 *
 *   tunnel send <file> [config.json]
 *   tunnel receive <code> [config.json]
 *
 * Loads config, starts the session on an ASIO io_context, and logs progress
 * from a reporter thread until the session reaches DONE or FAILED.
 */

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <unistd.h>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "common/config.h"
#include "common/errors.h"
#include "session/receiver_session.h"
#include "session/sender_session.h"
#include "transfer/byte_stream.h"
#include "transfer/progress_tracker.h"

namespace {

void usage() {
    std::cerr << "usage:\n"
              << "  tunnel send <file> [config.json]\n"
              << "  tunnel receive <code> [config.json]\n";
}

SessionConfig load_config_or_defaults(const std::string& path, bool explicit_path) {
    if (!explicit_path && !std::filesystem::exists(path)) {
        return SessionConfig{};
    }
    return load_config(path);
}

/**
 * The [Y/n] question for an incoming file. The answer is read through the
 * io_context, so deadlines and Ctrl+C keep working while it is pending.
 */
class ConfirmPrompt {
public:
    ConfirmPrompt(asio::io_context& io, std::string output_directory)
        : input_(io), output_directory_(std::move(output_directory)) {
        int fd = ::dup(STDIN_FILENO);
        asio::error_code ec;
        if (fd >= 0) {
            input_.assign(fd, ec);
            if (ec) {
                ::close(fd);
            }
        }
        // Regular files cannot be watched by the reactor; reading them never blocks.
        pollable_ = fd >= 0 && !ec;
    }

    void ask(const TransferHeader& preview, ReceiverSession::Decision decide) {
        std::filesystem::path target = std::filesystem::path(output_directory_) / preview.filename;
        std::string overwrite = std::filesystem::exists(target)
            ? " (will overwrite an existing file)" : "";

        std::cout << "Incoming file: " << preview.filename << " ("
                  << human_readable_size(preview.length) << "). Accept transfer" << overwrite
                  << "? [Y/n] " << std::flush;

        if (!pollable_) {
            std::string answer;
            bool got_line = static_cast<bool>(std::getline(std::cin, answer));
            decide(got_line && is_yes(answer));
            return;
        }

        asio::async_read_until(input_, asio::dynamic_buffer(line_), '\n',
            [this, decide](const asio::error_code& ec, std::size_t length) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (ec && (ec != asio::error::eof || line_.empty())) {
                    std::cout << std::endl;
                    decide(false);
                    return;
                }
                std::string answer = line_.substr(0, length == 0 ? line_.size() : length);
                decide(is_yes(answer));
            });
    }

    void cancel() {
        asio::error_code ignored;
        input_.cancel(ignored);
        input_.close(ignored);
    }

private:
    static bool is_yes(std::string answer) {
        while (!answer.empty() && (answer.back() == '\n' || answer.back() == '\r')) {
            answer.pop_back();
        }
        return answer.empty() || answer == "y" || answer == "Y";
    }

    asio::posix::stream_descriptor input_;
    std::string output_directory_;
    std::string line_;
    bool pollable_ = false;
};

/// Logs progress snapshots until stopped; runs beside the io thread.
class ProgressReporter {
public:
    ProgressReporter(ProgressTracker& tracker, std::chrono::milliseconds interval)
        : tracker_(tracker), interval_(interval), thread_([this] { run(); }) {}

    ~ProgressReporter() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        thread_.join();
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
            auto snapshot = tracker_.snapshot();
            if (snapshot.state == SessionState::transferring ||
                snapshot.state == SessionState::verifying) {
                spdlog::info("Progress {}", describe(snapshot));
            }
        }
    }

    ProgressTracker& tracker_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage();
        return 1;
    }
    std::string command = argv[1];
    std::string argument = argv[2];
    bool explicit_config = argc > 3;
    std::string config_path = explicit_config ? argv[3] : "config.json";

    SessionConfig config;
    try {
        config = load_config_or_defaults(config_path, explicit_config);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log.level));

    asio::io_context io;
    std::shared_ptr<Session> session;
    ConfirmPrompt prompt(io, config.receiver.output_directory);

    try {
        if (command == "send") {
            auto sender = SenderSession::create(io, config, std::make_unique<FileByteSource>(argument));
            sender->set_on_code([](const std::string& code) {
                std::cout << "\nUse the following command to receive data:\n\n"
                          << "tunnel receive " << code << "\n\n" << std::flush;
            });
            session = sender;
        } else if (command == "receive") {
            auto receiver = ReceiverSession::create(io, config, argument);
            if (!config.receiver.auto_accept) {
                receiver->set_accept_callback(
                    [&prompt](const TransferHeader& preview, ReceiverSession::Decision decide) {
                        prompt.ask(preview, std::move(decide));
                    });
            }
            session = receiver;
        } else {
            usage();
            return 1;
        }
    } catch (const TransferException& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([session](const asio::error_code& ec, int) {
        if (!ec) {
            spdlog::warn("Interrupted, aborting transfer");
            session->cancel();
        }
    });

    SessionState final_state = SessionState::init;
    TransferError final_cause = TransferError::none;
    session->set_on_finished([&](SessionState state, TransferError cause) {
        final_state = state;
        final_cause = cause;
        // The signal set and a pending prompt are the last things keeping run() alive.
        asio::error_code ignored;
        signals.cancel(ignored);
        prompt.cancel();
    });

    {
        ProgressReporter reporter(session->progress(), config.log.progress_interval);
        asio::post(io, [session] { session->start(); });
        io.run();
    }

    if (final_state != SessionState::done) {
        spdlog::error("File transfer failed: {}", to_string(final_cause));
        return 2;
    }
    spdlog::info("File transfer successful");
    return 0;
}
