#include "shareup/config/client_config.hpp"
#include "shareup/events/components.hpp"
#include "shareup/events/event_bus.hpp"
#include "shareup/remote/local_share_channel.hpp"
#include "shareup/task/dispatcher.hpp"
#include "shareup/task/upload_task.hpp"
#include "shareup/task/work_queue.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using shareup::task::UploadError;
using shareup::task::UploadTask;

namespace {

std::atomic<bool> g_interrupted{false};

void handle_sigint(int) {
    g_interrupted.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " --config <file> --dest <volume/dir> [--name <file>] [--suffix <s> | --no-suffix] <local-file>\n";
}

class ConsoleListener : public shareup::task::UploadListener {
public:
    std::future<std::optional<UploadError>> outcome() { return done_.get_future(); }

    void on_upload_progress(UploadTask&, std::uint64_t sent, std::uint64_t expected) override {
        const auto percent = expected == 0 ? 100 : static_cast<int>(sent * 100 / expected);
        std::cout << "\r" << sent << "/" << expected << " bytes (" << percent << "%)" << std::flush;
    }

    void on_upload_finished(UploadTask& task) override {
        std::cout << "\nUploaded " << task.description() << "\n";
        done_.set_value(std::nullopt);
    }

    void on_upload_failed(UploadTask& task, UploadError error) override {
        std::cout << "\n";
        spdlog::error("Upload of {} ended: {}", task.description(), shareup::task::to_string(error));
        done_.set_value(error);
    }

private:
    std::promise<std::optional<UploadError>> done_;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    std::string destination;
    std::string name;
    std::optional<std::string> suffix;
    bool no_suffix = false;
    std::string local_file;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-d" || arg == "--dest") && i + 1 < argc) {
            destination = argv[++i];
        } else if ((arg == "-n" || arg == "--name") && i + 1 < argc) {
            name = argv[++i];
        } else if (arg == "--suffix" && i + 1 < argc) {
            suffix = argv[++i];
        } else if (arg == "--no-suffix") {
            no_suffix = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && local_file.empty()) {
            local_file = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config_path.empty() || destination.empty() || local_file.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto config = shareup::config::load_config(config_path);
    if (config.is_error()) {
        spdlog::error("{}", config.error());
        return 2;
    }
    shareup::config::apply_log_level(config.value());

    auto remote_path = shareup::remote::RemotePath::parse(destination);
    if (remote_path.is_error()) {
        spdlog::error("{}", remote_path.error());
        return 2;
    }

    shareup::task::UploadOptions options;
    options.destination = remote_path.value();
    options.file_name = name.empty() ? fs::path(local_file).filename().string() : name;
    options.source = local_file;
    options.chunk_size = config.value().chunk_size;
    if (!no_suffix) {
        const std::string staged = suffix.value_or(config.value().temporary_suffix);
        if (!staged.empty()) {
            options.temporary_suffix = staged;
        }
    }

    shareup::events::EventBus bus;
    shareup::events::LoggerComponent logger(bus);
    shareup::events::MetricsComponent metrics(bus);

    auto channel = std::make_shared<shareup::remote::LocalShareChannel>(config.value().shares);
    shareup::task::WorkQueue queue(config.value().worker_threads);
    shareup::task::SerialDispatcher dispatcher;

    auto listener = std::make_shared<ConsoleListener>();
    auto outcome = listener->outcome();
    auto task = UploadTask::create(channel, queue, dispatcher, options, listener, &bus);

    std::signal(SIGINT, handle_sigint);

    auto started = task->resume();
    if (started.is_error()) {
        spdlog::error("{}", started.error());
        return 1;
    }

    bool cancel_sent = false;
    while (outcome.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted.load() && !cancel_sent) {
            spdlog::warn("Interrupted, cancelling upload");
            task->cancel();
            cancel_sent = true;
        }
    }

    const auto error = outcome.get();
    queue.wait();
    metrics.print_stats();

    if (!error) {
        return 0;
    }
    if (*error == UploadError::Cancelled) {
        return 130;
    }
    if (shareup::task::is_retryable(*error)) {
        spdlog::info("Run the same command again to resume the upload");
    }
    return 1;
}
