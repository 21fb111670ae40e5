#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace toolhost {

/// Newline-delimited JSON over a pair of file descriptors (stdin/stdout by
/// default). The reader runs in start(); writes go through a queue drained by
/// a background thread.
class StdioTransport : public ITransport {
public:
    struct Options {
        /// Write responses in request order instead of completion order.
        bool ordered_responses = false;
        size_t max_line_bytes = 16 * 1024 * 1024;
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport using specified file descriptors (takes ownership).
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;
    bool supports_correlation() const override { return !opts_.ordered_responses; }

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void handle_line(const std::string& line, const MessageCallback& on_message,
                     const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();

    Options opts_;
    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
};

} // namespace toolhost
