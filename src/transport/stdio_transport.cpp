#include "toolhost/transport/stdio_transport.hpp"
#include "toolhost/error.hpp"
#include "toolhost/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace toolhost {

StdioTransport::StdioTransport() : StdioTransport(Options{}) {}

StdioTransport::StdioTransport(Options opts)
    : opts_(opts), read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : opts_(opts), read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // shutdown() before start() means there is nothing to serve.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    if (::pipe(wakeup_pipe_) < 0) {
        running_ = false;
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
    // A shutdown() that raced the checks above could not wake the reader.
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }

    connected_ = true;
    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_message, on_error);

    // The writer keeps draining until shutdown() so that responses still in
    // flight when the peer stops sending are delivered.
    connected_ = false;
    running_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            log::logger()->error("stdio poll failed: {}", std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN) break;   // shutdown()
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    TransportError(std::string("Read error: ") + std::strerror(errno))));
            }
            break;
        }
        if (n == 0) {
            log::logger()->info("stdio peer closed the connection");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            handle_line(line, on_message, on_error);
        }
        if (pos > 0) buffer.erase(0, pos);

        if (buffer.size() > opts_.max_line_bytes) {
            buffer.clear();
            if (on_error) {
                on_error(std::make_exception_ptr(ParseError("Message exceeds maximum line length")));
            }
        }
    }
}

void StdioTransport::handle_line(const std::string& line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const Error& e) {
        // ParseError or ProtocolError(InvalidRequest)
        if (on_error) {
            on_error(std::current_exception());
        } else {
            log::logger()->warn("dropping undecodable stdio message: {}", e.what());
        }
        return;
    }
    on_message(std::move(msg));
}

void StdioTransport::write_loop() {
    while (true) {
        std::string out;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || shutdown_requested_.load();
            });
            if (write_queue_.empty()) break;   // only reached after shutdown()
            out = std::move(write_queue_.front());
            write_queue_.pop();
        }

        out += '\n';
        const char* data = out.data();
        size_t remaining = out.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                log::logger()->error("stdio write failed: {}", std::strerror(errno));
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    // Messages queued before start() are drained once the writer runs.
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            log::logger()->warn("failed to wake stdio reader: {}", std::strerror(errno));
        }
    }
}

void StdioTransport::shutdown() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        shutdown_requested_ = true;
    }
    if (!running_.exchange(false)) {
        write_cv_.notify_all();
        return;
    }
    connected_ = false;
    write_cv_.notify_all();
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace toolhost
