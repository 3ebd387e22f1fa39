#include "interaction/stream_console.hpp"

#include <cerrno>
#include <chrono>
#include <poll.h>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "interaction/console_codec.hpp"

namespace station::interaction {

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

bool is_blank(const std::string& line) {
    for (const char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

}  // namespace

StreamConsole::StreamConsole(InteractionChannel& channel, const int input_fd,
                             std::ostream& out)
    : channel_(channel), input_fd_(input_fd), out_(out) {}

StreamConsole::~StreamConsole() {
    stop();
}

void StreamConsole::start() {
    if (reader_.joinable() || writer_.joinable()) {
        return;
    }
    stopping_ = false;
    writer_ = std::thread([this]() { write_loop(); });
    reader_ = std::thread([this]() { read_loop(); });
}

void StreamConsole::stop() {
    stopping_ = true;
    if (reader_.joinable()) {
        reader_.join();
    }
    if (writer_.joinable()) {
        writer_.join();
    }
}

std::size_t StreamConsole::rejected_lines() const {
    return rejected_lines_.load();
}

void StreamConsole::handle_line(const std::string& line) {
    if (is_blank(line)) {
        return;
    }

    auto decoded = decode_response(line);
    if (core::errors::is_error(decoded)) {
        ++rejected_lines_;
        STATION_LOG_WARN("StreamConsole: " + core::errors::get_error(decoded).message);
        return;
    }

    const auto& message = core::errors::get_value(decoded);
    auto delivered = channel_.deliver_response(message.request_id, message.selection);
    if (core::errors::is_error(delivered)) {
        ++rejected_lines_;
        const auto& err = core::errors::get_error(delivered);
        STATION_LOG_WARN("StreamConsole: response rejected [" + err.code + "]: " +
                         err.message);
    }
}

void StreamConsole::read_loop() {
    std::string pending;
    char buffer[4096];
    while (!stopping_.load()) {
        pollfd fds[1];
        fds[0].fd = input_fd_;
        fds[0].events = POLLIN;
        const int ready = poll(fds, 1, static_cast<int>(kPollInterval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            channel_.close("console input poll failed");
            return;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(input_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            channel_.close("console input read failed");
            return;
        }
        if (n == 0) {
            if (!pending.empty()) {
                handle_line(pending);
            }
            STATION_LOG_WARN("StreamConsole: operator console disconnected");
            channel_.close("operator disconnected");
            return;
        }

        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline = pending.find('\n');
        while (newline != std::string::npos) {
            handle_line(pending.substr(0, newline));
            pending.erase(0, newline + 1);
            newline = pending.find('\n');
        }
    }
}

void StreamConsole::write_loop() {
    while (true) {
        auto message = channel_.next_outbound(kPollInterval);
        if (!message.has_value()) {
            if (stopping_.load()) {
                return;
            }
            // A closed channel returns immediately; avoid spinning until stop().
            if (channel_.is_closed()) {
                std::this_thread::sleep_for(kPollInterval);
            }
            continue;
        }
        out_ << encode_message(message.value()).dump() << "\n";
        out_.flush();
    }
}

}  // namespace station::interaction
