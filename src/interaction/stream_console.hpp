#pragma once

#include <atomic>
#include <cstddef>
#include <ostream>
#include <string>
#include <thread>
#include "interaction/interaction_channel.hpp"

namespace station::interaction {

// Bridges a channel to a JSON-lines console: outbound messages are written to
// `out`, responses are read from `input_fd`. End of input counts as operator
// disconnection and closes the channel.
class StreamConsole {
public:
    StreamConsole(InteractionChannel& channel, int input_fd, std::ostream& out);
    ~StreamConsole();

    StreamConsole(const StreamConsole&) = delete;
    StreamConsole& operator=(const StreamConsole&) = delete;

    void start();
    // Drains queued outbound messages, then joins both threads.
    void stop();

    std::size_t rejected_lines() const;

private:
    void read_loop();
    void write_loop();
    void handle_line(const std::string& line);

    InteractionChannel& channel_;
    int input_fd_;
    std::ostream& out_;
    std::atomic_bool stopping_{false};
    std::atomic<std::size_t> rejected_lines_{0};
    std::thread reader_;
    std::thread writer_;
};

}  // namespace station::interaction
