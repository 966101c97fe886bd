#include "nexstar/channel.hpp"

#include <cstdio>

#include <spdlog/spdlog.h>

#include "nexstar/errors.hpp"

namespace nexstar {

namespace {

/// Render command bytes for the log, escaping non-printable characters.
std::string printable(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        auto uc = static_cast<unsigned char>(c);
        if (uc >= 0x20 && uc < 0x7f) {
            out += c;
        } else {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02X", uc);
            out += buf;
        }
    }
    return out;
}

} // anonymous namespace

CommandChannel::CommandChannel(std::unique_ptr<ITransport> transport,
                               double timeout, bool verbose)
    : transport_(std::move(transport))
    , timeout_(timeout)
    , verbose_(verbose) {
    if (!transport_) {
        throw ConnectionError("CommandChannel requires a transport");
    }
}

void CommandChannel::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transport_->is_open()) {
        return;
    }
    transport_->open();
}

void CommandChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transport_->is_open()) {
        transport_->close();
        spdlog::info("Connection to {} closed", transport_->describe());
    }
}

bool CommandChannel::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_->is_open();
}

void CommandChannel::set_timeout(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_ = std::chrono::duration<double>(seconds);
}

std::string CommandChannel::describe() const {
    return transport_->describe();
}

std::string CommandChannel::send_command(const std::string& command,
                                         std::optional<std::size_t> expected_length) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transport_->is_open()) {
        throw NotConnectedError("Command '" + printable(command) +
                                "' issued on a closed connection");
    }

    transport_->discard_input();
    if (verbose_) {
        spdlog::debug("Sending command: {}", printable(command));
    }
    transport_->write(command + TERMINATOR);

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() +
        std::chrono::duration_cast<clock::duration>(timeout_);

    std::string response;
    while (true) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - clock::now());
        if (remaining.count() <= 0) {
            spdlog::error("Timeout waiting for response to command: {}",
                          printable(command));
            throw TimeoutError("Timeout waiting for response to: " + printable(command));
        }

        auto byte = transport_->read_byte(remaining);
        if (!byte) {
            continue;
        }
        bool is_data = expected_length && response.size() < *expected_length;
        if (*byte == TERMINATOR && !is_data) {
            break;
        }
        response += *byte;
    }

    if (verbose_) {
        spdlog::debug("Received response: {}", printable(response));
    }
    return response;
}

} // namespace nexstar
