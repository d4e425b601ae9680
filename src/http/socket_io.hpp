#pragma once

#include <chrono>
#include <poll.h>
#include <string>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>

namespace pokeme::http {

using Deadline = std::chrono::steady_clock::time_point;

inline bool would_block(const boost::system::error_code& ec) {
    return ec == boost::asio::error::would_block || ec == boost::asio::error::try_again;
}

// Waits for `events` on `fd` until `deadline`. False on timeout or poll error.
inline bool wait_for_events(const int fd, const short events, const Deadline deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return false;
    }
    pollfd fds[1];
    fds[0].fd = fd;
    fds[0].events = events;
    fds[0].revents = 0;
    return poll(fds, 1, static_cast<int>(remaining.count())) > 0;
}

// Drives a Beast parser on a non-blocking socket until `done()` holds. The
// whole read must finish within `timeout`.
template <typename Parser, typename Done>
boost::system::error_code read_until(boost::asio::ip::tcp::socket& socket,
                                     boost::beast::flat_buffer& buffer,
                                     Parser& parser,
                                     const std::chrono::milliseconds timeout,
                                     Done done) {
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    boost::system::error_code ec;
    while (!done()) {
        boost::beast::http::read_some(socket, buffer, parser, ec);
        if (!ec) {
            continue;
        }
        if (!would_block(ec)) {
            return ec;
        }
        ec.clear();
        if (!wait_for_events(socket.native_handle(), POLLIN, deadline)) {
            return boost::asio::error::timed_out;
        }
    }
    return ec;
}

// Writes `message` on a non-blocking socket. A peer that stops reading fails
// the write with timed_out once `timeout` has elapsed.
template <bool isRequest, typename Body, typename Fields>
boost::system::error_code write_message(
    boost::asio::ip::tcp::socket& socket,
    boost::beast::http::message<isRequest, Body, Fields>& message,
    const std::chrono::milliseconds timeout) {
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    boost::beast::http::serializer<isRequest, Body, Fields> serializer{message};
    boost::system::error_code ec;
    while (!serializer.is_done()) {
        boost::beast::http::write_some(socket, serializer, ec);
        if (!ec) {
            continue;
        }
        if (!would_block(ec)) {
            return ec;
        }
        ec.clear();
        if (!wait_for_events(socket.native_handle(), POLLOUT, deadline)) {
            return boost::asio::error::timed_out;
        }
    }
    return ec;
}

inline std::string to_std_string(const boost::beast::string_view view) {
    return std::string(view.data(), view.size());
}

}  // namespace pokeme::http
