// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace peerwatch {

namespace membership {
class Directory;
}

namespace http {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * IntrospectionServer - read-only HTTP view of the membership directory
 *
 *   GET /peers   -> 200 application/json {"<peer id>": <last seen>, ...}
 *   anything else -> 404 text/plain "not found"
 *
 * Runs on its own thread and io_context so a slow client never delays the
 * membership reactor; the only shared state is the Directory, read through
 * its snapshot.
 */
class IntrospectionServer {
public:
  IntrospectionServer(uint16_t port, const membership::Directory &directory,
                      std::string bind_address = "0.0.0.0");
  ~IntrospectionServer();

  IntrospectionServer(const IntrospectionServer &) = delete;
  IntrospectionServer &operator=(const IntrospectionServer &) = delete;

  // Bind and start serving; false if the port cannot be bound
  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Actual bound port (handles port 0)
  uint16_t port() const { return bound_port_; }

  // Route a request; no I/O
  Response HandleRequest(const Request &req) const;

private:
  void DoAccept();

  uint16_t port_;
  std::string bind_address_;
  const membership::Directory &directory_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  uint16_t bound_port_{0};
};

} // namespace http
} // namespace peerwatch
