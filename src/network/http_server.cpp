// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/http_server.hpp"
#include "membership/directory.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <nlohmann/json.hpp>

namespace peerwatch {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

// Idle connections are closed after this long
constexpr std::chrono::seconds kSessionTimeout{30};

/**
 * One client connection: read a request, answer it, repeat while the client
 * asks for keep-alive
 */
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket socket, const IntrospectionServer &server)
      : stream_(std::move(socket)), server_(server) {}

  void Run() { DoRead(); }

private:
  void DoRead() {
    request_ = {};
    stream_.expires_after(kSessionTimeout);
    bhttp::async_read(stream_, buffer_, request_,
                      [self = shared_from_this()](beast::error_code ec, size_t) {
                        self->OnRead(ec);
                      });
  }

  void OnRead(beast::error_code ec) {
    if (ec == bhttp::error::end_of_stream) {
      DoClose();
      return;
    }
    if (ec) {
      LOG_HTTP_DEBUG("read failed: {}", ec.message());
      return;
    }

    response_ = server_.HandleRequest(request_);
    bhttp::async_write(stream_, response_,
                       [self = shared_from_this()](beast::error_code write_ec, size_t) {
                         self->OnWrite(write_ec);
                       });
  }

  void OnWrite(beast::error_code ec) {
    if (ec) {
      LOG_HTTP_DEBUG("write failed: {}", ec.message());
      return;
    }
    if (!response_.keep_alive()) {
      DoClose();
      return;
    }
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  Request request_;
  Response response_;
  const IntrospectionServer &server_;
};

} // namespace

IntrospectionServer::IntrospectionServer(uint16_t port, const membership::Directory &directory,
                                         std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), directory_(directory) {}

IntrospectionServer::~IntrospectionServer() { Stop(); }

bool IntrospectionServer::Start() {
  if (running_) {
    return true;
  }

  io_context_ = std::make_unique<boost::asio::io_context>();
  try {
    auto address = boost::asio::ip::make_address(bind_address_);
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);
    tcp::endpoint endpoint(address, port_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception &e) {
    LOG_HTTP_ERROR("failed to bind HTTP server to {}:{}: {}", bind_address_, port_, e.what());
    acceptor_.reset();
    io_context_.reset();
    return false;
  }

  running_ = true;
  DoAccept();
  server_thread_ = std::thread([this]() { io_context_->run(); });

  LOG_HTTP_INFO("HTTP server running on http://{}:{}", bind_address_, bound_port_);
  return true;
}

void IntrospectionServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;

  io_context_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  // Server thread has exited; nothing else touches the acceptor now
  beast::error_code ec;
  acceptor_->close(ec);
  acceptor_.reset();
  io_context_.reset();
  bound_port_ = 0;

  LOG_HTTP_INFO("HTTP server stopped");
}

void IntrospectionServer::DoAccept() {
  acceptor_->async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == boost::asio::error::operation_aborted || !running_) {
        return;
      }
      LOG_HTTP_WARN("accept failed: {}", ec.message());
    } else {
      std::make_shared<Session>(std::move(socket), *this)->Run();
    }
    if (running_) {
      DoAccept();
    }
  });
}

Response IntrospectionServer::HandleRequest(const Request &req) const {
  std::string target(req.target());
  const std::string path = target.substr(0, target.find('?'));

  Response res;
  res.version(req.version());
  res.keep_alive(req.keep_alive());
  res.set(bhttp::field::server, GetUserAgent());

  if (req.method() == bhttp::verb::get && path == "/peers") {
    nlohmann::json body = nlohmann::json::object();
    for (const auto &[peer_id, last_seen] : directory_.Snapshot()) {
      body[peer_id] = last_seen;
    }
    res.result(bhttp::status::ok);
    res.set(bhttp::field::content_type, "application/json");
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    LOG_HTTP_DEBUG("GET /peers -> {} peers", body.size());
  } else {
    res.result(bhttp::status::not_found);
    res.set(bhttp::field::content_type, "text/plain");
    res.body() = "not found";
    LOG_HTTP_DEBUG("{} {} -> 404", std::string(req.method_string()), target);
  }
  res.prepare_payload();
  return res;
}

} // namespace http
} // namespace peerwatch
