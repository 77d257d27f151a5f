#include "server.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <sys/socket.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace cirrus::runtime {

namespace beast      = boost::beast;
namespace beast_http = boost::beast::http;
namespace net        = boost::asio;
using tcp            = net::ip::tcp;

using observability::IntField;
using observability::StringField;

namespace {

tcp::endpoint ParseEndpoint(const std::string& bind_address) {
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos) {
    throw std::runtime_error("bind address must be host:port, got '" + bind_address + "'");
  }

  auto host = bind_address.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  boost::system::error_code ec;
  const auto                address = net::ip::make_address(host.empty() ? "0.0.0.0" : host, ec);
  if (ec) {
    throw std::runtime_error("invalid bind host '" + host + "': " + ec.message());
  }
  const auto port = std::stoul(bind_address.substr(colon + 1));
  if (port > 65535) {
    throw std::runtime_error("invalid bind port in '" + bind_address + "'");
  }
  return {address, static_cast<unsigned short>(port)};
}

template <typename Response>
void CopyHeaders(const beast_http::fields& from, Response& to) {
  for (const auto& field : from) {
    to.set(field.name_string(), field.value());
  }
}

} // namespace

Server::Server(ServerOptions options, std::shared_ptr<http::Gateway> gateway)
    : options_(std::move(options)), gateway_(std::move(gateway)), acceptor_(ioc_) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  const auto endpoint = ParseEndpoint(options_.bind_address);

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();

  workers_ = std::make_unique<net::thread_pool>(options_.worker_threads == 0 ? 4 : options_.worker_threads);
  running_ = true;
  Accept();
  accept_thread_ = std::thread([this] { ioc_.run(); });

  CIRRUS_LOG_INFO("http server listening", {StringField("bind_address", options_.bind_address), IntField("port", port_.load())});
}

void Server::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  net::post(ioc_, [this] {
    boost::system::error_code ec;
    acceptor_.close(ec);
  });
  if (accept_thread_.joinable()) accept_thread_.join();
  ioc_.stop();

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto handle : connections_) {
      ::shutdown(handle, SHUT_RDWR);
    }
  }
  workers_->join();
  CIRRUS_LOG_INFO("http server stopped", {StringField("bind_address", options_.bind_address)});
}

void Server::Accept() {
  acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec != net::error::operation_aborted) {
        CIRRUS_LOG_WARN("accept failed", {StringField("error", ec.message())});
      }
      if (!acceptor_.is_open()) return;
    } else {
      auto shared = std::make_shared<tcp::socket>(std::move(socket));
      net::post(*workers_, [this, shared] { Serve(std::move(*shared)); });
    }
    Accept();
  });
}

void Server::Serve(tcp::socket socket) {
  const auto handle = socket.native_handle();
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(handle);
  }

  boost::system::error_code ec;
  const auto                remote = socket.remote_endpoint(ec);
  const auto                peer   = ec ? std::string() : remote.address().to_string();

  beast::flat_buffer buffer;
  while (running_) {
    beast_http::request_parser<beast_http::string_body> parser;
    parser.body_limit(options_.max_body_bytes);

    beast_http::read(socket, buffer, parser, ec);
    if (ec == beast_http::error::end_of_stream || ec == net::error::eof || ec == net::error::connection_reset) {
      break;
    }
    if (ec) {
      auto response = http::TextResponse(beast_http::status::bad_request, "malformed request: " + ec.message() + "\n");
      beast_http::response<beast_http::string_body> res{response.status, 11};
      CopyHeaders(response.headers, res);
      res.body() = std::move(response.body);
      res.prepare_payload();
      beast_http::write(socket, res, ec);
      break;
    }

    auto request  = parser.release();
    auto response = gateway_->Handle(request, peer);
    if (!WriteResponse(socket, request, response)) {
      break;
    }
  }

  socket.shutdown(tcp::socket::shutdown_send, ec);
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(handle);
  }
  socket.close(ec);
}

bool Server::WriteResponse(tcp::socket& socket, const http::Request& request, http::GatewayResponse& response) {
  boost::system::error_code ec;

  if (response.stream) {
    beast_http::response<beast_http::buffer_body> res{response.status, request.version()};
    CopyHeaders(response.headers, res);
    res.content_length(response.content_length);
    res.keep_alive(request.keep_alive());
    res.body().data = nullptr;
    res.body().more = true;

    beast_http::response_serializer<beast_http::buffer_body> serializer{res};
    beast_http::write_header(socket, serializer, ec);
    if (ec) {
      response.stream->Cancel();
      return false;
    }

    uint64_t sent = 0;
    try {
      while (auto chunk = response.stream->Next()) {
        res.body().data = const_cast<uint8_t*>(chunk->data());
        res.body().size = static_cast<std::size_t>(chunk->size());
        res.body().more = true;
        beast_http::write(socket, serializer, ec);
        if (ec == beast_http::error::need_buffer) ec = {};
        if (ec) {
          CIRRUS_LOG_WARN("stream write failed", {StringField("route", response.route), StringField("error", ec.message())});
          response.stream->Cancel();
          return false;
        }
        sent += static_cast<uint64_t>(chunk->size());
        observability::Metrics::Instance().AddBytesStreamed(response.route, static_cast<uint64_t>(chunk->size()));
      }
    } catch (const std::exception& ex) {
      // Headers are gone; the only signal left is a short body.
      CIRRUS_LOG_ERROR("stream aborted", {StringField("route", response.route), StringField("error", ex.what()),
                                          IntField("sent", static_cast<int64_t>(sent))});
      response.stream->Cancel();
      return false;
    }

    res.body().data = nullptr;
    res.body().size = 0;
    res.body().more = false;
    beast_http::write(socket, serializer, ec);
    return !ec && sent == response.content_length && request.keep_alive();
  }

  if (response.headers_only) {
    beast_http::response<beast_http::empty_body> res{response.status, request.version()};
    CopyHeaders(response.headers, res);
    if (response.status != beast_http::status::not_modified) {
      res.content_length(response.content_length);
    }
    beast_http::response_serializer<beast_http::empty_body> serializer{res};
    beast_http::write_header(socket, serializer, ec);
    return false;
  }

  beast_http::response<beast_http::string_body> res{response.status, request.version()};
  CopyHeaders(response.headers, res);
  res.body() = std::move(response.body);
  res.prepare_payload();
  beast_http::write(socket, res, ec);
  return false;
}

} // namespace cirrus::runtime
