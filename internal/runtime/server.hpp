#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "internal/http/dispatcher.hpp"

namespace cirrus::runtime {

struct ServerOptions {
  std::string bind_address = "0.0.0.0:8088";
  uint32_t    worker_threads = 4;
  uint64_t    max_body_bytes = 1024ULL * 1024 * 1024;
};

/*
  HTTP/1.1 front end.

  One acceptor thread hands each connection to a worker pool; a worker
  serves its connection synchronously until the peer or the gateway ends
  it. Streamed bodies are written chunk by chunk, each write completing
  before the next chunk is pulled.
*/
class Server {
public:
  Server(ServerOptions options, std::shared_ptr<http::Gateway> gateway);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Bound port; valid after Start().
  uint16_t Port() const {
    return port_.load();
  }

private:
  void Accept();
  void Serve(boost::asio::ip::tcp::socket socket);
  bool WriteResponse(boost::asio::ip::tcp::socket& socket, const http::Request& request, http::GatewayResponse& response);

  ServerOptions                  options_;
  std::shared_ptr<http::Gateway> gateway_;

  boost::asio::io_context                        ioc_;
  boost::asio::ip::tcp::acceptor                 acceptor_;
  std::unique_ptr<boost::asio::thread_pool>      workers_;
  std::thread                                    accept_thread_;
  std::atomic<uint16_t>                          port_{0};
  std::atomic<bool>                              running_{false};

  std::mutex                                     connections_mutex_;
  std::set<boost::asio::ip::tcp::socket::native_handle_type> connections_;
};

} // namespace cirrus::runtime
