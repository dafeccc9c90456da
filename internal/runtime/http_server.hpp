#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "internal/core/faucet_service.hpp"

namespace faucet::runtime {

/*
  Plain HTTP/1.1 listener for the health check and local disbursement requests.

  Sockets are driven by one io thread. Disbursement requests block on the
  facade for up to the client timeout, so they run on their own pool; health
  and status lookups run on a second pool that those waits never occupy.
  Handlers post the response back to the connection.
*/
class HttpServer {
 public:
  HttpServer(std::string                          bind_host,
             std::uint16_t                        port,
             std::shared_ptr<core::FaucetService> service,
             std::size_t                          disbursement_threads = 8,
             std::size_t                          query_threads        = 2);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void Start();
  void Stop();

  // Bound port; differs from the configured one when that was 0.
  std::uint16_t port() const;

 private:
  class Session;

  void DoAccept();

  std::string                          bind_host_;
  std::uint16_t                        port_;
  std::shared_ptr<core::FaucetService> service_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::thread_pool       disbursements_;
  boost::asio::thread_pool       queries_;
  std::thread                    io_thread_;
  bool                           running_ = false;
};

} // namespace faucet::runtime
