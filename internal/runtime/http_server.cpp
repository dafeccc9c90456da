#include "internal/runtime/http_server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/http_routes.hpp"

namespace faucet::runtime {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace {

constexpr auto        kIdleTimeout    = std::chrono::seconds(30);
constexpr std::size_t kMaxRequestBody = 16 * 1024;

} // namespace

// One connection. Reads a request, hands it to a handler pool, writes the reply.
class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
 public:
  Session(tcp::socket socket, std::shared_ptr<core::FaucetService> service, net::thread_pool& disbursements, net::thread_pool& queries)
      : stream_(std::move(socket)), service_(std::move(service)), disbursements_(disbursements), queries_(queries) {
    beast::error_code ec;
    auto              remote = stream_.socket().remote_endpoint(ec);
    peer_                    = ec ? std::string("unknown") : remote.address().to_string();
  }

  void Run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::DoRead, shared_from_this()));
  }

 private:
  void DoRead() {
    parser_.emplace();
    parser_->body_limit(kMaxRequestBody);
    stream_.expires_after(kIdleTimeout);
    http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&Session::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      Close();
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout) {
        FAUCET_LOG_DEBUG("HTTP read failed", {faucet::observability::ErrorField(ec.message())});
      }
      Close();
      return;
    }

    auto request = parser_->release();
    // No timeout while the handler waits on the facade.
    stream_.expires_never();

    std::string method(request.method_string());
    std::string target(request.target());
    auto&       pool = WaitsOnDisbursement(method, target) ? disbursements_ : queries_;

    net::post(pool, [self = shared_from_this(), request = std::move(request), method = std::move(method), target = std::move(target)]() mutable {
      const auto start = std::chrono::steady_clock::now();
      auto       reply = Route(*self->service_, method, target, self->peer_);

      faucet::observability::Metrics::Instance().RecordRequest(
          "http", reply.status < 500, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());

      auto response = std::make_shared<http::response<http::string_body>>(static_cast<http::status>(reply.status), request.version());
      response->set(http::field::content_type, "application/json");
      if (!reply.retry_after.empty()) {
        response->set(http::field::retry_after, reply.retry_after);
      }
      response->keep_alive(request.keep_alive());
      response->body() = std::move(reply.body);
      response->prepare_payload();

      net::post(self->stream_.get_executor(), [self, response]() { self->DoWrite(response); });
    });
  }

  void DoWrite(std::shared_ptr<http::response<http::string_body>> response) {
    stream_.expires_after(kIdleTimeout);
    http::async_write(stream_, *response, [self = shared_from_this(), response](beast::error_code ec, std::size_t) {
      if (ec || response->need_eof()) {
        self->Close();
        return;
      }
      self->DoRead();
    });
  }

  void Close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.socket().close(ec);
  }

  beast::tcp_stream                                       stream_;
  beast::flat_buffer                                      buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<core::FaucetService>                    service_;
  net::thread_pool&                                       disbursements_;
  net::thread_pool&                                       queries_;
  std::string                                             peer_;
};

HttpServer::HttpServer(std::string                          bind_host,
                       std::uint16_t                        port,
                       std::shared_ptr<core::FaucetService> service,
                       std::size_t                          disbursement_threads,
                       std::size_t                          query_threads)
    : bind_host_(std::move(bind_host)),
      port_(port),
      service_(std::move(service)),
      acceptor_(net::make_strand(ioc_)),
      disbursements_(disbursement_threads),
      queries_(query_threads) {
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  if (running_) {
    return;
  }

  tcp::endpoint endpoint(net::ip::make_address(bind_host_), port_);

  beast::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Failed to listen on " + bind_host_ + ":" + std::to_string(port_) + ": " + ec.message());
  }

  port_    = acceptor_.local_endpoint().port();
  running_ = true;
  DoAccept();
  io_thread_ = std::thread([this]() { ioc_.run(); });

  FAUCET_LOG_INFO("HTTP server listening",
                  {faucet::observability::StringField("bind_host", bind_host_), faucet::observability::IntField("port", port_)});
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;

  net::dispatch(acceptor_.get_executor(), [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
  });
  ioc_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  disbursements_.join();
  queries_.join();
}

std::uint16_t HttpServer::port() const {
  return port_;
}

void HttpServer::DoAccept() {
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec != net::error::operation_aborted) {
        FAUCET_LOG_WARN("HTTP accept failed", {faucet::observability::ErrorField(ec.message())});
        DoAccept();
      }
      return;
    }
    std::make_shared<Session>(std::move(socket), service_, disbursements_, queries_)->Run();
    DoAccept();
  });
}

} // namespace faucet::runtime
