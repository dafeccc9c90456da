#include "http_transport.hpp"

#include <type_traits>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "internal/chain/chain_error.hpp"
#include "internal/util/errors.hpp"

namespace faucet::chain {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net   = boost::asio;
using tcp       = boost::asio::ip::tcp;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

namespace {

// Runs one asynchronous operation to completion on a private io_context.
template <typename Start>
boost::system::error_code Await(net::io_context& ioc, Start&& start) {
  boost::system::error_code result = net::error::would_block;
  start([&result](boost::system::error_code ec) { result = ec; });
  ioc.restart();
  ioc.run();
  return result;
}

template <typename Stream>
HttpResponse Exchange(net::io_context&                   ioc,
                      Stream&                            stream,
                      const tcp::resolver::results_type& endpoints,
                      const Endpoint&                    endpoint,
                      const std::string&                 body) {
  auto& lowest = beast::get_lowest_layer(stream);

  auto ec = Await(ioc, [&](auto done) {
    lowest.async_connect(endpoints, [done](boost::system::error_code e, const tcp::endpoint&) mutable { done(e); });
  });
  if (ec) {
    throw ChainError(ChainErrorKind::kUnavailable, "connect to " + endpoint.host + ":" + endpoint.port + " failed: " + ec.message());
  }

  if constexpr (std::is_same_v<Stream, TlsStream>) {
    ec = Await(ioc, [&](auto done) { stream.async_handshake(net::ssl::stream_base::client, done); });
    if (ec) {
      throw ChainError(ChainErrorKind::kUnavailable, "TLS handshake with " + endpoint.host + " failed: " + ec.message());
    }
  }

  bhttp::request<bhttp::string_body> request{bhttp::verb::post, endpoint.target, 11};
  request.set(bhttp::field::host, endpoint.host);
  request.set(bhttp::field::user_agent, "faucet");
  request.set(bhttp::field::content_type, "application/json");
  request.body() = body;
  request.prepare_payload();

  ec = Await(ioc, [&](auto done) {
    bhttp::async_write(stream, request, [done](boost::system::error_code e, std::size_t) mutable { done(e); });
  });
  if (ec) {
    throw ChainError(ChainErrorKind::kUnavailable, "sending request failed: " + ec.message());
  }

  // From here on the node may have acted on the request.
  beast::flat_buffer                  buffer;
  bhttp::response<bhttp::string_body> response;
  ec = Await(ioc, [&](auto done) {
    bhttp::async_read(stream, buffer, response, [done](boost::system::error_code e, std::size_t) mutable { done(e); });
  });
  if (ec) {
    throw ChainError(ChainErrorKind::kTimeout, "no response after request was sent: " + ec.message());
  }

  boost::system::error_code ignored;
  lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);

  return HttpResponse{response.result_int(), std::move(response.body())};
}

} // namespace

Endpoint ParseEndpoint(const std::string& url) {
  Endpoint    endpoint;
  std::string rest;
  if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else if (url.rfind("https://", 0) == 0) {
    endpoint.tls = true;
    rest         = url.substr(8);
  } else {
    throw util::InvalidArgument("unsupported RPC URL scheme: " + url);
  }

  const auto  slash     = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.target = rest.substr(slash);
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    endpoint.host = authority.substr(0, colon);
    endpoint.port = authority.substr(colon + 1);
  } else {
    endpoint.host = authority;
    endpoint.port = endpoint.tls ? "443" : "80";
  }

  if (endpoint.host.empty() || endpoint.port.empty()) {
    throw util::InvalidArgument("invalid RPC URL: " + url);
  }
  return endpoint;
}

BeastHttpTransport::BeastHttpTransport(const std::string& url, std::chrono::milliseconds timeout)
    : endpoint_(ParseEndpoint(url)), timeout_(timeout) {
}

HttpResponse BeastHttpTransport::Post(const std::string& body) {
  net::io_context ioc;

  tcp::resolver               resolver(ioc);
  tcp::resolver::results_type endpoints;
  boost::system::error_code   ec = net::error::would_block;
  resolver.async_resolve(endpoint_.host, endpoint_.port, [&](boost::system::error_code e, tcp::resolver::results_type r) {
    ec        = e;
    endpoints = std::move(r);
  });
  ioc.run_for(timeout_);
  if (ec == net::error::would_block) {
    resolver.cancel();
    throw ChainError(ChainErrorKind::kUnavailable, "resolving " + endpoint_.host + " timed out");
  }
  if (ec) {
    throw ChainError(ChainErrorKind::kUnavailable, "resolving " + endpoint_.host + " failed: " + ec.message());
  }

  // One deadline covers connect, handshake, write and read.
  if (endpoint_.tls) {
    net::ssl::context ctx{net::ssl::context::tls_client};
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(net::ssl::verify_peer);

    TlsStream stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
      throw ChainError(ChainErrorKind::kUnavailable, "failed to set TLS server name " + endpoint_.host);
    }
    stream.set_verify_callback(net::ssl::host_name_verification(endpoint_.host));
    beast::get_lowest_layer(stream).expires_after(timeout_);
    return Exchange(ioc, stream, endpoints, endpoint_, body);
  }

  beast::tcp_stream stream(ioc);
  stream.expires_after(timeout_);
  return Exchange(ioc, stream, endpoints, endpoint_, body);
}

} // namespace faucet::chain
