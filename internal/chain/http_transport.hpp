#pragma once

#include <chrono>
#include <string>

namespace faucet::chain {

struct HttpResponse {
  unsigned    status = 0;
  std::string body;
};

/*
  Carries one JSON-RPC POST to the node.

  Implementations throw ChainError:
    kUnavailable if the request body was never fully written,
    kTimeout     if it was written but no complete response arrived.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Post(const std::string& body) = 0;
};

struct Endpoint {
  bool        tls = false;
  std::string host;
  std::string port;
  std::string target = "/";
};

// Parses http://host[:port][/path] and https://... Throws util::InvalidArgument.
Endpoint ParseEndpoint(const std::string& url);

/*
  Boost.Beast client, one connection per call, bounded by a per-call deadline.
*/
class BeastHttpTransport final : public HttpTransport {
 public:
  BeastHttpTransport(const std::string& url, std::chrono::milliseconds timeout);

  HttpResponse Post(const std::string& body) override;

 private:
  Endpoint                  endpoint_;
  std::chrono::milliseconds timeout_;
};

} // namespace faucet::chain
