#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/chain/chain_error.hpp"
#include "internal/chain/http_transport.hpp"

namespace faucet::testing {

/*
  Replays canned HTTP responses and records request bodies.
*/
class ScriptedTransport final : public chain::HttpTransport {
 public:
  void Reply(unsigned status, std::string body) {
    std::lock_guard lock(mutex_);
    steps_.push_back({status, std::move(body), std::nullopt});
  }

  void Fail(chain::ChainErrorKind kind) {
    std::lock_guard lock(mutex_);
    steps_.push_back({0, {}, kind});
  }

  std::vector<std::string> requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  chain::HttpResponse Post(const std::string& body) override {
    std::lock_guard lock(mutex_);
    requests_.push_back(body);
    if (steps_.empty()) {
      throw std::logic_error("unexpected request: " + body);
    }
    auto step = steps_.front();
    steps_.pop_front();
    if (step.failure) {
      throw chain::ChainError(*step.failure, "scripted transport failure");
    }
    return {step.status, step.body};
  }

 private:
  struct Step {
    unsigned                             status;
    std::string                          body;
    std::optional<chain::ChainErrorKind> failure;
  };

  mutable std::mutex       mutex_;
  std::deque<Step>         steps_;
  std::vector<std::string> requests_;
};

} // namespace faucet::testing
