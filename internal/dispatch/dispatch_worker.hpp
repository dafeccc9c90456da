#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/dispatch/dispatch_queue.hpp"

namespace faucet::submit {
class TransactionSubmitter;
}

namespace faucet::ledger {
class LedgerStateCache;
}

namespace faucet::dispatch {

/*
  The single consumer of the dispatch queue.

  Runs the submitter on each job in arrival order and reconciles the ledger
  whenever it has been idle for a reconcile interval.
*/
class DispatchWorker {
 public:
  DispatchWorker(std::shared_ptr<DispatchQueue>                queue,
                 std::shared_ptr<submit::TransactionSubmitter> submitter,
                 std::shared_ptr<ledger::LedgerStateCache>     ledger,
                 util::Millis                                  reconcile_interval);
  ~DispatchWorker();

  void Start();

  // Abandons queued jobs, lets the current job run for up to drain_timeout,
  // then interrupts it and joins the thread.
  void Stop(util::Millis drain_timeout);

 private:
  void Run();
  bool TryReconcile(const char* reason);

  std::shared_ptr<DispatchQueue>                queue_;
  std::shared_ptr<submit::TransactionSubmitter> submitter_;
  std::shared_ptr<ledger::LedgerStateCache>     ledger_;
  util::Millis                                  reconcile_interval_;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  std::mutex              exit_mutex_;
  std::condition_variable exit_cv_;
  bool                    exited_ = false;
};

} // namespace faucet::dispatch
