#include "dispatch_worker.hpp"

#include <algorithm>

#include "internal/ledger/ledger_state_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/submit/transaction_submitter.hpp"

namespace faucet::dispatch {

namespace {

// Retry period while the ledger has never been reconciled.
constexpr util::Millis kStartupRetry{2000};

} // namespace

DispatchWorker::DispatchWorker(std::shared_ptr<DispatchQueue>                queue,
                               std::shared_ptr<submit::TransactionSubmitter> submitter,
                               std::shared_ptr<ledger::LedgerStateCache>     ledger,
                               util::Millis                                  reconcile_interval)
    : queue_(std::move(queue)),
      submitter_(std::move(submitter)),
      ledger_(std::move(ledger)),
      reconcile_interval_(reconcile_interval) {
}

DispatchWorker::~DispatchWorker() {
  Stop(util::Millis{0});
}

void DispatchWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(exit_mutex_);
    exited_ = false;
  }
  thread_ = std::thread(&DispatchWorker::Run, this);
}

void DispatchWorker::Stop(util::Millis drain_timeout) {
  running_ = false;
  queue_->Shutdown();

  if (!thread_.joinable()) {
    return;
  }

  {
    std::unique_lock lock(exit_mutex_);
    if (!exit_cv_.wait_for(lock, drain_timeout, [&] { return exited_; })) {
      FAUCET_LOG_WARN("drain timeout reached, interrupting current job");
      lock.unlock();
      submitter_->Interrupt();
    }
  }
  thread_.join();
}

bool DispatchWorker::TryReconcile(const char* reason) {
  try {
    const auto floor = ledger_->Reconcile();
    FAUCET_LOG_DEBUG("ledger reconciled", {observability::StringField("reason", reason), observability::U64Field("floor", floor)});
    return true;
  } catch (const std::exception& e) {
    FAUCET_LOG_WARN("ledger reconcile failed", {observability::StringField("reason", reason), observability::ErrorField(e)});
    return false;
  }
}

void DispatchWorker::Run() {
  bool reconciled = TryReconcile("startup");

  while (running_) {
    const auto idle_wait = reconciled ? reconcile_interval_ : std::min(reconcile_interval_, kStartupRetry);
    if (!queue_->WaitForWork(idle_wait)) {
      if (!running_ || queue_->is_shutdown()) {
        break;
      }
      reconciled = TryReconcile(reconciled ? "idle" : "startup retry") || reconciled;
      continue;
    }

    auto cursor = queue_->Drain();
    while (auto job = cursor.Next()) {
      try {
        queue_->Complete(*job, submitter_->Process(**job));
      } catch (const std::exception& e) {
        FAUCET_LOG_ERROR("job completion failed",
                         {observability::U64Field("job_id", (*job)->id()), observability::ErrorField(e)});
      }
    }
  }

  {
    std::lock_guard lock(exit_mutex_);
    exited_ = true;
  }
  exit_cv_.notify_all();
}

} // namespace faucet::dispatch
