#include "transfer_engine.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

#include "errors.hpp"
#include "session_guard.hpp"

std::chrono::milliseconds RetryPolicy::delay(std::size_t attempt) const {
  const std::size_t shift = std::min<std::size_t>(attempt, 30);
  const std::chrono::milliseconds growth =
    unit * static_cast<std::chrono::milliseconds::rep>((1ULL << shift) - 1);
  return std::min(cap, floor + growth);
}

TransferConfig TransferConfig::from_settings(const SettingsManager& settings) {
  TransferConfig config;
  config.connections = static_cast<std::size_t>(std::max(1, settings.get<int>("connections")));
  config.retry.attempts = static_cast<std::size_t>(std::max(1, settings.get<int>("retries")));
  config.retry.floor = std::chrono::milliseconds(std::max(0, settings.get<int>("backoff_floor_ms")));
  config.retry.unit = std::chrono::milliseconds(std::max(0, settings.get<int>("backoff_unit_ms")));
  config.retry.cap = std::chrono::milliseconds(std::max(0, settings.get<int>("backoff_cap_ms")));
  return config;
}

void run_transfer_item(PathOperations& ops,
                       const TransferItem& item,
                       TransferKind kind,
                       bool* creating) {
  if(kind == TransferKind::Upload) {
    ops.upload_one(item.src, item.dst, item.overwrite, item.create_dirs, creating);
  } else {
    ops.download_one(item.src, item.dst, item.overwrite, item.create_dirs);
  }
}

// One pool slot: owns (or borrows) its session for its whole life. The
// session is opened on first use and reopened after the connection was
// lost, so a failed open costs the current item one attempt.
class TransferEngine::Worker {
public:
  Worker(std::size_t id,
         const SessionResolver& resolver,
         SessionRequest request,
         std::shared_ptr<Logger> logger)
    : id_(id), resolver_(resolver), request_(std::move(request)), logger_(std::move(logger)) {}

  std::size_t id() const { return id_; }

  Session& session() {
    if(!guard_) guard_ = std::make_unique<SessionGuard>(resolver_, request_, logger_);
    return guard_->session();
  }

  void drop_session() {
    if(guard_ && guard_->owns_session()) guard_.reset();
  }

private:
  std::size_t id_;
  const SessionResolver& resolver_;
  SessionRequest request_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<SessionGuard> guard_;
};

TransferEngine::TransferEngine(const SessionResolver& resolver,
                               TransferConfig config,
                               std::shared_ptr<Logger> logger)
  : resolver_(resolver),
    config_(std::move(config)),
    logger_(std::move(logger)) {
  if(config_.connections == 0) config_.connections = 1;
  if(config_.retry.attempts == 0) config_.retry.attempts = 1;
}

bool TransferEngine::backoff(std::size_t attempt, const CancellationToken* cancel) const {
  auto wait = config_.retry.delay(attempt);
  if(cancel) return !cancel->wait_for(wait);
  std::this_thread::sleep_for(wait);
  return true;
}

TransferEngine::Outcome TransferEngine::transfer_with_retry(Worker& worker,
                                                            const TransferItem& item,
                                                            TransferKind kind,
                                                            const CancellationToken* cancel) {
  const std::size_t attempts = config_.retry.attempts;
  TransferItem current = item;
  std::string last_error;
  for(std::size_t attempt = 0; attempt < attempts; ++attempt) {
    if(cancel && cancel->cancelled()) return Outcome::Cancelled;
    bool creating = false;
    try {
      Session* session = nullptr;
      try {
        session = &worker.session();
      } catch(const BulkFtpError& e) {
        log_error(logger_.get(), "Worker {} could not open a session: {}", worker.id(), e.what());
        throw;
      }
      PathOperations ops(*session, logger_);
      run_transfer_item(ops, current, kind, &creating);
      return Outcome::Done;
    } catch(const RemoteError& e) {
      last_error = e.what();
      if(e.code() == 0) worker.drop_session();
    } catch(const std::exception& e) {
      last_error = e.what();
    }
    if(creating && !current.overwrite) {
      // whatever STOR left behind is ours to replace
      log_info(logger_.get(), "Partial upload of {} may remain at {}, overwriting on retry",
               current.src, current.dst);
      current.overwrite = true;
    }
    log_info(logger_.get(), "Retry {} on data transfer {}: {}", attempt + 1, item.src, last_error);
    if(attempt + 1 < attempts && !backoff(attempt, cancel)) return Outcome::Cancelled;
  }
  log_error(logger_.get(), "Giving up on {} after {} attempts: {}", item.src, attempts, last_error);
  return Outcome::Failed;
}

TransferResult TransferEngine::run_batch(std::vector<TransferItem> items,
                                         TransferKind kind,
                                         const SessionRequest& request,
                                         const CancellationToken* cancel) {
  TransferResult result;
  if(items.empty()) return result;

  // decode credentials once, and fail fast on an unknown server
  SessionRequest worker_request = request;
  if(!request.session && !request.login) {
    auto name = request.server.value_or(resolver_.settings().get<std::string>("default_server"));
    worker_request.login = resolver_.descriptor_for_server(name);
    worker_request.server.reset();
  }

  std::size_t worker_count = request.session ? 1 : std::min(config_.connections, items.size());

  std::mutex job_mutex;
  std::deque<TransferItem> job_queue(std::make_move_iterator(items.begin()),
                                     std::make_move_iterator(items.end()));
  std::mutex result_mutex;

  auto take_job = [&]() -> std::optional<TransferItem> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(job_queue.empty()) return std::nullopt;
    TransferItem item = std::move(job_queue.front());
    job_queue.pop_front();
    return item;
  };

  auto record = [&](Outcome outcome, const std::string& src) {
    if(outcome == Outcome::Done) return;
    std::lock_guard<std::mutex> lock(result_mutex);
    if(outcome == Outcome::Failed) {
      result.failed.push_back(src);
    } else {
      result.cancelled.push_back(src);
    }
  };

  auto worker_fn = [&](std::size_t worker_id) {
    Worker worker(worker_id, resolver_, worker_request, logger_);
    while(auto item = take_job()) {
      if(cancel && cancel->cancelled()) {
        record(Outcome::Cancelled, item->src);
        continue;
      }
      record(transfer_with_retry(worker, *item, kind, cancel), item->src);
    }
  };

  log_debug(logger_.get(), "Transferring {} items with {} workers", items.size(), worker_count);
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for(std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker_fn, i);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }
  return result;
}
