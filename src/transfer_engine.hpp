#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "log.hpp"
#include "path_operations.hpp"
#include "session_resolver.hpp"
#include "settings_manager.hpp"

enum class TransferKind { Upload, Download };

struct TransferItem {
  std::string src;
  std::string dst;
  bool overwrite = false;
  bool create_dirs = false;
};

// Sources that did not make it. Anything not listed was fully transferred.
struct TransferResult {
  std::vector<std::string> failed;
  std::vector<std::string> cancelled;

  bool ok() const { return failed.empty() && cancelled.empty(); }
};

// Wait before retry i is floor + unit * (2^i - 1), capped.
struct RetryPolicy {
  std::size_t attempts = 5;
  std::chrono::milliseconds floor{200};
  std::chrono::milliseconds unit{500};
  std::chrono::milliseconds cap{60000};

  std::chrono::milliseconds delay(std::size_t attempt) const;
};

struct TransferConfig {
  std::size_t connections = 5;
  RetryPolicy retry;

  static TransferConfig from_settings(const SettingsManager& settings);
};

// `creating` is forwarded to PathOperations::upload_one for uploads.
void run_transfer_item(PathOperations& ops,
                       const TransferItem& item,
                       TransferKind kind,
                       bool* creating = nullptr);

// Drains a batch with a fixed pool of workers, one session per worker.
// Per-item failures are retried and then reported, never thrown.
class TransferEngine {
public:
  TransferEngine(const SessionResolver& resolver,
                 TransferConfig config,
                 std::shared_ptr<Logger> logger = nullptr);

  // Throws ConfigurationError when the request names an unknown server.
  // A borrowed session in `request` runs the batch on that one session.
  TransferResult run_batch(std::vector<TransferItem> items,
                           TransferKind kind,
                           const SessionRequest& request = {},
                           const CancellationToken* cancel = nullptr);

  const TransferConfig& config() const { return config_; }

private:
  enum class Outcome { Done, Failed, Cancelled };

  class Worker;

  Outcome transfer_with_retry(Worker& worker,
                              const TransferItem& item,
                              TransferKind kind,
                              const CancellationToken* cancel);
  bool backoff(std::size_t attempt, const CancellationToken* cancel) const;

  const SessionResolver& resolver_;
  TransferConfig config_;
  std::shared_ptr<Logger> logger_;
};
