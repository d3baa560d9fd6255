#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "asset.h"
#include "asset_manager.h"

// Outcome of one queued import
struct ImportResult {
  uint64_t request_id;
  AddAssetRequest request;
  std::optional<Asset> asset; // Set when the import succeeded
  std::string error;          // Set when it failed
  bool cancelled = false;
};

using ImportCompletionCallback = std::function<void(const ImportResult& result)>;

// Latest progress report of the running import
struct ImportStatus {
  uint64_t request_id;
  size_t current;
  size_t total;
  std::string message;
};

// Background worker that runs queued imports one at a time against an AssetManager.
// Every call into the manager holds the caller-owned mutation mutex, so the
// hosting application keeps a single writer while the copy runs off its thread.
class ImportQueue {
public:
  ImportQueue(AssetManager& manager, std::mutex& mutation_mutex);
  ~ImportQueue();

  // Start/stop the background processing thread
  bool start();
  void stop();

  // Returns the request id handed back in the completion callback
  uint64_t queue_import(const AddAssetRequest& request, ImportCompletionCallback on_complete = nullptr);

  // Stops the running import between two file copies; it completes as cancelled
  void cancel_current();
  // Drops requests that have not started yet, without calling their callbacks
  void clear_queue();

  // Optional per-file progress of the running import.
  // The callback runs on the worker thread while the mutation mutex is held, so it
  // must not lock that mutex or call into the AssetManager. Threads that need the
  // library poll get_current_status() instead.
  void set_progress_callback(ProgressCallback callback);
  // Empty while idle; never blocks on the mutation mutex
  std::optional<ImportStatus> get_current_status() const;

  bool is_processing() const { return processing_; }
  size_t get_queue_size() const;

  // Progress tracking
  size_t get_total_queued() const { return total_requests_queued_.load(); }
  size_t get_total_processed() const { return total_requests_processed_.load(); }
  size_t get_failed_count() const { return failed_count_.load(); }
  float get_progress() const {
    size_t queued = total_requests_queued_.load();
    size_t processed = total_requests_processed_.load();
    return queued > 0 ? (float) processed / queued : 1.0f;
  }
  bool has_pending_work() const { return total_requests_queued_ > total_requests_processed_; }
  void reset_progress_counters() {
    if (total_requests_queued_ == total_requests_processed_) {
      total_requests_queued_.store(0);
      total_requests_processed_.store(0);
      failed_count_.store(0);
    }
  }

private:
  struct PendingImport {
    uint64_t request_id;
    AddAssetRequest request;
    ImportCompletionCallback on_complete;
  };

  // Background thread function
  void process_requests();
  ImportResult process_request(const PendingImport& pending);

  AssetManager& manager_;
  std::mutex& mutation_mutex_;

  // Processing thread and synchronization
  std::thread processing_thread_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_condition_;
  std::queue<PendingImport> request_queue_;
  std::mutex progress_mutex_;
  ProgressCallback progress_callback_;
  mutable std::mutex status_mutex_;
  std::optional<ImportStatus> current_status_;

  std::atomic<bool> running_;
  std::atomic<bool> processing_;
  std::atomic<bool> cancel_requested_;
  std::atomic<uint64_t> next_request_id_;

  std::atomic<size_t> total_requests_queued_;
  std::atomic<size_t> total_requests_processed_;
  std::atomic<size_t> failed_count_;
};
