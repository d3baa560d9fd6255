#include "import_queue.h"

#include <chrono>

#include "errors.h"
#include "logger.h"

ImportQueue::ImportQueue(AssetManager& manager, std::mutex& mutation_mutex)
  : manager_(manager), mutation_mutex_(mutation_mutex), running_(false), processing_(false),
  cancel_requested_(false), next_request_id_(1), total_requests_queued_(0), total_requests_processed_(0),
  failed_count_(0) {
}

ImportQueue::~ImportQueue() {
  stop();
}

bool ImportQueue::start() {
  if (running_) {
    return true; // Already running
  }

  running_ = true;
  processing_thread_ = std::thread(&ImportQueue::process_requests, this);

  LOG_INFO("ImportQueue started");
  return true;
}

void ImportQueue::stop() {
  if (!running_) {
    return; // Already stopped
  }

  running_ = false;
  cancel_requested_ = true;
  queue_condition_.notify_all();

  if (processing_thread_.joinable()) {
    processing_thread_.join();
  }

  LOG_INFO("ImportQueue stopped. Total processed: {}", total_requests_processed_.load());
}

uint64_t ImportQueue::queue_import(const AddAssetRequest& request, ImportCompletionCallback on_complete) {
  const uint64_t request_id = next_request_id_++;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    request_queue_.push(PendingImport{request_id, request, std::move(on_complete)});
    total_requests_queued_++;
  }
  queue_condition_.notify_one();
  LOG_DEBUG("Queued import #{}: {}", request_id, request.source_path.u8string());
  return request_id;
}

void ImportQueue::cancel_current() {
  if (processing_) {
    cancel_requested_ = true;
    LOG_INFO("Cancelling running import");
  }
}

void ImportQueue::clear_queue() {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  size_t dropped = request_queue_.size();
  std::queue<PendingImport> empty_queue;
  request_queue_.swap(empty_queue);

  // Dropped requests will never be processed
  total_requests_queued_ -= dropped;
  LOG_INFO("Cleared {} pending imports", dropped);
}

void ImportQueue::set_progress_callback(ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  progress_callback_ = std::move(callback);
}

std::optional<ImportStatus> ImportQueue::get_current_status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return current_status_;
}

size_t ImportQueue::get_queue_size() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return request_queue_.size();
}

void ImportQueue::process_requests() {
  while (running_) {
    PendingImport pending;

    // Wait for a request or shutdown signal
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_condition_.wait(lock, [this] { return !request_queue_.empty() || !running_; });

      if (!running_) {
        break;
      }

      pending = std::move(request_queue_.front());
      request_queue_.pop();
      cancel_requested_ = false;
      processing_ = true;
    }

    ImportResult result = process_request(pending);
    if (!result.asset) {
      failed_count_++;
    }
    total_requests_processed_++;
    processing_ = false;

    if (pending.on_complete) {
      pending.on_complete(result);
    }
  }
}

ImportResult ImportQueue::process_request(const PendingImport& pending) {
  ImportResult result;
  result.request_id = pending.request_id;
  result.request = pending.request;

  auto start_time = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    current_status_ = ImportStatus{pending.request_id, 0, 0, "Waiting for the library"};
  }

  ProgressCallback progress = [this, &pending](size_t current, size_t total, const std::string& message) {
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      current_status_ = ImportStatus{pending.request_id, current, total, message};
    }
    std::lock_guard<std::mutex> lock(progress_mutex_);
    if (progress_callback_) {
      progress_callback_(current, total, message);
    }
  };

  try {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    result.asset = manager_.add_asset(pending.request, progress, &cancel_requested_);
  }
  catch (const ImportCancelledError& e) {
    result.cancelled = true;
    result.error = e.what();
    LOG_INFO("Import #{} cancelled", pending.request_id);
  }
  catch (const AssetShelfError& e) {
    result.error = e.what();
    LOG_ERROR("Import #{} of {} failed: {}", pending.request_id, pending.request.source_path.u8string(), e.what());
  }
  catch (const std::exception& e) {
    // Unexpected failures (filesystem, allocation) must not take the worker thread down
    result.error = e.what();
    LOG_ERROR("Import #{} of {} failed unexpectedly: {}", pending.request_id,
      pending.request.source_path.u8string(), e.what());
  }

  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    current_status_.reset();
  }

  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
  if (result.asset) {
    LOG_INFO("Import #{} completed in {}ms ({}/{} processed)", pending.request_id, duration.count(),
      total_requests_processed_.load() + 1, total_requests_queued_.load());
  }
  return result;
}
