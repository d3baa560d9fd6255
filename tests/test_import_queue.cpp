#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>
#include "import_queue.h"
#include "asset_manager.h"
#include "test_helpers.h"

namespace fs = std::filesystem;

namespace {
// Waits until predicate holds or the timeout expires
template <typename Predicate>
bool wait_for(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}
}

TEST_CASE("ImportQueue runs queued imports in order", "[import_queue]") {
    fs::path base = create_temp_dir("asset_shelf_test_import_queue");
    Config config = create_test_config(base, base / "library");
    AssetManager manager(config);
    REQUIRE(manager.open());

    std::mutex mutation_mutex;
    std::mutex results_mutex;
    std::vector<ImportResult> results;
    auto on_complete = [&](const ImportResult& result) {
        std::lock_guard<std::mutex> lock(results_mutex);
        results.push_back(result);
    };

    {
        ImportQueue queue(manager, mutation_mutex);
        REQUIRE(queue.start());

        AddAssetRequest first;
        first.source_path = create_temp_file(base / "sources", "rock.txt", "rock");
        AddAssetRequest broken;
        broken.source_path = base / "sources" / "missing.txt";
        AddAssetRequest second;
        second.source_path = create_temp_file(base / "sources", "grass.txt", "grass");

        uint64_t first_id = queue.queue_import(first, on_complete);
        queue.queue_import(broken, on_complete);
        queue.queue_import(second, on_complete);

        REQUIRE(wait_for([&] {
            std::lock_guard<std::mutex> lock(results_mutex);
            return results.size() == 3;
        }));
        REQUIRE_FALSE(queue.has_pending_work());
        REQUIRE(queue.get_failed_count() == 1);
        REQUIRE(queue.get_progress() == 1.0f);

        std::lock_guard<std::mutex> lock(results_mutex);
        REQUIRE(results.size() == 3);
        REQUIRE(results[0].request_id == first_id);
        REQUIRE(results[0].asset.has_value());
        REQUIRE_FALSE(results[1].asset.has_value());
        REQUIRE_FALSE(results[1].error.empty());
        REQUIRE_FALSE(results[1].cancelled);
        REQUIRE(results[2].asset.has_value());
    }

    std::lock_guard<std::mutex> lock(mutation_mutex);
    REQUIRE(manager.get_all_asset_names() == std::vector<std::string>{"rock.txt", "grass.txt"});

    cleanup_temp_dir(base);
}

TEST_CASE("ImportQueue cancel and clear", "[import_queue]") {
    fs::path base = create_temp_dir("asset_shelf_test_import_queue_cancel");
    Config config = create_test_config(base, base / "library");
    AssetManager manager(config);
    REQUIRE(manager.open());

    for (int i = 0; i < 20; i++) {
        create_temp_file(base / "sources" / "pack", "file" + std::to_string(i) + ".txt", "data");
    }

    std::mutex mutation_mutex;
    std::mutex state_mutex;
    std::condition_variable state_changed;
    bool copy_started = false;
    bool release_copy = false;
    std::vector<ImportResult> results;

    ImportQueue queue(manager, mutation_mutex);

    // Hold the first import inside its first file copy until the test says so
    queue.set_progress_callback([&](size_t, size_t, const std::string&) {
        std::unique_lock<std::mutex> lock(state_mutex);
        copy_started = true;
        state_changed.notify_all();
        state_changed.wait(lock, [&] { return release_copy; });
    });

    auto on_complete = [&](const ImportResult& result) {
        std::lock_guard<std::mutex> lock(state_mutex);
        results.push_back(result);
        state_changed.notify_all();
    };

    AddAssetRequest pack;
    pack.source_path = base / "sources" / "pack";
    AddAssetRequest later;
    later.source_path = create_temp_file(base / "sources", "later.txt");

    REQUIRE(queue.start());
    queue.queue_import(pack, on_complete);
    queue.queue_import(later, on_complete);

    {
        std::unique_lock<std::mutex> lock(state_mutex);
        REQUIRE(state_changed.wait_for(lock, std::chrono::seconds(5), [&] { return copy_started; }));
    }
    REQUIRE(queue.is_processing());

    queue.clear_queue();
    REQUIRE(queue.get_queue_size() == 0);
    queue.cancel_current();

    {
        std::unique_lock<std::mutex> lock(state_mutex);
        release_copy = true;
        state_changed.notify_all();
        REQUIRE(state_changed.wait_for(lock, std::chrono::seconds(5), [&] { return !results.empty(); }));
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].cancelled);
        REQUIRE_FALSE(results[0].asset.has_value());
    }

    REQUIRE(wait_for([&] { return !queue.has_pending_work(); }));
    queue.stop();

    REQUIRE(manager.get_all_assets().empty());
    REQUIRE(count_library_content(base / "library") == 0);

    cleanup_temp_dir(base);
}

TEST_CASE("ImportQueue progress can be polled while an import holds the library", "[import_queue]") {
    fs::path base = create_temp_dir("asset_shelf_test_import_queue_status");
    Config config = create_test_config(base, base / "library");
    AssetManager manager(config);
    REQUIRE(manager.open());
    create_temp_file(base / "sources" / "pack", "a.txt", "a");

    std::mutex mutation_mutex;
    std::mutex state_mutex;
    std::condition_variable state_changed;
    bool copy_started = false;
    bool release_copy = false;
    bool library_locked_in_callback = false;
    std::atomic<bool> finished(false);

    ImportQueue queue(manager, mutation_mutex);
    REQUIRE_FALSE(queue.get_current_status().has_value());

    queue.set_progress_callback([&](size_t, size_t, const std::string&) {
        std::unique_lock<std::mutex> lock(state_mutex);
        if (copy_started) {
            return;
        }
        // The worker still owns the mutation mutex here
        if (mutation_mutex.try_lock()) {
            mutation_mutex.unlock();
        }
        else {
            library_locked_in_callback = true;
        }
        copy_started = true;
        state_changed.notify_all();
        state_changed.wait(lock, [&] { return release_copy; });
    });

    AddAssetRequest pack;
    pack.source_path = base / "sources" / "pack";
    REQUIRE(queue.start());
    uint64_t request_id = queue.queue_import(pack, [&](const ImportResult&) { finished = true; });

    {
        std::unique_lock<std::mutex> lock(state_mutex);
        REQUIRE(state_changed.wait_for(lock, std::chrono::seconds(5), [&] { return copy_started; }));
        REQUIRE(library_locked_in_callback);
    }

    auto status = queue.get_current_status();
    REQUIRE(status.has_value());
    REQUIRE(status->request_id == request_id);
    REQUIRE(status->total == 1);
    REQUIRE(status->message == "Copying a.txt");

    {
        std::lock_guard<std::mutex> lock(state_mutex);
        release_copy = true;
    }
    state_changed.notify_all();

    REQUIRE(wait_for([&] { return finished.load(); }));
    REQUIRE_FALSE(queue.get_current_status().has_value());
    queue.stop();

    std::lock_guard<std::mutex> lock(mutation_mutex);
    REQUIRE(manager.get_all_asset_names() == std::vector<std::string>{"pack"});

    cleanup_temp_dir(base);
}
