#include <gtest/gtest.h>
#include "dedup_test_utils.hpp"
#include "utilities/chunk_store.hpp"
#include "utilities/file_io.hpp"
#include "utilities/file_manager.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace dedupfs;
namespace fs = std::filesystem;

/** Count in-flight temporary files left anywhere under @p root. */
static std::size_t countTempFiles(const fs::path& root) {
    std::size_t count = 0;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (utils::is_temp_file_name(entry.path().filename().string())) {
            ++count;
        }
    }
    return count;
}

/**
 * @brief Many threads ingest the same buffer into one file store.
 * Every thread must produce the same recipe and the store must hold each
 * distinct chunk exactly once.
 */
TEST(ConcurrencyTest, ParallelIngestOfSameBuffer) {
    ScopedTempDir dir("concurrent_same");
    auto store = std::make_shared<FileChunkStore>(dir.path());
    FileManager manager(store);
    auto data = randomBytes(256 * 1024, 404);
    Recipe expected = FileManager(std::make_shared<MemoryChunkStore>()).ingest(data);

    const int kThreads = 8;
    std::vector<Recipe> recipes(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] { recipes[t] = manager.ingest(data); });
    }
    for (auto& th : threads) th.join();

    for (const auto& r : recipes) {
        EXPECT_EQ(r, expected);
    }
    const auto digests = expected.digests();
    std::set<std::string> distinct(digests.begin(), digests.end());
    EXPECT_EQ(store->size(), distinct.size());
    EXPECT_EQ(countTempFiles(dir.path()), 0u);

    StoreStats stats = store->stats();
    EXPECT_EQ(stats.puts, kThreads * expected.chunks.size());
    EXPECT_EQ(stats.puts - stats.dedup_hits, distinct.size());
    EXPECT_EQ(manager.restore(expected), data);
}

/**
 * @brief Threads ingesting different buffers do not interfere.
 */
TEST(ConcurrencyTest, ParallelIngestOfDistinctBuffers) {
    ScopedTempDir dir("concurrent_distinct");
    auto store = std::make_shared<FileChunkStore>(dir.path());
    FileManager manager(store);

    const int kThreads = 6;
    std::vector<std::vector<std::byte>> inputs;
    for (int t = 0; t < kThreads; ++t) {
        inputs.push_back(randomBytes(96 * 1024, 500 + t));
    }
    std::vector<Recipe> recipes(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] { recipes[t] = manager.ingest(inputs[t]); });
    }
    for (auto& th : threads) th.join();

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(manager.restore(recipes[t]), inputs[t]) << "thread " << t;
    }
    EXPECT_EQ(countTempFiles(dir.path()), 0u);
}

/**
 * @brief Concurrent puts of one chunk publish a single readable entry.
 */
TEST(ConcurrencyTest, ConcurrentPutOfOneChunk) {
    ScopedTempDir dir("concurrent_put");
    FileChunkStore store(dir.path());
    auto bytes = randomBytes(8192, 606);
    std::atomic<int> inserted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 16; ++t) {
        threads.emplace_back([&] {
            if (store.store(bytes).inserted) {
                inserted.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(inserted.load(), 1);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get(store.digestOf(bytes)), bytes);
}

/**
 * @brief Readers restoring while writers add unrelated files always see
 * complete chunks.
 */
TEST(ConcurrencyTest, RestoreWhileIngesting) {
    ScopedTempDir dir("concurrent_mixed");
    auto store = std::make_shared<FileChunkStore>(dir.path());
    FileManager manager(store);
    auto base = randomBytes(128 * 1024, 707);
    Recipe recipe = manager.ingest(base);

    std::atomic<bool> failed{false};
    std::thread writer([&] {
        for (uint32_t i = 0; i < 8; ++i) {
            manager.ingest(randomBytes(32 * 1024, 800 + i));
        }
    });
    std::thread reader([&] {
        for (int i = 0; i < 8; ++i) {
            if (manager.restore(recipe) != base) {
                failed = true;
            }
        }
    });
    writer.join();
    reader.join();
    EXPECT_FALSE(failed.load());
}
