#include <gtest/gtest.h>
#include "utilities/metrics.h"

#include <thread>
#include <vector>

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    std::map<std::string,std::string> labels{{"k","v"},{"a","b"}};
    std::string formatted = MetricsRegistry::labelsToString(labels);
    // Map iteration is ordered, so "a" should come before "k".
    EXPECT_EQ(formatted, "{a=\"b\",k=\"v\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().setGauge("dedupfs_store_chunks", 12, {{"backend","local_fs"}});
    MetricsRegistry::instance().incrementCounter("dedupfs_bytes_ingested_total", 3);
    MetricsRegistry::instance().observe("dedupfs_chunk_size_bytes", 1.5);
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("dedupfs_store_chunks{backend=\"local_fs\"} 12"), std::string::npos);
    EXPECT_NE(metrics.find("dedupfs_bytes_ingested_total 3"), std::string::npos);
    EXPECT_NE(metrics.find("dedupfs_chunk_size_bytes_sum 1.5"), std::string::npos);
    EXPECT_NE(metrics.find("dedupfs_chunk_size_bytes_count 1"), std::string::npos);
    MetricsRegistry::instance().reset();
    EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

/**
 * @brief Labelled histograms keep the labels after the suffix.
 */
TEST(MetricsRegistry, HistogramLabelsFollowSuffix) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().observe("restore_seconds", 2, {{"backend","memory"}});
    MetricsRegistry::instance().observe("restore_seconds", 4, {{"backend","memory"}});
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("restore_seconds_sum{backend=\"memory\"} 6"), std::string::npos);
    EXPECT_NE(metrics.find("restore_seconds_count{backend=\"memory\"} 2"), std::string::npos);
    MetricsRegistry::instance().reset();
}

TEST(MetricsRegistry, ValueLookups) {
    MetricsRegistry::instance().reset();
    auto& registry = MetricsRegistry::instance();
    EXPECT_DOUBLE_EQ(registry.counterValue("never_set"), 0.0);
    registry.incrementCounter("dedupfs_restore_failures_total", 1, {{"reason","missing_chunk"}});
    registry.incrementCounter("dedupfs_restore_failures_total", 1, {{"reason","missing_chunk"}});
    registry.setGauge("dedupfs_store_chunks", 4);
    registry.setGauge("dedupfs_store_chunks", 7);
    EXPECT_DOUBLE_EQ(registry.counterValue("dedupfs_restore_failures_total", {{"reason","missing_chunk"}}), 2.0);
    EXPECT_DOUBLE_EQ(registry.counterValue("dedupfs_restore_failures_total", {{"reason","corrupt_chunk"}}), 0.0);
    std::string text = registry.toPrometheus();
    EXPECT_NE(text.find("dedupfs_store_chunks 7\n"), std::string::npos);
    EXPECT_EQ(text.find("dedupfs_store_chunks 4"), std::string::npos);
    registry.reset();
}

TEST(MetricsRegistry, ConcurrentIncrements) {
    MetricsRegistry::instance().reset();
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([] {
            for (int i = 0; i < 1000; ++i) {
                MetricsRegistry::instance().incrementCounter("hits_total");
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_DOUBLE_EQ(MetricsRegistry::instance().counterValue("hits_total"), 8000.0);
    MetricsRegistry::instance().reset();
}
