#pragma once
#include <array>
#include <atomic>
#include <limits>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include "td/utils/ThreadLocalStorage.h"

// Exponential buckets: 1, 2, 3, 4, 6, 9, ... up to uint64 max
constexpr size_t bucket_count() {
  size_t count = 2;
  double bucket_val = 2.0;
  constexpr double max = static_cast<double>(std::numeric_limits<uint64_t>::max());
  while ((bucket_val = 1.5 * bucket_val) <= max) {
    ++count;
  }
  return count;
}

consteval auto bucket_limits() {
  std::array<uint64_t, bucket_count()> limits{};
  limits[0] = 1;
  limits[1] = 2;
  size_t i = 2;
  double bucket_val = 2.0;
  constexpr double max = static_cast<double>(std::numeric_limits<uint64_t>::max());
  while ((bucket_val = 1.5 * bucket_val) <= max) {
    limits[i++] = static_cast<uint64_t>(bucket_val);
  }
  return limits;
}

inline constexpr auto histogram_bucket_limits = bucket_limits();

class HistogramImpl {
public:
  HistogramImpl() = default;
  void add(uint64_t value, size_t count = 1);
  uint64_t get_count() const;
  uint64_t get_sum() const;
  uint64_t get_max() const;
  double compute_percentile(double percentile) const;
  void merge(const HistogramImpl &other);
  void reset();

private:
  static size_t index_for_value(uint64_t value);
  static void update_max(std::atomic<uint64_t> &max, uint64_t value);

  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_{0};
  std::atomic<uint64_t> max_{0};
  std::atomic<uint64_t> buckets_[bucket_count()];
  mutable std::mutex mutex_;
};

enum Ticker : uint32_t {
  TRACE_RECEIVED = 0,
  TRACE_LOAD_ERROR,
  TRACE_IN_PROGRESS,
  ENRICH_TRACE_ERROR,
  TICKERS_COUNT
};

enum Histogram : uint32_t {
  LOAD_TRACE = 0,
  ENRICH_TRACE,
  SOURCE_QUERY,
  WRITE_TRACE,
  HISTOGRAMS_COUNT
};

const std::unordered_map<uint32_t, std::string_view> ticker_names = {
    {TRACE_RECEIVED, "enricher.trace.received"},
    {TRACE_LOAD_ERROR, "enricher.trace.load.error"},
    {TRACE_IN_PROGRESS, "enricher.trace.in_progress"},
    {ENRICH_TRACE_ERROR, "enricher.enrich.trace.error"},
};
const std::unordered_map<uint32_t, std::string_view> histogram_names = {
    {LOAD_TRACE, "enricher.load.trace.micros"},
    {ENRICH_TRACE, "enricher.enrich.trace.micros"},
    {SOURCE_QUERY, "enricher.source.query.micros"},
    {WRITE_TRACE, "enricher.write.trace.micros"},
};

class Statistics {
public:
  void record_time(Histogram hist, uint64_t duration, uint32_t count = 1);
  void record_count(Ticker ticker, uint64_t count = 1);
  std::string generate_report_and_reset();

private:
  struct StatisticsData {
    std::atomic_uint_fast64_t tickers_[TICKERS_COUNT] = {{0}};
    HistogramImpl histograms_[HISTOGRAMS_COUNT];
  };

  td::ThreadLocalStorage<StatisticsData> per_core_stats_;
};

extern Statistics g_statistics;
