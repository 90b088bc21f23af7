#include "Statistics.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

Statistics g_statistics;

size_t HistogramImpl::index_for_value(uint64_t value) {
  auto beg = histogram_bucket_limits.begin();
  auto end = histogram_bucket_limits.end();
  if (value >= histogram_bucket_limits.back()) {
    return histogram_bucket_limits.size() - 1;
  }
  return std::lower_bound(beg, end, value) - beg;
}

void HistogramImpl::add(uint64_t value, size_t count) {
  count_.fetch_add(count, std::memory_order_relaxed);
  sum_.fetch_add(value * count, std::memory_order_relaxed);
  update_max(max_, value);
  buckets_[index_for_value(value)].fetch_add(count, std::memory_order_relaxed);
}

uint64_t HistogramImpl::get_count() const {
  return count_.load(std::memory_order_relaxed);
}

uint64_t HistogramImpl::get_sum() const {
  return sum_.load(std::memory_order_relaxed);
}

uint64_t HistogramImpl::get_max() const {
  return max_.load(std::memory_order_relaxed);
}

double HistogramImpl::compute_percentile(double percentile) const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = get_count();
  if (total == 0) {
    return 0.0;
  }

  double threshold = total * (percentile / 100.0);
  uint64_t accumulated = 0;
  size_t idx = 0;
  for (; idx < bucket_count(); ++idx) {
    uint64_t in_bucket = buckets_[idx].load(std::memory_order_relaxed);
    if (accumulated + in_bucket >= threshold) {
      break;
    }
    accumulated += in_bucket;
  }
  if (idx == bucket_count()) {
    return static_cast<double>(get_max());
  }

  uint64_t lower = idx == 0 ? 0 : histogram_bucket_limits[idx - 1] + 1;
  uint64_t upper = std::min(histogram_bucket_limits[idx], get_max());
  uint64_t in_bucket = buckets_[idx].load(std::memory_order_relaxed);
  if (in_bucket == 0 || upper < lower) {
    return static_cast<double>(upper);
  }
  double fraction = (threshold - accumulated) / in_bucket;
  return lower + fraction * (upper - lower);
}

void HistogramImpl::merge(const HistogramImpl &other) {
  std::lock_guard<std::mutex> lock(mutex_);
  count_.fetch_add(other.get_count(), std::memory_order_relaxed);
  sum_.fetch_add(other.get_sum(), std::memory_order_relaxed);
  update_max(max_, other.get_max());
  for (size_t i = 0; i < bucket_count(); ++i) {
    buckets_[i].fetch_add(other.buckets_[i].load(std::memory_order_relaxed), std::memory_order_relaxed);
  }
}

void HistogramImpl::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  count_.store(0, std::memory_order_relaxed);
  sum_.store(0, std::memory_order_relaxed);
  max_.store(0, std::memory_order_relaxed);
  for (size_t i = 0; i < bucket_count(); ++i) {
    buckets_[i].store(0, std::memory_order_relaxed);
  }
}

void HistogramImpl::update_max(std::atomic<uint64_t> &max, uint64_t value) {
  uint64_t current = max.load(std::memory_order_relaxed);
  while (value > current && !max.compare_exchange_weak(current, value, std::memory_order_relaxed));
}

void Statistics::record_time(Histogram hist, uint64_t duration, uint32_t count) {
  if (count > 1) {
    // batch events are recorded with the average duration
    duration /= count;
  }
  per_core_stats_.get().histograms_[hist].add(duration, count);
}

void Statistics::record_count(Ticker ticker, uint64_t count) {
  per_core_stats_.get().tickers_[ticker].fetch_add(count, std::memory_order_relaxed);
}

std::string Statistics::generate_report_and_reset() {
  std::array<uint64_t, TICKERS_COUNT> agg_tickers = {};
  std::array<HistogramImpl, HISTOGRAMS_COUNT> agg_hist;

  per_core_stats_.for_each([&](StatisticsData &data) {
    for (uint32_t i = 0; i < TICKERS_COUNT; ++i) {
      agg_tickers[i] += data.tickers_[i].exchange(0, std::memory_order_relaxed);
    }
    for (uint32_t h = 0; h < HISTOGRAMS_COUNT; ++h) {
      agg_hist[h].merge(data.histograms_[h]);
      data.histograms_[h].reset();
    }
  });

  std::ostringstream oss;
  oss << std::setprecision(3) << std::fixed;
  for (uint32_t i = 0; i < TICKERS_COUNT; ++i) {
    oss << ticker_names.at(i) << " COUNT : " << agg_tickers[i] << std::endl;
  }
  for (uint32_t h = 0; h < HISTOGRAMS_COUNT; ++h) {
    oss << histogram_names.at(h) << " P50 : " << agg_hist[h].compute_percentile(50.0)
                                 << " P95 : " << agg_hist[h].compute_percentile(95.0)
                                 << " P99 : " << agg_hist[h].compute_percentile(99.0)
                                 << " P100 : " << agg_hist[h].get_max()
                                 << " COUNT : " << agg_hist[h].get_count()
                                 << " SUM : " << agg_hist[h].get_sum() << std::endl;
  }
  return oss.str();
}
