#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <future>
#include <limits>
#include <vector>

namespace almanac::bulk {

/**
 * Split `items` into consecutive chunks of at most `size` (size 0 is
 * treated as 1).
 */
template<typename T>
[[nodiscard]] std::vector<std::vector<T>> chunk(const std::vector<T>& items, size_t size) {
    const size_t n = std::max<size_t>(size, 1);
    std::vector<std::vector<T>> chunks;
    chunks.reserve((items.size() + n - 1) / n);
    for (size_t i = 0; i < items.size(); i += n) {
        const size_t end = std::min(items.size(), i + n);
        chunks.emplace_back(items.begin() + static_cast<std::ptrdiff_t>(i),
                            items.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

/**
 * Run `processor` over every batch, at most `max_parallel` at a time.
 * Results come back in batch order. `processor` must be safe to call from
 * several threads; nothing that touches a Store connection is.
 */
template<typename T, typename R>
[[nodiscard]] std::vector<R> process_parallel_batches(
    const std::vector<std::vector<T>>& batches,
    const std::function<R(const std::vector<T>&)>& processor,
    size_t max_parallel = 3) {
    const size_t width = std::max<size_t>(max_parallel, 1);
    std::vector<R> results;
    results.reserve(batches.size());

    for (size_t i = 0; i < batches.size(); i += width) {
        const size_t end = std::min(batches.size(), i + width);
        std::vector<std::future<R>> group;
        group.reserve(end - i);
        for (size_t j = i; j < end; ++j) {
            group.push_back(std::async(std::launch::async, processor, std::cref(batches[j])));
        }
        for (auto& f : group) {
            results.push_back(f.get());
        }
    }
    return results;
}

struct BatchSizeTiming {
    size_t batch_size{0};
    double average_ms{0.0};
    double per_item_ms{0.0};
};

struct BatchSizeReport {
    size_t best{0};
    std::vector<BatchSizeTiming> timings;
};

/**
 * Time `operation` (3 runs per candidate) and pick the candidate with the
 * lowest time per item. `operation` receives the candidate size and does
 * one batch of that size.
 */
[[nodiscard]] inline Result<BatchSizeReport, Error> find_optimal_batch_size(
    const std::function<Result<void, Error>(size_t)>& operation,
    const std::vector<size_t>& candidates = {50, 100, 200, 500},
    int runs = 3) {
    using R = Result<BatchSizeReport, Error>;

    if (candidates.empty()) {
        return R::err(Error{ErrorKind::Validation, "no candidate batch sizes"});
    }

    BatchSizeReport report;
    double best_per_item = std::numeric_limits<double>::max();

    for (size_t size : candidates) {
        if (size == 0) {
            return R::err(Error{ErrorKind::Validation, "batch size must be positive"});
        }
        double total_ms = 0.0;
        for (int run = 0; run < runs; ++run) {
            Stopwatch watch;
            auto result = operation(size);
            if (result.is_err()) {
                return R::err(result.unwrap_err());
            }
            total_ms += watch.elapsed_ms();
        }

        const double average = total_ms / std::max(runs, 1);
        const double per_item = average / static_cast<double>(size);
        report.timings.push_back(BatchSizeTiming{size, average, per_item});
        if (per_item < best_per_item) {
            best_per_item = per_item;
            report.best = size;
        }
    }
    return R::ok(std::move(report));
}

} // namespace almanac::bulk
