#ifndef BATCH_RUNNER_H
#define BATCH_RUNNER_H

#include "plant_model.hpp"
#include "result_cache.hpp"
#include "time_series.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @struct BatchJob
 * @brief One independent (configuration, series) comparison.
 */
struct BatchJob {
    std::string name;
    Config config;
    std::shared_ptr<const TimeSeries> prices;
    std::shared_ptr<const TimeSeries> solar;
};

/**
 * @struct BatchOutcome
 * @brief Result of one job. Exactly one of comparison and error is set.
 */
struct BatchOutcome {
    std::string name;
    ResultCache::Entry comparison;
    std::string error;

    bool ok() const { return comparison != nullptr; }
};

/**
 * @class BatchRunner
 * @brief Runs independent comparisons on a fixed pool of worker threads.
 *
 * A failing job is reported in its outcome and does not stop the others.
 */
class BatchRunner {
public:
    /**
     * @param cache Shared result cache.
     * @param worker_count Number of worker threads; at least one is used.
     */
    BatchRunner(std::shared_ptr<ResultCache> cache, unsigned worker_count);

    /**
     * @brief Runs all jobs and returns their outcomes in job order.
     * @throw std::system_error if a worker thread cannot be started; workers already
     *        running are joined first.
     */
    std::vector<BatchOutcome> run(const std::vector<BatchJob>& jobs);

private:
    BatchOutcome runJob(const BatchJob& job);

    std::shared_ptr<ResultCache> cache;
    unsigned worker_count;
};

#endif // BATCH_RUNNER_H
