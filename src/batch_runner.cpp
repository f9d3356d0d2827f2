#include "batch_runner.hpp"
#include "configuration.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

BatchRunner::BatchRunner(std::shared_ptr<ResultCache> shared_cache, unsigned workers)
    : cache(std::move(shared_cache)), worker_count(std::max(1u, workers)) {
    if (!cache) {
        cache = std::make_shared<ResultCache>();
    }
}

BatchOutcome BatchRunner::runJob(const BatchJob& job) {
    BatchOutcome outcome;
    outcome.name = job.name;
    try {
        if (!job.prices || !job.solar) {
            throw std::runtime_error("job has no price or solar series");
        }
        Configuration config = Configuration::validate(job.config);
        outcome.comparison = cache->getOrCompare(config, *job.prices, *job.solar);
    } catch (const std::exception& e) {
        outcome.error = e.what();
        std::cerr << "Batch job '" << job.name << "' failed: " << e.what() << std::endl;
    }
    return outcome;
}

std::vector<BatchOutcome> BatchRunner::run(const std::vector<BatchJob>& jobs) {
    std::vector<BatchOutcome> outcomes(jobs.size());
    std::atomic<size_t> next_job(0);

    auto worker = [&]() {
        for (size_t i = next_job++; i < jobs.size(); i = next_job++) {
            outcomes[i] = runJob(jobs[i]);
        }
    };

    unsigned thread_count = std::min<unsigned>(worker_count, static_cast<unsigned>(jobs.size()));
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    try {
        for (unsigned t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        // Stop handing out jobs and join the workers already running
        std::cerr << "Batch could not start all workers: " << e.what() << std::endl;
        next_job = jobs.size();
        for (auto& thread : threads) {
            thread.join();
        }
        throw;
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::cout << "Batch finished: " << jobs.size() << " jobs on " << thread_count << " threads" << std::endl;
    return outcomes;
}
