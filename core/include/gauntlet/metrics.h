#pragma once

#include "gauntlet/types.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet {

// Ordered result list plus the aggregate derived from it. Every member is
// synchronized so evaluator workers may record concurrently; snapshot() is
// a pure read.
class MetricsAggregator {
public:
    explicit MetricsAggregator(std::string dataset = "") : dataset_(std::move(dataset)) {}

    void record(const EvaluationResult& r);

    // Clears results and the expected task count; the dataset name stays.
    void reset();

    void set_dataset(const std::string& dataset);
    void set_total_tasks(size_t n);
    size_t expected_tasks() const;

    AggregateMetrics snapshot() const;
    std::optional<EvaluationResult> find_result(const std::string& task_id) const;

private:
    mutable std::mutex mu_;
    std::string dataset_;
    size_t expected_tasks_{0};
    std::vector<EvaluationResult> results_;
};

} // namespace gauntlet
