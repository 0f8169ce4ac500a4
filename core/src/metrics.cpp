#include "gauntlet/metrics.h"

namespace gauntlet {

void MetricsAggregator::record(const EvaluationResult& r) {
    std::lock_guard<std::mutex> lk(mu_);
    results_.push_back(r);
}

void MetricsAggregator::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    results_.clear();
    expected_tasks_ = 0;
}

void MetricsAggregator::set_dataset(const std::string& dataset) {
    std::lock_guard<std::mutex> lk(mu_);
    dataset_ = dataset;
}

void MetricsAggregator::set_total_tasks(size_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    expected_tasks_ = n;
}

size_t MetricsAggregator::expected_tasks() const {
    std::lock_guard<std::mutex> lk(mu_);
    return expected_tasks_;
}

AggregateMetrics MetricsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    AggregateMetrics m;
    m.dataset = dataset_;
    m.results = results_;
    m.total_tasks = results_.size();
    if (results_.empty()) return m;

    double turns = 0.0, secs = 0.0;
    for (const auto& r : results_) {
        if (r.passed) m.passed++;
        turns += r.turns;
        secs += r.total_time_sec;
        m.total_reward += r.reward;
    }
    const double n = (double)results_.size();
    m.failed = results_.size() - m.passed;
    m.pass_rate = (double)m.passed / n;
    m.avg_turns = turns / n;
    m.avg_time_sec = secs / n;
    return m;
}

std::optional<EvaluationResult> MetricsAggregator::find_result(const std::string& task_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& r : results_) {
        if (r.task_id == task_id) return r;
    }
    return std::nullopt;
}

} // namespace gauntlet
