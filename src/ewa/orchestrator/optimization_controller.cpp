#include "optimization_controller.hpp"
#include <algorithm>
#include <chrono>
#include <glog/logging.h>
#include "../analysis/statistics.hpp"

namespace ewa::orch {

using clock = std::chrono::steady_clock;

static inline double wall_time_sec() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

OptimizationController::OptimizationController(const ewa::config::SolveConfig& cfg)
    : analyzer_(cfg.analyzer), optimizer_(cfg.epde) {
    install_observer();
}

void OptimizationController::reconfigure(const ewa::config::SolveConfig& cfg) {
    analyzer_ = ewa::analysis::CombatAnalyzer(cfg.analyzer);
    optimizer_ = ewa::optim::EpdeOptimizer(cfg.epde);
    install_observer();
}

void OptimizationController::install_observer() {
    optimizer_.set_progress_observer([this](const ewa::types::ConvergenceRecord& rec) {
        on_generation(rec);
    });
}

void OptimizationController::on_generation(const ewa::types::ConvergenceRecord& record) {
    if (record.generation % 10 == 0) {
        LOG(INFO) << "generation " << record.generation
                  << ": avg_fitness=" << record.avg_fitness
                  << ", best_fitness=" << record.best_fitness;
    }
    if (user_observer_) user_observer_(record);
}

OptimizationResult OptimizationController::run_optimization(const ewa::types::Scenario& scenario) {
    const auto start = clock::now();
    LOG(INFO) << "Optimization run: " << scenario.radars.size() << " radars vs "
              << scenario.jammers.size() << " jammers";

    // 1. ePDE
    auto optimized = optimizer_.optimize(scenario, analyzer_);

    // 2. 结果分析
    OptimizationResult result;
    result.convergence_analysis = result_analyzer_.analyze_convergence(optimized.convergence);
    result.assignment_report = result_analyzer_.generate_assignment_report(
        optimized.best_assignment, scenario, analyzer_);

    result.success = true;
    result.best_solution = std::move(optimized.best_assignment);
    result.best_fitness = optimized.best_fitness;
    result.convergence_data = std::move(optimized.convergence);
    result.resource_utilization = result.assignment_report.summary.resource_utilization;
    result.optimization_time = std::chrono::duration<double>(clock::now() - start).count();

    // 3. 历史
    RunRecord record;
    record.timestamp = wall_time_sec();
    record.result = result;
    record.n_radars = static_cast<int>(scenario.radars.size());
    record.n_jammers = static_cast<int>(scenario.jammers.size());
    history_.push_back(std::move(record));

    LOG(INFO) << "Optimization finished in " << result.optimization_time << "s"
              << ", best_fitness=" << result.best_fitness
              << ", resource_utilization=" << result.resource_utilization;
    return result;
}

OptimizationStatistics OptimizationController::get_optimization_statistics() const {
    OptimizationStatistics stats;
    stats.total_runs = static_cast<int>(history_.size());
    if (history_.empty()) {
        return stats;
    }

    const size_t window = std::min(kStatisticsWindow, history_.size());
    std::vector<double> fitness;
    std::vector<double> times;
    int succeeded = 0;
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(window); it != history_.end(); ++it) {
        fitness.push_back(it->result.best_fitness);
        times.push_back(it->result.optimization_time);
        if (it->result.success) ++succeeded;
    }

    stats.avg_fitness = ewa::analysis::mean(fitness.begin(), fitness.end());
    stats.std_fitness = ewa::analysis::stddev(fitness.begin(), fitness.end());
    stats.max_fitness = *std::max_element(fitness.begin(), fitness.end());
    stats.avg_time = ewa::analysis::mean(times.begin(), times.end());
    stats.success_rate = static_cast<double>(succeeded) / static_cast<double>(window);
    return stats;
}

} // namespace ewa::orch
