#pragma once
#include <vector>
#include "../analysis/combat_analyzer.hpp"
#include "../analysis/result_analyzer.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../optim/epde_optimizer.hpp"

namespace ewa::orch {

/**
 * @brief 一次完整优化流程的结果
 */
struct OptimizationResult {
    bool                                  success{false};
    double                                optimization_time{0.0}; // 秒
    ewa::types::AssignmentMatrix          best_solution;
    double                                best_fitness{0.0};
    ewa::analysis::ConvergenceAnalysis    convergence_analysis{};
    ewa::analysis::AssignmentReport       assignment_report{};
    ewa::types::ConvergenceHistory        convergence_data;
    double                                resource_utilization{0.0};
};

/**
 * @brief 运行历史记录
 */
struct RunRecord {
    double             timestamp{0.0};
    OptimizationResult result{};
    int                n_radars{0};
    int                n_jammers{0};
};

/**
 * @brief 最近若干次运行的统计
 */
struct OptimizationStatistics {
    int    total_runs{0};
    double avg_fitness{0.0};
    double std_fitness{0.0};
    double max_fitness{0.0};
    double avg_time{0.0};
    double success_rate{0.0};
};

/**
 * @brief 优化控制器
 *
 * 串联 ePDE 优化与结果分析，并保存运行历史
 */
class OptimizationController {
public:
    /// 统计只取最近的运行次数
    static constexpr size_t kStatisticsWindow = 10;

    explicit OptimizationController(const ewa::config::SolveConfig& cfg = {});
    OptimizationController(const OptimizationController&) = delete;
    OptimizationController& operator=(const OptimizationController&) = delete;

    /**
     * @brief 运行完整优化流程：ePDE → 收敛分析 → 分配报告 → 记录历史
     */
    OptimizationResult run_optimization(const ewa::types::Scenario& scenario);

    /**
     * @brief 最近 10 次运行的统计，没有历史时全部为 0
     */
    OptimizationStatistics get_optimization_statistics() const;

    /**
     * @brief 按新配置重建分析器与优化器，保留运行历史
     */
    void reconfigure(const ewa::config::SolveConfig& cfg);

    /**
     * @brief 额外的逐代进度回调（控制器自身的日志回调之外）
     */
    void set_progress_observer(ewa::optim::ProgressObserver observer) { user_observer_ = std::move(observer); }

    const std::vector<RunRecord>& history() const { return history_; }
    const ewa::analysis::CombatAnalyzer& analyzer() const { return analyzer_; }
    const ewa::optim::EpdeOptimizer& optimizer() const { return optimizer_; }

private:
    void install_observer();
    void on_generation(const ewa::types::ConvergenceRecord& record);

    ewa::analysis::CombatAnalyzer  analyzer_;
    ewa::optim::EpdeOptimizer      optimizer_;
    ewa::analysis::ResultAnalyzer  result_analyzer_;
    ewa::optim::ProgressObserver   user_observer_;
    std::vector<RunRecord>         history_;
};

} // namespace ewa::orch
