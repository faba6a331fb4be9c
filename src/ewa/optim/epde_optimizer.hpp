#pragma once
#include <cstdint>
#include <functional>
#include <random>
#include <vector>
#include "../analysis/combat_analyzer.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"

namespace ewa::optim {

/**
 * @brief 优化器状态机：NotStarted → Running(generation) → Completed
 */
enum class OptimizerState : uint8_t {
    NotStarted,
    Running,
    Completed
};

/**
 * @brief 一次 optimize() 的输出
 */
struct OptimizeResult {
    ewa::types::AssignmentMatrix   best_assignment;
    double                         best_fitness{0.0};
    ewa::types::ConvergenceHistory convergence;
    int                            generations{0};     // 实际完成的代数
    double                         elapsed_sec{0.0};
    bool                           time_limit_hit{false};
};

// 每代结束时回调一次，供日志/界面消费
using ProgressObserver = std::function<void(const ewa::types::ConvergenceRecord&)>;

using Rng = std::mt19937_64;

/**
 * @brief 扩展置换差分进化（ePDE）
 *
 * 离散基因组上的差分进化：变异 → 交叉 → 修复 → 评估 → 一对一选择。
 * 每代读取上一代冻结的种群，写入新种群；历史最优单独保存，不受种群替换影响。
 * 时间预算只在代边界检查一次，正在进行的一代总会完成。
 */
class EpdeOptimizer {
public:
    explicit EpdeOptimizer(const ewa::config::EpdeConfig& cfg = {});

    /**
     * @brief 运行优化
     * @param scenario 雷达与干扰机
     * @param analyzer 适应度所用的对抗分析器
     */
    OptimizeResult optimize(const ewa::types::Scenario& scenario,
                            const ewa::analysis::CombatAnalyzer& analyzer);

    void set_progress_observer(ProgressObserver observer) { observer_ = std::move(observer); }

    OptimizerState state() const { return state_; }
    const ewa::config::EpdeConfig& config() const { return cfg_; }

    // ==================== 算子（单独暴露以便测试） ====================

    ewa::types::Population initialize_population(const ewa::types::Scenario& scenario, Rng& rng) const;

    ewa::types::AssignmentMatrix mutate(const ewa::types::Population& population,
                                        size_t current, Rng& rng) const;

    ewa::types::AssignmentMatrix crossover(const ewa::types::AssignmentMatrix& target,
                                           const ewa::types::AssignmentMatrix& mutant,
                                           Rng& rng) const;

    /**
     * @brief 可行性修复
     *
     * 1. 指向不存在雷达的基因随机改派到有效雷达；
     * 2. 超出带宽能力的基因改派到该带宽下仍有余量且负载最小的雷达，
     *    没有余量时取消分配。
     */
    ewa::types::AssignmentMatrix repair(ewa::types::AssignmentMatrix trial,
                                        const ewa::types::Scenario& scenario,
                                        Rng& rng) const;

    /**
     * @brief 适应度 = 总效果 + RUR 奖励 + 中断奖励 − 约束惩罚，下限为 0
     */
    double evaluate_fitness(const ewa::types::AssignmentMatrix& matrix,
                            const ewa::types::Scenario& scenario,
                            const ewa::analysis::CombatAnalyzer& analyzer) const;

    double constraint_penalty(const ewa::types::AssignmentMatrix& matrix,
                              const ewa::types::Scenario& scenario) const;

private:
    ewa::config::EpdeConfig cfg_;
    ProgressObserver        observer_;
    OptimizerState          state_{OptimizerState::NotStarted};
};

/**
 * @brief 统计 (雷达, 带宽) 分配数，忽略悬空引用
 */
std::vector<int> count_radar_bandwidth(const ewa::types::AssignmentMatrix& matrix, size_t n_radars);

} // namespace ewa::optim
