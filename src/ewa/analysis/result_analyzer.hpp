#pragma once
#include <map>
#include <string>
#include <vector>
#include "../core/types.hpp"
#include "combat_analyzer.hpp"

namespace ewa::analysis {

struct ConvergenceAnalysis {
    double final_best_fitness{0.0};
    double final_avg_fitness{0.0};
    int    convergence_generation{0};
    double improvement_ratio{0.0};
    double stability{1.0};
};

struct AssignmentRow {
    ewa::types::JammerId         jammer_id;
    std::string                  jammer_name;
    ewa::types::RadarId          target_id;
    std::string                  target_name;
    ewa::types::JammingTechnique technique{ewa::types::JammingTechnique::NJ};
    ewa::types::BandwidthMode    bandwidth{ewa::types::BandwidthMode::Medium};
    double                       effectiveness{0.0};
    ewa::types::RadarStage       radar_stage{ewa::types::RadarStage::Search};
};

struct AssignmentSummary {
    double total_effectiveness{0.0};
    double resource_utilization{0.0};
    int    interruption_count{0};
    int    assigned_jammers{0};
    int    total_jammers{0};
};

struct AssignmentReport {
    AssignmentSummary                     summary{};
    std::vector<AssignmentRow>            assignments;
    std::map<ewa::types::RadarId, double> radar_effects;
};

/**
 * @brief 优化结果分析：收敛诊断与分配报告
 */
class ResultAnalyzer {
public:
    /// 平台检测窗口长度
    static constexpr size_t kPlateauWindow = 10;
    /// 窗口内 best_fitness 标准差低于该值视为收敛
    static constexpr double kPlateauStdDev = 0.01;

    /**
     * @brief 收敛分析
     *
     * convergence_generation 为之后所有 10 代滑窗标准差都低于 0.01 的第一个代数，
     * 从未达到或序列不足 10 代时取序列长度。
     * stability = 1 − std/mean，取 best_fitness 序列的后半段。
     */
    ConvergenceAnalysis analyze_convergence(const ewa::types::ConvergenceHistory& history) const;

    /**
     * @brief 生成分配报告（仅列出有有效目标的干扰机）
     */
    AssignmentReport generate_assignment_report(const ewa::types::AssignmentMatrix& best,
                                                const ewa::types::Scenario& scenario,
                                                const CombatAnalyzer& analyzer) const;
};

} // namespace ewa::analysis
