#pragma once
#include <optional>
#include <vector>
#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../model/effectiveness_model.hpp"

namespace ewa::analysis {

/**
 * @brief 指向同一部雷达的一次干扰（协同效果计算的输入）
 */
struct RadarEngagement {
    const ewa::types::Jammer*    jammer{nullptr};
    ewa::types::JammingTechnique technique{ewa::types::JammingTechnique::NJ};
    ewa::types::BandwidthMode    bandwidth{ewa::types::BandwidthMode::Medium};
    int                          assigned_count{1}; // 该 (雷达, 带宽) 上的分配数
};

/**
 * @brief 分配矩阵整体评估结果
 */
struct AssignmentEvaluation {
    double              total_effectiveness{0.0};
    std::vector<double> radar_effects;        // 下标与雷达列表一致
    double              resource_utilization{0.0};
    int                 interruption_count{0};
};

// 两点大圆距离（米），坐标非法时返回空
std::optional<double> great_circle_distance_m(const ewa::types::GeoPosition& a,
                                              const ewa::types::GeoPosition& b);

/**
 * @brief 干扰机-雷达对抗分析器
 *
 * 基于 EffectivenessModel 计算单机效果、单雷达协同效果以及整个分配矩阵的效果。
 * 所有方法为 const，不修改任何输入。
 */
class CombatAnalyzer {
public:
    explicit CombatAnalyzer(const ewa::config::AnalyzerConfig& cfg = {});

    /**
     * @brief 单部干扰机对单部雷达的干扰效果
     *
     * (阶段有效性 + 带宽调整) × 距离衰减 × 功率匹配，限制在 [-1, 1]。
     * 带宽不可行时返回 0。
     *
     * @param assigned_count 该 (雷达, 带宽模式) 上的分配数量
     */
    double single_effect(const ewa::types::Radar& radar,
                         const ewa::types::Jammer& jammer,
                         ewa::types::JammingTechnique technique,
                         ewa::types::BandwidthMode bandwidth,
                         int assigned_count) const;

    /**
     * @brief 多部干扰机对同一雷达的协同效果
     *
     * 各单机效果之和，加上每对同时施加技术的交互因子，限制在 [-1, 1]。
     * 带宽不可行的干扰既不计效果也不参与技术交互。
     */
    double cooperative_effect(const ewa::types::Radar& radar,
                              const std::vector<RadarEngagement>& engagements) const;

    /**
     * @brief 评估分配矩阵
     *
     * 悬空的干扰机/雷达引用按效果 0 处理。
     */
    AssignmentEvaluation evaluate_assignment(const ewa::types::AssignmentMatrix& matrix,
                                             const std::vector<ewa::types::Radar>& radars,
                                             const std::vector<ewa::types::Jammer>& jammers) const;

    // 距离衰减因子，计算失败时返回空
    std::optional<double> distance_factor(const ewa::types::Radar& radar,
                                          const ewa::types::Jammer& jammer) const;

    // 功率匹配因子，计算失败时返回空
    std::optional<double> power_factor(const ewa::types::Radar& radar,
                                       const ewa::types::Jammer& jammer) const;

    const ewa::model::EffectivenessModel& model() const { return model_; }
    const ewa::config::AnalyzerConfig& config() const { return cfg_; }

private:
    ewa::config::AnalyzerConfig    cfg_;
    ewa::model::EffectivenessModel model_;
};

} // namespace ewa::analysis
