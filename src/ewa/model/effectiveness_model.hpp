#pragma once
#include <array>
#include <optional>
#include "../core/types.hpp"

namespace ewa::model {

/**
 * @brief 干扰效能查找表
 *
 * 四张常量表：阶段有效性（是否考虑平台照明两种版本）、技术交互、
 * 带宽调整、阶段交互。构造后不可变，可在多线程中只读共享。
 */
class EffectivenessModel {
public:
    /**
     * @param consider_platform_illumination 是否考虑平台照明效应，
     *        决定使用哪一张阶段有效性表
     */
    explicit EffectivenessModel(bool consider_platform_illumination = true);

    /**
     * @brief 阶段有效性因子
     */
    double stage_effectiveness(ewa::types::RadarStage stage,
                               ewa::types::JammingTechnique technique) const;

    /**
     * @brief 技术交互因子（对称）
     *
     * 对同一雷达上每一对同时施加的技术计一次
     */
    double technique_interaction(ewa::types::JammingTechnique t1,
                                 ewa::types::JammingTechnique t2) const;

    /**
     * @brief 带宽调整因子
     * @param assigned_count 该带宽模式同时分配的目标数
     * @return 超出带宽能力时返回空（不可行）
     */
    std::optional<double> bandwidth_adjustment(ewa::types::BandwidthMode mode,
                                               int assigned_count) const;

    /**
     * @brief 阶段交互因子（预留，默认适应度不使用）
     */
    double stage_interaction(ewa::types::RadarStage s1, ewa::types::RadarStage s2) const;

    /**
     * @brief 带宽模式可同时支持的最大目标数（N/M/W = 1/3/5）
     */
    static int max_targets(ewa::types::BandwidthMode mode);

    bool consider_platform_illumination() const { return consider_illumination_; }

private:
    using StageTable = std::array<double, ewa::types::kStageCount * ewa::types::kTechniqueCount>;

    bool consider_illumination_;
    const StageTable* stage_table_;
};

} // namespace ewa::model
