#include "effectiveness_model.hpp"

namespace ewa::model {

using ewa::types::BandwidthMode;
using ewa::types::JammingTechnique;
using ewa::types::RadarStage;
using ewa::types::kBandwidthCount;
using ewa::types::kStageCount;
using ewa::types::kTechniqueCount;

namespace {

// 行：search / acquisition / tracking / guidance
// 列：NJ / CP / MFT / RGPO / VGPO

// 考虑平台照明：被跟踪时拖引距离/速度门会暴露干扰平台
constexpr std::array<double, kStageCount * kTechniqueCount> kStageWithIllumination = {
     0.8,  0.9, 1.0, -0.9, -0.9,
     0.9,  0.9, 1.0, -0.9, -0.9,
    -0.9, -0.9, 0.0, -0.9, -0.8,
    -0.9, -0.9, 0.0, -0.8, -0.9,
};

// 简化模型：忽略平台照明
constexpr std::array<double, kStageCount * kTechniqueCount> kStageSimplified = {
     0.8,  0.9, 1.0,  0.2,  0.2,
     0.9,  0.9, 1.0,  0.1,  0.1,
    -0.9, -0.9, 0.0,  0.9,  0.8,
    -0.9, -0.9, 0.0,  0.8,  0.9,
};

constexpr std::array<double, kTechniqueCount * kTechniqueCount> kTechInteraction = {
    //  NJ    CP    MFT   RGPO  VGPO
     0.0,  0.0,  0.2, -0.3, -0.3,  // NJ
     0.0,  0.0,  0.1,  0.2,  0.2,  // CP
     0.2,  0.1,  0.0, -0.2, -0.2,  // MFT
    -0.3,  0.2, -0.2,  0.0,  0.2,  // RGPO
    -0.3,  0.2, -0.2,  0.2,  0.0,  // VGPO
};

// 带宽调整，按分配目标数 1..5；超过 max_targets 的列不可行
constexpr int kMaxAssigned = 5;
constexpr std::array<double, kBandwidthCount * kMaxAssigned> kBandwidthAdjust = {
     0.0,   0.0,   0.0,  0.0,  0.0,  // N
    -0.1,  -0.2,  -0.35, 0.0,  0.0,  // M
    -0.15, -0.25, -0.4, -0.6, -0.8,  // W
};

constexpr std::array<double, kStageCount * kStageCount> kStageInteraction = {
    0.1, 0.0, 0.0, 0.0,
    0.2, 0.1, 0.0, 0.0,
    0.3, 0.2, 0.1, 0.0,
    0.4, 0.3, 0.2, 0.1,
};

} // namespace

EffectivenessModel::EffectivenessModel(bool consider_platform_illumination)
    : consider_illumination_(consider_platform_illumination),
      stage_table_(consider_platform_illumination ? &kStageWithIllumination : &kStageSimplified) {
}

double EffectivenessModel::stage_effectiveness(RadarStage stage, JammingTechnique technique) const {
    return (*stage_table_)[ewa::types::idx_stage_technique(stage, technique)];
}

double EffectivenessModel::technique_interaction(JammingTechnique t1, JammingTechnique t2) const {
    return kTechInteraction[static_cast<size_t>(t1) * kTechniqueCount + static_cast<size_t>(t2)];
}

std::optional<double> EffectivenessModel::bandwidth_adjustment(BandwidthMode mode,
                                                               int assigned_count) const {
    if (assigned_count < 1 || assigned_count > max_targets(mode)) {
        return std::nullopt;
    }
    return kBandwidthAdjust[static_cast<size_t>(mode) * kMaxAssigned + (assigned_count - 1)];
}

double EffectivenessModel::stage_interaction(RadarStage s1, RadarStage s2) const {
    return kStageInteraction[static_cast<size_t>(s1) * kStageCount + static_cast<size_t>(s2)];
}

int EffectivenessModel::max_targets(BandwidthMode mode) {
    switch (mode) {
        case BandwidthMode::Narrow: return 1;
        case BandwidthMode::Medium: return 3;
        case BandwidthMode::Wide:   return 5;
    }
    return 1;
}

} // namespace ewa::model
