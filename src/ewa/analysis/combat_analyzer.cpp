#include "combat_analyzer.hpp"
#include <algorithm>
#include <cmath>

namespace ewa::analysis {

using namespace ewa::types;

namespace {

constexpr double kEarthRadiusM = 6371000.0;
constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
constexpr double kFarFieldFactor = 0.1;   // 超出有效距离后的衰减因子
constexpr double kNearFalloff = 0.8;      // 有效距离内线性衰减的最大幅度
constexpr double kPowerEpsilon = 1e-6;
constexpr double kPowerNormalizer = 10.0;

inline double clamp_unit(double v) {
    return std::max(-1.0, std::min(1.0, v));
}

bool valid_position(const GeoPosition& p) {
    return std::isfinite(p.lat) && std::isfinite(p.lon) &&
           std::abs(p.lat) <= 90.0 && std::abs(p.lon) <= 180.0;
}

} // namespace

std::optional<double> great_circle_distance_m(const GeoPosition& a, const GeoPosition& b) {
    if (!valid_position(a) || !valid_position(b)) {
        return std::nullopt;
    }

    // haversine
    const double lat1 = a.lat * kDegToRad;
    const double lat2 = b.lat * kDegToRad;
    const double dlat = lat2 - lat1;
    const double dlon = (b.lon - a.lon) * kDegToRad;

    const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
    const double c = 2.0 * std::asin(std::sqrt(std::min(1.0, h)));
    return c * kEarthRadiusM;
}

CombatAnalyzer::CombatAnalyzer(const ewa::config::AnalyzerConfig& cfg)
    : cfg_(cfg), model_(cfg.consider_illumination) {
}

std::optional<double> CombatAnalyzer::distance_factor(const Radar& radar, const Jammer& jammer) const {
    const auto distance = great_circle_distance_m(radar.position, jammer.position);
    if (!distance || !(cfg_.effective_range_m > 0.0)) {
        return std::nullopt;
    }
    if (*distance > cfg_.effective_range_m) {
        return kFarFieldFactor;
    }
    return 1.0 - (*distance / cfg_.effective_range_m) * kNearFalloff;
}

std::optional<double> CombatAnalyzer::power_factor(const Radar& radar, const Jammer& jammer) const {
    if (!std::isfinite(radar.power) || !std::isfinite(jammer.power) ||
        radar.power < 0.0 || jammer.power < 0.0) {
        return std::nullopt;
    }
    const double ratio = jammer.power / (radar.power + kPowerEpsilon);
    return std::min(1.0, ratio / kPowerNormalizer);
}

double CombatAnalyzer::single_effect(const Radar& radar,
                                     const Jammer& jammer,
                                     JammingTechnique technique,
                                     BandwidthMode bandwidth,
                                     int assigned_count) const {
    const auto bw_adjust = model_.bandwidth_adjustment(bandwidth, assigned_count);
    if (!bw_adjust) {
        return 0.0;  // 不可行分配
    }

    const double base = model_.stage_effectiveness(radar.current_stage, technique);

    // 单个实体数据异常不应中断整代评估，退回中性因子
    const double distance = distance_factor(radar, jammer).value_or(cfg_.neutral_factor);
    const double power = power_factor(radar, jammer).value_or(cfg_.neutral_factor);

    return clamp_unit((base + *bw_adjust) * distance * power);
}

double CombatAnalyzer::cooperative_effect(const Radar& radar,
                                          const std::vector<RadarEngagement>& engagements) const {
    double total = 0.0;
    std::vector<JammingTechnique> active;
    active.reserve(engagements.size());

    for (const auto& e : engagements) {
        if (!e.jammer) continue;
        if (!model_.bandwidth_adjustment(e.bandwidth, e.assigned_count)) continue;

        double interaction = 0.0;
        for (auto other : active) {
            interaction += model_.technique_interaction(e.technique, other);
        }
        total += single_effect(radar, *e.jammer, e.technique, e.bandwidth, e.assigned_count) + interaction;
        active.push_back(e.technique);
    }

    return clamp_unit(total);
}

AssignmentEvaluation CombatAnalyzer::evaluate_assignment(const AssignmentMatrix& matrix,
                                                         const std::vector<Radar>& radars,
                                                         const std::vector<Jammer>& jammers) const {
    AssignmentEvaluation result;
    result.radar_effects.assign(radars.size(), 0.0);

    const size_t n_genes = std::min(matrix.size(), jammers.size());

    // (雷达, 带宽) 分配计数
    std::vector<int> counts(radars.size() * kBandwidthCount, 0);
    int used = 0;
    for (size_t j = 0; j < n_genes; ++j) {
        const auto& gene = matrix[j];
        if (!gene.has_target()) continue;
        ++used;
        if (*gene.target < radars.size()) {
            ++counts[idx_radar_bandwidth(*gene.target, gene.bandwidth)];
        }
    }

    std::vector<std::vector<RadarEngagement>> per_radar(radars.size());
    for (size_t j = 0; j < n_genes; ++j) {
        const auto& gene = matrix[j];
        if (!gene.has_target() || *gene.target >= radars.size()) continue;
        per_radar[*gene.target].push_back(RadarEngagement{
            &jammers[j], gene.technique, gene.bandwidth,
            counts[idx_radar_bandwidth(*gene.target, gene.bandwidth)]});
    }

    for (size_t r = 0; r < radars.size(); ++r) {
        const double effect = cooperative_effect(radars[r], per_radar[r]);
        result.radar_effects[r] = effect;
        result.total_effectiveness += effect;
        if (effect > 1.0 - radars[r].interruption_threshold) {
            ++result.interruption_count;
        }
    }

    result.resource_utilization = jammers.empty()
        ? 0.0
        : static_cast<double>(used) / static_cast<double>(jammers.size());
    return result;
}

} // namespace ewa::analysis
