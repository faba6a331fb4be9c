#pragma once
#include "solver_messages.hpp"
#include "ewa_messages.pb.h"
#include <string>

namespace ewa::net {

// ==================== 枚举转换 ====================
// 注意：protobuf 生成的类型在 ewa::pb 命名空间

inline ewa::pb::RadarStage to_proto_stage(ewa::types::RadarStage stage) {
    switch (stage) {
        case ewa::types::RadarStage::Search:
            return ewa::pb::RADAR_STAGE_SEARCH;
        case ewa::types::RadarStage::Acquisition:
            return ewa::pb::RADAR_STAGE_ACQUISITION;
        case ewa::types::RadarStage::Tracking:
            return ewa::pb::RADAR_STAGE_TRACKING;
        case ewa::types::RadarStage::Guidance:
            return ewa::pb::RADAR_STAGE_GUIDANCE;
    }
    return ewa::pb::RADAR_STAGE_SEARCH;
}

inline ewa::types::RadarStage from_proto_stage(ewa::pb::RadarStage stage) {
    switch (stage) {
        case ewa::pb::RADAR_STAGE_ACQUISITION:
            return ewa::types::RadarStage::Acquisition;
        case ewa::pb::RADAR_STAGE_TRACKING:
            return ewa::types::RadarStage::Tracking;
        case ewa::pb::RADAR_STAGE_GUIDANCE:
            return ewa::types::RadarStage::Guidance;
        default:
            return ewa::types::RadarStage::Search;
    }
}

inline ewa::pb::JammingTechnique to_proto_technique(ewa::types::JammingTechnique t) {
    switch (t) {
        case ewa::types::JammingTechnique::NJ:
            return ewa::pb::JAMMING_TECHNIQUE_NJ;
        case ewa::types::JammingTechnique::CP:
            return ewa::pb::JAMMING_TECHNIQUE_CP;
        case ewa::types::JammingTechnique::MFT:
            return ewa::pb::JAMMING_TECHNIQUE_MFT;
        case ewa::types::JammingTechnique::RGPO:
            return ewa::pb::JAMMING_TECHNIQUE_RGPO;
        case ewa::types::JammingTechnique::VGPO:
            return ewa::pb::JAMMING_TECHNIQUE_VGPO;
    }
    return ewa::pb::JAMMING_TECHNIQUE_NJ;
}

inline ewa::types::JammingTechnique from_proto_technique(ewa::pb::JammingTechnique t) {
    switch (t) {
        case ewa::pb::JAMMING_TECHNIQUE_CP:
            return ewa::types::JammingTechnique::CP;
        case ewa::pb::JAMMING_TECHNIQUE_MFT:
            return ewa::types::JammingTechnique::MFT;
        case ewa::pb::JAMMING_TECHNIQUE_RGPO:
            return ewa::types::JammingTechnique::RGPO;
        case ewa::pb::JAMMING_TECHNIQUE_VGPO:
            return ewa::types::JammingTechnique::VGPO;
        default:
            return ewa::types::JammingTechnique::NJ;
    }
}

inline ewa::pb::BandwidthMode to_proto_bandwidth(ewa::types::BandwidthMode bw) {
    switch (bw) {
        case ewa::types::BandwidthMode::Narrow:
            return ewa::pb::BANDWIDTH_MODE_NARROW;
        case ewa::types::BandwidthMode::Medium:
            return ewa::pb::BANDWIDTH_MODE_MEDIUM;
        case ewa::types::BandwidthMode::Wide:
            return ewa::pb::BANDWIDTH_MODE_WIDE;
    }
    return ewa::pb::BANDWIDTH_MODE_MEDIUM;
}

inline ewa::types::BandwidthMode from_proto_bandwidth(ewa::pb::BandwidthMode bw) {
    switch (bw) {
        case ewa::pb::BANDWIDTH_MODE_NARROW:
            return ewa::types::BandwidthMode::Narrow;
        case ewa::pb::BANDWIDTH_MODE_WIDE:
            return ewa::types::BandwidthMode::Wide;
        default:
            return ewa::types::BandwidthMode::Medium;
    }
}

// ==================== 场景 ====================

inline void to_proto(const ewa::types::GeoPosition& from, ewa::pb::GeoPosition* to) {
    to->set_lat(from.lat);
    to->set_lon(from.lon);
    to->set_alt(from.alt);
}

inline void from_proto(const ewa::pb::GeoPosition& from, ewa::types::GeoPosition& to) {
    to.lat = from.lat();
    to.lon = from.lon();
    to.alt = from.alt();
}

inline void to_proto(const ewa::types::Radar& from, ewa::pb::Radar* to) {
    to->set_id(from.id);
    to->set_name(from.name);
    to_proto(from.position, to->mutable_position());
    to->set_frequency_ghz(from.frequency_ghz);
    to->set_power(from.power);
    to->set_current_stage(to_proto_stage(from.current_stage));
    to->set_interruption_threshold(from.interruption_threshold);
}

inline void from_proto(const ewa::pb::Radar& from, ewa::types::Radar& to) {
    to.id = from.id();
    to.name = from.name();
    from_proto(from.position(), to.position);
    to.frequency_ghz = from.frequency_ghz();
    to.power = from.power();
    to.current_stage = from_proto_stage(from.current_stage());
    to.interruption_threshold = from.has_interruption_threshold()
        ? from.interruption_threshold()
        : ewa::types::Radar{}.interruption_threshold;
}

inline void to_proto(const ewa::types::Jammer& from, ewa::pb::Jammer* to) {
    to->set_id(from.id);
    to->set_name(from.name);
    to_proto(from.position, to->mutable_position());
    to->set_power(from.power);
}

inline void from_proto(const ewa::pb::Jammer& from, ewa::types::Jammer& to) {
    to.id = from.id();
    to.name = from.name();
    from_proto(from.position(), to.position);
    to.power = from.power();
}

inline void to_proto(const ewa::types::Scenario& from, ewa::pb::Scenario* to) {
    for (const auto& radar : from.radars) {
        to_proto(radar, to->add_radars());
    }
    for (const auto& jammer : from.jammers) {
        to_proto(jammer, to->add_jammers());
    }
}

inline void from_proto(const ewa::pb::Scenario& from, ewa::types::Scenario& to) {
    to.radars.clear();
    to.jammers.clear();
    to.radars.reserve(from.radars_size());
    to.jammers.reserve(from.jammers_size());
    for (const auto& pb_radar : from.radars()) {
        ewa::types::Radar radar;
        from_proto(pb_radar, radar);
        to.radars.push_back(std::move(radar));
    }
    for (const auto& pb_jammer : from.jammers()) {
        ewa::types::Jammer jammer;
        from_proto(pb_jammer, jammer);
        to.jammers.push_back(std::move(jammer));
    }
}

// ==================== 配置 ====================

inline void to_proto(const ewa::config::SolveConfig& from, ewa::pb::SolveConfig* to) {
    auto* epde = to->mutable_epde();
    epde->set_population_size(from.epde.population_size);
    epde->set_max_generations(from.epde.max_generations);
    epde->set_crossover_rate(from.epde.crossover_rate);
    epde->set_scaling_factor(from.epde.scaling_factor);
    epde->set_time_limit_sec(from.epde.time_limit_sec);
    if (from.epde.seed) {
        epde->set_seed(*from.epde.seed);
    }
    to->set_consider_illumination(from.analyzer.consider_illumination);
}

// 只覆盖线上实际携带的字段，其余保留 to 中的值
inline void from_proto(const ewa::pb::SolveConfig& from, ewa::config::SolveConfig& to) {
    if (from.has_epde()) {
        const auto& epde = from.epde();
        if (epde.has_population_size()) to.epde.population_size = epde.population_size();
        if (epde.has_max_generations()) to.epde.max_generations = epde.max_generations();
        if (epde.has_crossover_rate()) to.epde.crossover_rate = epde.crossover_rate();
        if (epde.has_scaling_factor()) to.epde.scaling_factor = epde.scaling_factor();
        if (epde.has_time_limit_sec()) to.epde.time_limit_sec = epde.time_limit_sec();
        if (epde.has_seed()) to.epde.seed = epde.seed();
    }
    if (from.has_consider_illumination()) {
        to.analyzer.consider_illumination = from.consider_illumination();
    }
}

// ==================== 规划请求 ====================

inline void to_proto(const ewa::proto::PlanRequest& from, ewa::pb::PlanRequest* to) {
    to->set_timestamp(from.timestamp);
    to->set_reason(from.reason);
    to_proto(from.scenario, to->mutable_scenario());
    to_proto(from.config, to->mutable_config());
}

inline void from_proto(const ewa::pb::PlanRequest& from, ewa::proto::PlanRequest& to) {
    to.type = "plan_request";
    to.timestamp = from.timestamp();
    to.reason = from.reason();
    from_proto(from.scenario(), to.scenario);
    to.config = ewa::config::SolveConfig{};
    if (from.has_config()) {
        from_proto(from.config(), to.config);
    }
}

// ==================== 规划响应 ====================

inline void to_proto(const ewa::analysis::ConvergenceAnalysis& from, ewa::pb::ConvergenceAnalysis* to) {
    to->set_final_best_fitness(from.final_best_fitness);
    to->set_final_avg_fitness(from.final_avg_fitness);
    to->set_convergence_generation(from.convergence_generation);
    to->set_improvement_ratio(from.improvement_ratio);
    to->set_stability(from.stability);
}

inline void from_proto(const ewa::pb::ConvergenceAnalysis& from, ewa::analysis::ConvergenceAnalysis& to) {
    to.final_best_fitness = from.final_best_fitness();
    to.final_avg_fitness = from.final_avg_fitness();
    to.convergence_generation = from.convergence_generation();
    to.improvement_ratio = from.improvement_ratio();
    to.stability = from.stability();
}

inline void to_proto(const ewa::analysis::AssignmentReport& from, ewa::pb::AssignmentReport* to) {
    auto* summary = to->mutable_summary();
    summary->set_total_effectiveness(from.summary.total_effectiveness);
    summary->set_resource_utilization(from.summary.resource_utilization);
    summary->set_interruption_count(from.summary.interruption_count);
    summary->set_assigned_jammers(from.summary.assigned_jammers);
    summary->set_total_jammers(from.summary.total_jammers);

    for (const auto& row : from.assignments) {
        auto* pb_row = to->add_assignments();
        pb_row->set_jammer_id(row.jammer_id);
        pb_row->set_jammer_name(row.jammer_name);
        pb_row->set_target_id(row.target_id);
        pb_row->set_target_name(row.target_name);
        pb_row->set_technique(to_proto_technique(row.technique));
        pb_row->set_bw_type(to_proto_bandwidth(row.bandwidth));
        pb_row->set_effectiveness(row.effectiveness);
        pb_row->set_radar_stage(to_proto_stage(row.radar_stage));
    }

    for (const auto& [radar_id, effect] : from.radar_effects) {
        (*to->mutable_radar_effects())[radar_id] = effect;
    }
}

inline void from_proto(const ewa::pb::AssignmentReport& from, ewa::analysis::AssignmentReport& to) {
    const auto& summary = from.summary();
    to.summary.total_effectiveness = summary.total_effectiveness();
    to.summary.resource_utilization = summary.resource_utilization();
    to.summary.interruption_count = summary.interruption_count();
    to.summary.assigned_jammers = summary.assigned_jammers();
    to.summary.total_jammers = summary.total_jammers();

    to.assignments.clear();
    for (const auto& pb_row : from.assignments()) {
        ewa::analysis::AssignmentRow row;
        row.jammer_id = pb_row.jammer_id();
        row.jammer_name = pb_row.jammer_name();
        row.target_id = pb_row.target_id();
        row.target_name = pb_row.target_name();
        row.technique = from_proto_technique(pb_row.technique());
        row.bandwidth = from_proto_bandwidth(pb_row.bw_type());
        row.effectiveness = pb_row.effectiveness();
        row.radar_stage = from_proto_stage(pb_row.radar_stage());
        to.assignments.push_back(std::move(row));
    }

    to.radar_effects.clear();
    for (const auto& pair : from.radar_effects()) {
        to.radar_effects[pair.first] = pair.second;
    }
}

inline void to_proto(const ewa::proto::PlanResponse& from, ewa::pb::PlanResponse* to) {
    to->set_status(from.status);
    to->set_error_msg(from.error_msg);
    to->set_timestamp(from.timestamp);
    to->set_success(from.success);
    to->set_optimization_time(from.optimization_time);

    for (const auto& [jammer_id, entry] : from.best_solution) {
        auto& pb_entry = (*to->mutable_best_solution())[jammer_id];
        pb_entry.set_target_id(entry.target_id);
        pb_entry.set_technique(to_proto_technique(entry.technique));
        pb_entry.set_bw_type(to_proto_bandwidth(entry.bw_type));
        pb_entry.set_jammer_power(entry.jammer_power);
    }

    to->set_best_fitness(from.best_fitness);
    to_proto(from.convergence_analysis, to->mutable_convergence_analysis());
    to_proto(from.assignment_report, to->mutable_assignment_report());

    for (const auto& rec : from.convergence_data) {
        auto* point = to->add_convergence_data();
        point->set_generation(rec.generation);
        point->set_avg_fitness(rec.avg_fitness);
        point->set_max_fitness(rec.max_fitness);
        point->set_best_fitness(rec.best_fitness);
    }

    to->set_resource_utilization(from.resource_utilization);
}

inline void from_proto(const ewa::pb::PlanResponse& from, ewa::proto::PlanResponse& to) {
    to.type = "plan_response";
    to.status = from.status();
    to.error_msg = from.error_msg();
    to.timestamp = from.timestamp();
    to.success = from.success();
    to.optimization_time = from.optimization_time();

    to.best_solution.clear();
    for (const auto& pair : from.best_solution()) {
        ewa::proto::SolutionEntry entry;
        entry.target_id = pair.second.target_id();
        entry.technique = from_proto_technique(pair.second.technique());
        entry.bw_type = from_proto_bandwidth(pair.second.bw_type());
        entry.jammer_power = pair.second.jammer_power();
        to.best_solution[pair.first] = entry;
    }

    to.best_fitness = from.best_fitness();
    from_proto(from.convergence_analysis(), to.convergence_analysis);
    from_proto(from.assignment_report(), to.assignment_report);

    to.convergence_data.clear();
    for (const auto& point : from.convergence_data()) {
        ewa::types::ConvergenceRecord rec;
        rec.generation = point.generation();
        rec.avg_fitness = point.avg_fitness();
        rec.max_fitness = point.max_fitness();
        rec.best_fitness = point.best_fitness();
        to.convergence_data.push_back(rec);
    }

    to.resource_utilization = from.resource_utilization();
}

// ==================== 运行统计 ====================

inline void to_proto(const ewa::proto::StatisticsResponse& from, ewa::pb::StatisticsResponse* to) {
    to->set_total_runs(from.total_runs);
    to->set_avg_fitness(from.avg_fitness);
    to->set_std_fitness(from.std_fitness);
    to->set_max_fitness(from.max_fitness);
    to->set_avg_time(from.avg_time);
    to->set_success_rate(from.success_rate);
}

inline void from_proto(const ewa::pb::StatisticsResponse& from, ewa::proto::StatisticsResponse& to) {
    to.total_runs = from.total_runs();
    to.avg_fitness = from.avg_fitness();
    to.std_fitness = from.std_fitness();
    to.max_fitness = from.max_fitness();
    to.avg_time = from.avg_time();
    to.success_rate = from.success_rate();
}

// ==================== 序列化/反序列化辅助函数 ====================

inline std::string serialize_protobuf(const google::protobuf::Message& msg) {
    std::string output;
    msg.SerializeToString(&output);
    return output;
}

template<typename T>
inline bool deserialize_protobuf(const std::string& data, T& msg) {
    return msg.ParseFromString(data);
}

// ==================== EWAMessage 包装器 ====================

inline std::string serialize_plan_request(const ewa::proto::PlanRequest& request) {
    ewa::pb::EWAMessage msg;
    to_proto(request, msg.mutable_plan_request());
    return serialize_protobuf(msg);
}

inline std::string serialize_plan_response(const ewa::proto::PlanResponse& response) {
    ewa::pb::EWAMessage msg;
    to_proto(response, msg.mutable_plan_response());
    return serialize_protobuf(msg);
}

inline std::string serialize_stats_request(double timestamp) {
    ewa::pb::EWAMessage msg;
    msg.mutable_stats_request()->set_timestamp(timestamp);
    return serialize_protobuf(msg);
}

inline std::string serialize_stats_response(const ewa::proto::StatisticsResponse& stats) {
    ewa::pb::EWAMessage msg;
    to_proto(stats, msg.mutable_stats_response());
    return serialize_protobuf(msg);
}

inline bool deserialize_plan_response(const std::string& data, ewa::proto::PlanResponse& response) {
    ewa::pb::EWAMessage msg;
    if (!deserialize_protobuf(data, msg)) {
        return false;
    }
    if (!msg.has_plan_response()) {
        return false;
    }
    from_proto(msg.plan_response(), response);
    return true;
}

inline bool deserialize_stats_response(const std::string& data, ewa::proto::StatisticsResponse& stats) {
    ewa::pb::EWAMessage msg;
    if (!deserialize_protobuf(data, msg)) {
        return false;
    }
    if (!msg.has_stats_response()) {
        return false;
    }
    from_proto(msg.stats_response(), stats);
    return true;
}

} // namespace ewa::net
