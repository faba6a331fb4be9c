#pragma once
#include <algorithm>
#include <map>
#include <string>
#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../orchestrator/optimization_controller.hpp"

/**
 * @file solver_messages.hpp
 * @brief C++消息包装器
 *
 * 线上格式定义在 proto/ewa_messages.proto，
 * 序列化/反序列化由 ewa/net/protobuf_adapter.hpp 负责。
 * best_solution 在这里已经换成以干扰机ID为键、雷达ID为值的线上形式。
 */

namespace ewa::proto {

// best_solution 中的一项
struct SolutionEntry {
    std::string                  target_id;  // 空表示不分配
    ewa::types::JammingTechnique technique{ewa::types::JammingTechnique::NJ};
    ewa::types::BandwidthMode    bw_type{ewa::types::BandwidthMode::Medium};
    double                       jammer_power{0.0};
};

// 规划请求
struct PlanRequest {
    std::string              type{"plan_request"};
    double                   timestamp{0.0};
    std::string              reason;
    ewa::types::Scenario     scenario{};
    ewa::config::SolveConfig config{};
};

// 规划响应
struct PlanResponse {
    std::string                                   type{"plan_response"};
    std::string                                   status;     // "ok", "error"
    std::string                                   error_msg;
    double                                        timestamp{0.0};
    bool                                          success{false};
    double                                        optimization_time{0.0};
    std::map<ewa::types::JammerId, SolutionEntry> best_solution;
    double                                        best_fitness{0.0};
    ewa::analysis::ConvergenceAnalysis            convergence_analysis{};
    ewa::analysis::AssignmentReport               assignment_report{};
    ewa::types::ConvergenceHistory                convergence_data;
    double                                        resource_utilization{0.0};
};

using StatisticsResponse = ewa::orch::OptimizationStatistics;

/**
 * @brief 把控制器结果转换成线上形式（下标 → ID）
 */
inline PlanResponse make_plan_response(const ewa::orch::OptimizationResult& result,
                                       const ewa::types::Scenario& scenario,
                                       double timestamp) {
    PlanResponse resp;
    resp.status = result.success ? "ok" : "error";
    resp.timestamp = timestamp;
    resp.success = result.success;
    resp.optimization_time = result.optimization_time;
    resp.best_fitness = result.best_fitness;
    resp.convergence_analysis = result.convergence_analysis;
    resp.assignment_report = result.assignment_report;
    resp.convergence_data = result.convergence_data;
    resp.resource_utilization = result.resource_utilization;

    const size_t n = std::min(result.best_solution.size(), scenario.jammers.size());
    for (size_t j = 0; j < n; ++j) {
        const auto& gene = result.best_solution[j];
        const auto& jammer = scenario.jammers[j];

        SolutionEntry entry;
        if (gene.has_target() && *gene.target < scenario.radars.size()) {
            entry.target_id = scenario.radars[*gene.target].id;
        }
        entry.technique = gene.technique;
        entry.bw_type = gene.bandwidth;
        entry.jammer_power = jammer.power;
        resp.best_solution[jammer.id] = entry;
    }
    return resp;
}

inline PlanResponse make_error_response(const std::string& error_msg, double timestamp) {
    PlanResponse resp;
    resp.status = "error";
    resp.error_msg = error_msg;
    resp.timestamp = timestamp;
    resp.success = false;
    return resp;
}

} // namespace ewa::proto
