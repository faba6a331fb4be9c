#include "solver_server.hpp"
#include "protobuf_adapter.hpp"
#include "../core/enum_strings.hpp"
#include "ewa_messages.pb.h"
#include <chrono>
#include <glog/logging.h>

namespace ewa::net {

namespace {

double now_sec() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

SolverService::SolverService(const ewa::config::SolveConfig& defaults)
    : controller_(defaults) {
}

std::string SolverService::handle(const std::string& payload) {
    ewa::pb::EWAMessage msg;
    if (!deserialize_protobuf(payload, msg)) {
        LOG(WARNING) << "Malformed request: " << payload.size() << " bytes";
        return serialize_plan_response(ewa::proto::make_error_response("malformed payload", now_sec()));
    }

    switch (msg.payload_case()) {
        case ewa::pb::EWAMessage::kPlanRequest:
            return handle_plan(msg.plan_request());
        case ewa::pb::EWAMessage::kStatsRequest: {
            const auto stats = controller_.get_optimization_statistics();
            LOG(INFO) << "Statistics request: total_runs=" << stats.total_runs;
            return serialize_stats_response(stats);
        }
        default:
            LOG(WARNING) << "Unsupported message, payload case " << msg.payload_case();
            return serialize_plan_response(ewa::proto::make_error_response("unsupported message", now_sec()));
    }
}

std::string SolverService::handle_plan(const ewa::pb::PlanRequest& pb_req) {
    ewa::proto::PlanRequest req;
    from_proto(pb_req, req);
    LOG(INFO) << "Plan request: " << req.scenario.radars.size() << " radars, "
              << req.scenario.jammers.size() << " jammers, reason=" << req.reason;
    for (const auto& radar : req.scenario.radars) {
        VLOG(1) << "  radar " << radar.id << " stage=" << ewa::types::to_string(radar.current_stage);
    }

    try {
        controller_.reconfigure(req.config);
        const auto result = controller_.run_optimization(req.scenario);
        const auto resp = ewa::proto::make_plan_response(result, req.scenario, now_sec());
        std::string out = serialize_plan_response(resp);
        LOG(INFO) << "Plan response: fitness=" << resp.best_fitness << ", " << out.size() << " bytes";
        return out;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Optimization failed: " << e.what();
        return serialize_plan_response(ewa::proto::make_error_response(e.what(), now_sec()));
    }
}

} // namespace ewa::net
