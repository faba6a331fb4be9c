#include "solver_client.hpp"
#include "protobuf_adapter.hpp"
#include "../core/enum_strings.hpp"
#include <cstring>
#include <glog/logging.h>
#include <zmq.h>

namespace ewa::net {

namespace {

double now_sec() {
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

struct ZmqCtx {
    void* ctx{nullptr};
    ZmqCtx() { ctx = zmq_ctx_new(); }
    ~ZmqCtx() { if (ctx) zmq_ctx_term(ctx); }
};

// 一次 REQ/REP 往返，每次请求使用独立 socket，超时后不会卡在 REQ 状态机上
bool send_zmq_message(const std::string& endpoint, const std::string& payload,
                      std::string& response, milliseconds timeout) {
    ZmqCtx ctx;
    void* sock = zmq_socket(ctx.ctx, ZMQ_REQ);
    if (!sock) {
        LOG(ERROR) << "Failed to create ZMQ socket";
        return false;
    }

    int to = static_cast<int>(timeout.count());
    int linger = 0;
    zmq_setsockopt(sock, ZMQ_RCVTIMEO, &to, sizeof(to));
    zmq_setsockopt(sock, ZMQ_SNDTIMEO, &to, sizeof(to));
    zmq_setsockopt(sock, ZMQ_LINGER, &linger, sizeof(linger));

    if (zmq_connect(sock, endpoint.c_str()) != 0) {
        LOG(ERROR) << "Failed to connect to " << endpoint;
        zmq_close(sock);
        return false;
    }

    zmq_msg_t zmsg;
    zmq_msg_init_size(&zmsg, payload.size());
    memcpy(zmq_msg_data(&zmsg), payload.data(), payload.size());

    if (zmq_msg_send(&zmsg, sock, 0) < 0) {
        LOG(ERROR) << "Failed to send ZMQ message";
        zmq_msg_close(&zmsg);
        zmq_close(sock);
        return false;
    }

    zmq_msg_t rep;
    zmq_msg_init(&rep);
    if (zmq_msg_recv(&rep, sock, 0) < 0) {
        LOG(ERROR) << "Failed to receive ZMQ response";
        zmq_msg_close(&rep);
        zmq_close(sock);
        return false;
    }
    response.assign(static_cast<char*>(zmq_msg_data(&rep)), zmq_msg_size(&rep));
    zmq_msg_close(&rep);
    zmq_close(sock);
    return true;
}

class ZmqSolverClient final : public ISolverClient {
public:
    explicit ZmqSolverClient(const ZmqSolverClientOptions& o) : opts_(o) {}

    bool request_plan(const ewa::proto::PlanRequest& req, ewa::proto::PlanResponse& out,
                      milliseconds timeout) override {
        LOG(INFO) << "Requesting plan: " << req.scenario.radars.size() << " radars, "
                  << req.scenario.jammers.size() << " jammers, reason=" << req.reason;

        std::string response;
        if (!send_zmq_message(opts_.endpoint, serialize_plan_request(req), response, timeout)) {
            LOG(ERROR) << "Failed to send plan request";
            return false;
        }
        if (!deserialize_plan_response(response, out)) {
            LOG(ERROR) << "Failed to deserialize plan response";
            return false;
        }

        LOG(INFO) << "Received plan: status=" << out.status
                  << ", fitness=" << out.best_fitness
                  << ", assignments=" << out.best_solution.size();
        for (const auto& [jammer_id, entry] : out.best_solution) {
            VLOG(1) << "  " << jammer_id << " -> "
                    << (entry.target_id.empty() ? "(none)" : entry.target_id)
                    << " " << ewa::types::to_string(entry.technique)
                    << "/" << ewa::types::to_string(entry.bw_type);
        }
        return out.status == "ok";
    }

    bool request_statistics(ewa::proto::StatisticsResponse& out, milliseconds timeout) override {
        std::string response;
        if (!send_zmq_message(opts_.endpoint, serialize_stats_request(now_sec()), response, timeout)) {
            LOG(ERROR) << "Failed to send statistics request";
            return false;
        }
        if (!deserialize_stats_response(response, out)) {
            LOG(ERROR) << "Failed to deserialize statistics response";
            return false;
        }
        return true;
    }

private:
    ZmqSolverClientOptions opts_;
};

} // namespace

std::unique_ptr<ISolverClient> make_zmq_solver_client(const ZmqSolverClientOptions& opts) {
    return std::make_unique<ZmqSolverClient>(opts);
}

} // namespace ewa::net
