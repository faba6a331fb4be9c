#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "solver_messages.hpp"

namespace ewa::net {

using namespace std::chrono;

/**
 * @brief 求解服务客户端（供展示层调用）
 */
struct ISolverClient {
    virtual ~ISolverClient() = default;

    // 请求一次干扰资源分配
    virtual bool request_plan(const ewa::proto::PlanRequest& req,
                              ewa::proto::PlanResponse& out,
                              milliseconds timeout = milliseconds(3000)) = 0;

    // 查询最近运行统计
    virtual bool request_statistics(ewa::proto::StatisticsResponse& out,
                                    milliseconds timeout = milliseconds(500)) = 0;
};

struct ZmqSolverClientOptions {
    std::string endpoint{"tcp://127.0.0.1:5555"};
};

std::unique_ptr<ISolverClient> make_zmq_solver_client(const ZmqSolverClientOptions&);

} // namespace ewa::net
