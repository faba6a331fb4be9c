#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "../core/config.hpp"
#include "../orchestrator/optimization_controller.hpp"

namespace ewa::pb {
class PlanRequest;
}

namespace ewa::net {

/**
 * @brief 求解服务的协议处理（与传输层无关）
 *
 * 输入/输出都是序列化后的 EWAMessage：
 * - plan_request  → 运行一次优化，回复 plan_response
 * - stats_request → 回复最近运行的 stats_response
 * 无法解析或不支持的消息回复 status="error" 的 plan_response。
 */
class SolverService {
public:
    explicit SolverService(const ewa::config::SolveConfig& defaults = {});

    std::string handle(const std::string& payload);

    const ewa::orch::OptimizationController& controller() const { return controller_; }

private:
    std::string handle_plan(const ewa::pb::PlanRequest& pb_req);

    ewa::orch::OptimizationController controller_;
};

struct ZmqSolverServerOptions {
    std::string endpoint{"tcp://*:5555"};
    int poll_timeout_ms{200};  // 接收超时，用于检查停止标志
};

/**
 * @brief ZMQ REP 服务端：逐个接收请求并同步应答
 */
class ZmqSolverServer {
public:
    ZmqSolverServer(const ZmqSolverServerOptions& opts, SolverService& service);
    ~ZmqSolverServer();

    /**
     * @brief 阻塞运行，直到 stop() 被调用
     * @return 绑定失败或收发出错退出时返回 false，stop() 正常停止时返回 true
     */
    bool run();

    // 可在 run() 之前或其他线程中调用
    void stop() { stop_requested_ = true; }
    bool is_running() const { return running_; }

private:
    ZmqSolverServerOptions opts_;
    SolverService& service_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace ewa::net
