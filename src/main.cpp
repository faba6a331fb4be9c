#include <csignal>
#include <string>
#include <glog/logging.h>
#include "ewa/core/config.hpp"
#include "ewa/net/solver_server.hpp"

namespace {
// 信号处理只能访问全局对象
ewa::net::ZmqSolverServer* g_server = nullptr;

void on_signal(int) {
    if (g_server) g_server->stop();
}
}

int main(int argc, char** argv) {
    google::InitGoogleLogging("ewa_solver");
    FLAGS_logtostderr = true;

    ewa::net::ZmqSolverServerOptions opts;
    if (argc > 1) {
        opts.endpoint = argv[1];
    }

    // 默认配置，每个请求可以携带自己的配置覆盖
    ewa::config::SolveConfig defaults;
    ewa::net::SolverService service(defaults);
    ewa::net::ZmqSolverServer server(opts, service);

    g_server = &server;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    LOG(INFO) << "ewa_solver starting, endpoint=" << opts.endpoint;
    const bool ok = server.run();
    g_server = nullptr;

    if (!ok) {
        LOG(ERROR) << "ewa_solver stopped on error";
        return 1;
    }
    LOG(INFO) << "ewa_solver exited, runs served: "
              << service.controller().get_optimization_statistics().total_runs;
    google::ShutdownGoogleLogging();
    return 0;
}
