#include "solver_server.hpp"
#include <cerrno>
#include <cstring>
#include <glog/logging.h>
#include <zmq.h>

namespace ewa::net {

namespace {

struct ZmqCtx {
    void* ctx{nullptr};
    ZmqCtx() { ctx = zmq_ctx_new(); }
    ~ZmqCtx() { if (ctx) zmq_ctx_term(ctx); }
};

struct ZmqSocket {
    void* sock{nullptr};
    ZmqSocket(void* ctx, int type) { sock = ctx ? zmq_socket(ctx, type) : nullptr; }
    ~ZmqSocket() { if (sock) zmq_close(sock); }
};

} // namespace

// ==================== ZmqSolverServer ====================

ZmqSolverServer::ZmqSolverServer(const ZmqSolverServerOptions& opts, SolverService& service)
    : opts_(opts), service_(service) {
}

ZmqSolverServer::~ZmqSolverServer() {
    stop();
}

bool ZmqSolverServer::run() {
    ZmqCtx ctx;
    ZmqSocket rep(ctx.ctx, ZMQ_REP);
    if (!rep.sock) {
        LOG(ERROR) << "Failed to create ZMQ socket";
        return false;
    }

    int to = opts_.poll_timeout_ms;
    zmq_setsockopt(rep.sock, ZMQ_RCVTIMEO, &to, sizeof(to));
    int linger = 0;
    zmq_setsockopt(rep.sock, ZMQ_LINGER, &linger, sizeof(linger));

    if (zmq_bind(rep.sock, opts_.endpoint.c_str()) != 0) {
        LOG(ERROR) << "Failed to bind " << opts_.endpoint << ": " << zmq_strerror(zmq_errno());
        return false;
    }
    LOG(INFO) << "Solver service listening on " << opts_.endpoint;

    running_ = true;
    bool ok = true;
    while (!stop_requested_) {
        zmq_msg_t req;
        zmq_msg_init(&req);
        const int rc = zmq_msg_recv(&req, rep.sock, 0);
        if (rc < 0) {
            zmq_msg_close(&req);
            if (zmq_errno() == EAGAIN || zmq_errno() == EINTR) continue;  // 超时或信号，检查停止标志
            LOG(ERROR) << "Failed to receive ZMQ request: " << zmq_strerror(zmq_errno());
            ok = false;
            break;
        }
        std::string payload(static_cast<char*>(zmq_msg_data(&req)), zmq_msg_size(&req));
        zmq_msg_close(&req);

        const std::string reply = service_.handle(payload);

        // REP 必须应答后才能接收下一条，应答失败后套接字不可再用
        zmq_msg_t rep_msg;
        if (zmq_msg_init_size(&rep_msg, reply.size()) != 0) {
            LOG(ERROR) << "Failed to allocate ZMQ reply: " << zmq_strerror(zmq_errno());
            ok = false;
            break;
        }
        memcpy(zmq_msg_data(&rep_msg), reply.data(), reply.size());
        if (zmq_msg_send(&rep_msg, rep.sock, 0) < 0) {
            LOG(ERROR) << "Failed to send ZMQ reply: " << zmq_strerror(zmq_errno());
            zmq_msg_close(&rep_msg);
            ok = false;
            break;
        }
    }

    running_ = false;
    if (ok) {
        LOG(INFO) << "Solver service stopped";
    }
    return ok;
}

} // namespace ewa::net
