#include "cmd_serve.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "gauntlet/a2a_codec.h"
#include "gauntlet/diag.h"
#include "gauntlet/request_handler.h"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <system_error>
#include <thread>
#include <vector>

#ifndef _WIN32

#include <arpa/inet.h>
#include <csignal>
#include <netinet/in.h>
#include <poll.h>

using namespace gauntlet;

static std::atomic<bool> g_serve_running{true};
static std::atomic<CancelToken*> g_serve_cancel{nullptr};

static void on_serve_signal(int) {
    g_serve_running.store(false);
    if (CancelToken* c = g_serve_cancel.load()) c->cancel();
}

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: writing to disconnected clients should not crash the server
    ::signal(SIGPIPE, SIG_IGN);

    EvalConfig cfg = load_config_with_profile();
    std::string host = "127.0.0.1";
    int port = 9009;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        std::string err;
        if (parse_eval_flag(argc, argv, i, cfg, &err)) {
            if (!err.empty()) { std::cerr << err << "\n"; return 2; }
            continue;
        }
        if (a == "--host" && i + 1 < argc) { host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) {
            if (!parse_int_in_range(argv[++i], 1, 65535, &port)) { std::cerr << "bad port\n"; return 2; }
            continue;
        }
        std::cerr << "unknown argument: " << a << "\n";
        return 2;
    }

    std::string api_token = getenv_str("GAUNTLET_API_TOKEN", "");
    const bool require_token = getenv_int("GAUNTLET_API_REQUIRE_TOKEN", 0) != 0;
    if (api_token.empty() && require_token) {
        std::cerr << "[WARN] GAUNTLET_API_REQUIRE_TOKEN=1 but GAUNTLET_API_TOKEN is unset.\n";
        std::cerr << "[WARN] JSON-RPC requests will be rejected (fail-closed).\n";
    }
    size_t max_body_bytes = (size_t)std::max(1024, getenv_int("GAUNTLET_API_MAX_BODY_BYTES", 1024 * 1024));

    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return 2;
    }

    auto stack = build_eval_stack(cfg);
    RequestHandler handler(*stack->evaluator);
    const std::string card = agent_card_json("http://" + host + ":" + std::to_string(port) + "/");

    g_serve_running.store(true);
    g_serve_cancel.store(&stack->evaluator->cancel_token());
    std::signal(SIGTERM, on_serve_signal);
    std::signal(SIGINT, on_serve_signal);

    constexpr int max_http_conns = 32;
    std::atomic<int> active_conns{0};
    ConnThreads http_threads;

    std::cerr << "[serve] http://" << host << ":" << port << " dataset=" << cfg.dataset
              << " participant=" << cfg.participant_url << "\n";

    while (g_serve_running.load()) {
        http_threads.reap();
        struct pollfd pfd{sfd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 200);
        if (pr <= 0) continue;

        sockaddr_in caddr{}; socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) continue;
        if (active_conns.load() >= max_http_conns) {
            send_json(cfd, 503, "{\"ok\":false,\"error\":\"too many connections\"}");
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10);

        try {
            http_threads.spawn([&, cfd]() {
                struct ConnGuard { std::atomic<int>& c; int fd; ~ConnGuard() { ::close(fd); c.fetch_sub(1); } } cg{active_conns, cfd};

                HttpRequest req;
                HttpReadStatus rs = read_http_request(cfd, req, max_body_bytes);
                if (rs == HttpReadStatus::TOO_LARGE) {
                    send_json(cfd, 413, "{\"ok\":false,\"error\":\"payload too large\"}");
                    return;
                }
                if (rs == HttpReadStatus::MALFORMED) {
                    send_json(cfd, 400, "{\"ok\":false,\"error\":\"bad request\"}");
                    return;
                }
                if (rs != HttpReadStatus::OK) return;

                const std::string& method = req.method;
                const std::string& path = req.path;
                if (method == "GET" && path == "/health") {
                    send_json(cfd, 200, "{\"ok\":true,\"status\":\"" +
                              std::string(run_status_name(stack->evaluator->status())) + "\"}");
                    return;
                }
                if (method == "GET" && (path == "/.well-known/agent.json" || path == "/.well-known/agent-card.json")) {
                    send_json(cfd, 200, card);
                    return;
                }
                if (path != "/") {
                    send_json(cfd, 404, "{\"ok\":false,\"error\":\"not found\"}");
                    return;
                }
                if (method != "POST") {
                    send_json(cfd, 405, "{\"ok\":false,\"error\":\"method not allowed\"}");
                    return;
                }
                if ((require_token && api_token.empty()) || !bearer_token_ok(req, api_token)) {
                    send_json(cfd, 401, "{\"ok\":false,\"error\":\"unauthorized\"}");
                    return;
                }

                RpcCall call = parse_rpc_call(req.body);
                if (!call.ok) {
                    send_json(cfd, 200, rpc_error(call.id_json, call.error_code, call.error));
                    return;
                }
                log_debug("serve", call.method + " task=" + call.ctx.task_id);
                std::vector<OutboundEvent> events = handler.handle(call.ctx);
                send_json(cfd, 200, rpc_result(call, events));
            });
        } catch (const std::system_error& e) {
            log_warn("serve", std::string("cannot start connection thread: ") + e.what());
            send_json(cfd, 503, "{\"ok\":false,\"error\":\"server busy\"}");
            ::close(cfd);
            active_conns.fetch_sub(1);
        }
    }

    std::cerr << "[serve] shutting down\n";
    // graceful shutdown: join all HTTP threads before destroying shared state
    http_threads.join_all();
    ::close(sfd);
    g_serve_cancel.store(nullptr);
    stack->sandboxes->destroy_all();
    return 0;
}

#else
int cmd_serve(int, char**) {
    std::cerr << "serve not supported on Windows build\n";
    return 2;
}
#endif
