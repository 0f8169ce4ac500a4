#pragma once

// Minimal HTTP/1.1 plumbing for the A2A endpoint in cmd_serve.cpp.

#ifndef _WIN32

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace gauntlet {

struct HttpRequest {
    std::string method;
    std::string path;   // query string stripped
    std::string query;
    std::map<std::string, std::string> headers;  // lowercase names
    std::string body;

    std::string header(const std::string& name_lower) const {
        auto it = headers.find(name_lower);
        return it == headers.end() ? std::string() : it->second;
    }
};

enum class HttpReadStatus { OK, CLOSED, MALFORMED, TOO_LARGE };

// recv/send timeouts so a slow client cannot pin a connection slot.
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

inline std::string lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

inline std::string trim_ows(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) e--;
    return s.substr(b, e - b);
}

// Parses the request line and header block (without the blank line).
// A repeated Content-Length is rejected.
inline HttpReadStatus parse_http_head(const std::string& head, HttpRequest& req) {
    std::istringstream iss(head);
    std::string line;
    if (!std::getline(iss, line)) return HttpReadStatus::MALFORMED;
    {
        std::istringstream rl(trim_ows(line));
        std::string target, version;
        if (!(rl >> req.method >> target >> version)) return HttpReadStatus::MALFORMED;
        if (version.rfind("HTTP/", 0) != 0) return HttpReadStatus::MALFORMED;
        size_t q = target.find('?');
        req.path = target.substr(0, q);
        if (q != std::string::npos) req.query = target.substr(q + 1);
    }
    while (std::getline(iss, line)) {
        line = trim_ows(line);
        if (line.empty()) continue;
        size_t c = line.find(':');
        if (c == std::string::npos || c == 0) return HttpReadStatus::MALFORMED;
        std::string name = lower_ascii(line.substr(0, c));
        if (name == "content-length" && req.headers.count(name)) return HttpReadStatus::MALFORMED;
        req.headers[name] = trim_ows(line.substr(c + 1));
    }
    return HttpReadStatus::OK;
}

// Reads one request. Bodies larger than max_body are refused from the
// Content-Length alone, before reading them.
inline HttpReadStatus read_http_request(int fd, HttpRequest& req, size_t max_body) {
    const size_t kHeadCap = 64 * 1024;
    std::string buf(8192, '\0');
    std::string all;
    size_t end = std::string::npos;
    while ((end = all.find("\r\n\r\n")) == std::string::npos) {
        ssize_t n = ::recv(fd, &buf[0], buf.size(), 0);
        if (n <= 0) return HttpReadStatus::CLOSED;
        all.append(buf.data(), (size_t)n);
        if (all.size() > kHeadCap) return HttpReadStatus::TOO_LARGE;
    }

    HttpReadStatus st = parse_http_head(all.substr(0, end), req);
    if (st != HttpReadStatus::OK) return st;

    size_t content_length = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        if (cl.find_first_not_of("0123456789") != std::string::npos || cl.size() > 18) {
            return HttpReadStatus::MALFORMED;
        }
        content_length = (size_t)std::stoull(cl);
    }
    if (content_length > max_body) return HttpReadStatus::TOO_LARGE;

    req.body = all.substr(end + 4);
    while (req.body.size() < content_length) {
        ssize_t n = ::recv(fd, &buf[0], buf.size(), 0);
        if (n <= 0) return HttpReadStatus::CLOSED;
        req.body.append(buf.data(), (size_t)n);
    }
    req.body.resize(content_length);
    return HttpReadStatus::OK;
}

inline const char* http_reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 503: return "Service Unavailable";
    }
    return "Error";
}

inline void send_json(int fd, int code, const std::string& json) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << http_reason(code) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << json.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << json;
    const std::string s = oss.str();
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

// Comparison time depends only on the longer input.
inline bool constant_time_eq(const std::string& a, const std::string& b) {
    const size_t len = a.size() > b.size() ? a.size() : b.size();
    volatile uint8_t diff = a.size() != b.size() ? 1 : 0;
    for (size_t i = 0; i < len; i++) {
        uint8_t ca = i < a.size() ? (uint8_t)a[i] : 0;
        uint8_t cb = i < b.size() ? (uint8_t)b[i] : 0;
        diff |= ca ^ cb;
    }
    return diff == 0;
}

// Accepts "Authorization: Bearer <token>" or "X-API-Token: <token>".
// An empty expected token disables the check.
inline bool bearer_token_ok(const HttpRequest& req, const std::string& expected) {
    if (expected.empty()) return true;
    std::string x = req.header("x-api-token");
    if (!x.empty() && constant_time_eq(x, expected)) return true;
    const std::string auth = req.header("authorization");
    const std::string pfx = "Bearer ";
    return auth.rfind(pfx, 0) == 0 && constant_time_eq(auth.substr(pfx.size()), expected);
}

// One thread per connection. Finished threads are joined by reap(), which
// the accept loop calls every iteration; join_all() waits for the rest.
// Not thread-safe: owned by the accept loop.
class ConnThreads {
public:
    ConnThreads() = default;
    ConnThreads(const ConnThreads&) = delete;
    ConnThreads& operator=(const ConnThreads&) = delete;
    ~ConnThreads() { join_all(); }

    void spawn(std::function<void()> fn) {
        threads_.reserve(threads_.size() + 1);
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([fn = std::move(fn), done]() {
            struct DoneGuard {
                std::atomic<bool>& d;
                ~DoneGuard() { d.store(true); }
            } g{*done};
            fn();
        });
        threads_.push_back(Entry{std::move(t), std::move(done)});
    }

    // Returns the number of threads joined.
    size_t reap() {
        size_t joined = 0;
        std::vector<Entry> keep;
        keep.reserve(threads_.size());
        for (auto& e : threads_) {
            if (e.done->load()) {
                if (e.th.joinable()) e.th.join();
                joined++;
            } else {
                keep.push_back(std::move(e));
            }
        }
        threads_.swap(keep);
        return joined;
    }

    void join_all() {
        for (auto& e : threads_) {
            if (e.th.joinable()) e.th.join();
        }
        threads_.clear();
    }

    size_t size() const { return threads_.size(); }

private:
    struct Entry {
        std::thread th;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::vector<Entry> threads_;
};

} // namespace gauntlet

#endif // !_WIN32
