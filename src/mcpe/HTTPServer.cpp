//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpe/HTTPServer.cpp
// Purpose: HTTP/HTTPS listener using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>
#include <sys/socket.h>

#include "mcpe/HTTPServer.hpp"
#include "mcpe/Protocol.h"
#include "mcpe/SSE.h"

namespace mcpe {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

using PlainStream = tcp::socket;
using TlsStream = ssl::stream<tcp::socket>;
using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Counts in-flight requests and open SSE streams so Stop can wait them out
struct ActivityTracker {
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t active{0};

    void enter() {
        std::lock_guard<std::mutex> lock(mutex);
        ++active;
    }
    void leave() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --active;
        }
        cv.notify_all();
    }
    bool waitIdle(std::chrono::milliseconds grace) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, grace, [this] { return active == 0; });
    }
};

class ActivityScope {
public:
    explicit ActivityScope(std::shared_ptr<ActivityTracker> t) : tracker(std::move(t)) { tracker->enter(); }
    ~ActivityScope() { tracker->leave(); }
    ActivityScope(const ActivityScope&) = delete;
    ActivityScope& operator=(const ActivityScope&) = delete;

private:
    std::shared_ptr<ActivityTracker> tracker;
};

tcp::socket& peerSocket(PlainStream& s) {
    return s;
}

tcp::socket& peerSocket(TlsStream& s) {
    return s.next_layer();
}

//==========================================================================================================
// watchPeer
// Purpose: Requests stop on `cancel` when the client closes or resets its end while a request is in
//          flight. Readable data (a pipelined request, a TLS alert) ends the watch without cancelling.
//          The caller cancels the pending wait on the socket once the call has returned.
//==========================================================================================================
template <class Stream>
void watchPeer(std::shared_ptr<Stream> stream, std::shared_ptr<std::stop_source> cancel) {
    peerSocket(*stream).async_wait(tcp::socket::wait_read, [stream, cancel](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (!ec) {
            char peek;
            ssize_t n = ::recv(peerSocket(*stream).native_handle(), &peek, 1, MSG_PEEK | MSG_DONTWAIT);
            if (n > 0 || (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))) {
                return;
            }
        }
        cancel->request_stop();
    });
}

void unwatchPeer(tcp::socket& socket) {
    boost::system::error_code ec;
    socket.cancel(ec);
}

void finishStream(PlainStream& s) {
    boost::system::error_code ec;
    s.shutdown(tcp::socket::shutdown_send, ec);
}

void finishStream(TlsStream& s) {
    boost::system::error_code ec;
    s.shutdown(ec);
}

// SSE teardown never waits for the peer's close_notify
void abortStream(PlainStream& s) {
    boost::system::error_code ec;
    s.shutdown(tcp::socket::shutdown_both, ec);
    s.close(ec);
}

void abortStream(TlsStream& s) {
    boost::system::error_code ec;
    s.lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
    s.lowest_layer().close(ec);
}

//==========================================================================================================
// StreamSSEWriter
// Purpose: Synchronous SSE writer over a socket handed off from the I/O context. Each write reaches the
//          socket before returning, so every chunk is flushed.
//==========================================================================================================
template <class Stream>
class StreamSSEWriter : public sse::ISSEWriter {
public:
    StreamSSEWriter(Stream& stream, unsigned version) : stream(stream), version(version) {}

    bool SupportsFlush() const override { return true; }

    void WriteHeaders() override {
        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(http::field::connection, "keep-alive");
        res.set(http::field::access_control_allow_origin, "*");
        http::response_serializer<http::empty_body> sr{res};
        http::write_header(stream, sr);
    }

    void WriteAndFlush(const std::string& chunk) override {
        net::write(stream, net::buffer(chunk));
    }

private:
    Stream& stream;
    unsigned version;
};

std::string toString(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

std::pair<std::string, std::string> splitTarget(const std::string& target) {
    auto q = target.find('?');
    if (q == std::string::npos) {
        return {target, std::string()};
    }
    return {target.substr(0, q), target.substr(q + 1)};
}

std::optional<std::string> queryParam(const std::string& query, const std::string& key) {
    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string kv = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = kv.find('=');
        if (kv.substr(0, eq) == key) {
            return eq == std::string::npos ? std::string() : kv.substr(eq + 1);
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return std::nullopt;
}

void setBody(Response& res, http::status status, std::string body) {
    res.result(status);
    res.body() = std::move(body);
    res.prepare_payload();
}

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    Dependencies deps;
    std::atomic<bool> running{false};

    // Shared with SSE threads so a stream outliving Stop() never sees a destroyed context
    std::shared_ptr<net::io_context> ioc = std::make_shared<net::io_context>();
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::unique_ptr<net::thread_pool> workers;
    std::vector<std::thread> ioThreads;
    std::shared_ptr<ActivityTracker> tracker = std::make_shared<ActivityTracker>();
    std::stop_token root;
    unsigned short boundPort{0};

    std::mutex lifecycleMutex;
    bool stopped{false};

    HTTPServer::ErrorHandler errorHandler;

    Impl(const HTTPServer::Options& o, Dependencies d) : opts(o), deps(std::move(d)) {
        if (!deps.router || !deps.service || !deps.registry || !deps.logger) {
            throw std::invalid_argument("HTTPServer: router, service, registry and logger are required");
        }
        validatePort();
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR(*deps.logger, "HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HTTPServer: unsupported scheme: " + opts.scheme);
        }
        opts.ioThreads = std::max<std::size_t>(opts.ioThreads, 1);
        opts.workerThreads = std::max<std::size_t>(opts.workerThreads, 1);
    }

    ~Impl() {
        stop(std::chrono::milliseconds(0));
    }

    // Numeric and within [0, 65535]
    void validatePort() const {
        if (opts.port.empty() || opts.port.size() > 5 ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; }) ||
            std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer: invalid port: " + opts.port);
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR(*deps.logger, "{}", msg);
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    //////////////////////////////////////////// Routing ////////////////////////////////////////////
    template <class Stream>
    net::awaitable<Response> makeResponse(std::shared_ptr<Stream> stream, const Request& req, const std::string& path,
                                          const std::string& query) {
        Response res{http::status::ok, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);

        if (path == "/" || path == "/jsonrpc") {
            if (req.method() != http::verb::post) {
                setBody(res, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
                co_return res;
            }
            auto router = deps.router;
            auto callStop = std::make_shared<std::stop_source>();
            std::stop_callback fromRoot(root, [callStop] { callStop->request_stop(); });
            watchPeer(stream, callStop);
            auto reply = co_await net::co_spawn(
                workers->get_executor(),
                [router, body = req.body(), stop = callStop->get_token()]() -> net::awaitable<std::optional<std::string>> {
                    co_return router->HandleMessage(body, stop);
                },
                net::use_awaitable);
            unwatchPeer(peerSocket(*stream));
            if (reply.has_value()) {
                setBody(res, http::status::ok, std::move(*reply));
            } else {
                // One-way notification: acknowledged without a JSON-RPC body
                setBody(res, http::status::accepted, std::string());
            }
            co_return res;
        }

        if (path == "/events") {
            if (req.method() != http::verb::get) {
                setBody(res, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
                co_return res;
            }
            res.set(http::field::location, "/sse");
            setBody(res, http::status::found, std::string());
            co_return res;
        }

        if (path == "/sse") {
            // GET /sse never reaches here; it is handed off before routing
            setBody(res, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
            co_return res;
        }

        if (path == "/message") {
            if (req.method() != http::verb::post) {
                setBody(res, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
                co_return res;
            }
            auto registry = deps.registry;
            auto router = deps.router;
            auto logger = deps.logger;
            auto callStop = std::make_shared<std::stop_source>();
            std::stop_callback fromRoot(root, [callStop] { callStop->request_stop(); });
            watchPeer(stream, callStop);
            auto outcome = co_await net::co_spawn(
                workers->get_executor(),
                [registry, router, logger, sessionId = queryParam(query, "sessionId"), body = req.body(),
                 stop = callStop->get_token()]() -> net::awaitable<sse::MessageOutcome> {
                    co_return sse::HandleMessage(*registry, *router, *logger, sessionId, body, stop);
                },
                net::use_awaitable);
            unwatchPeer(peerSocket(*stream));
            res.result(static_cast<unsigned>(outcome.httpStatus));
            res.body() = std::move(outcome.body);
            res.prepare_payload();
            co_return res;
        }

        if (path == "/status") {
            if (req.method() != http::verb::get) {
                setBody(res, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
                co_return res;
            }
            const auto& info = deps.service->GetServerInfo();
            JSONValue::Object status;
            status["status"] = std::make_shared<JSONValue>("ok");
            status["name"] = std::make_shared<JSONValue>(info.name);
            status["version"] = std::make_shared<JSONValue>(info.version);
            status["protocol"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
            setBody(res, http::status::ok, serializeJSONValue(JSONValue(std::move(status))));
            co_return res;
        }

        setBody(res, http::status::not_found, "{\"error\":\"Not found\"}");
        co_return res;
    }

    //////////////////////////////////////////// SSE handoff ////////////////////////////////////////////
    template <class Stream>
    void startStream(std::shared_ptr<Stream> stream, const Request& req) {
        auto session = std::make_shared<Session>(sse::NewSessionId(), toString(req[http::field::user_agent]),
                                                 opts.sessionQueueCapacity, opts.sessionQueueCapacity);
        sse::StreamDependencies sdeps{deps.registry, deps.service, deps.logger};
        sse::StreamOptions sopts;
        sopts.keepAliveInterval = opts.keepAliveInterval;

        tracker->enter();
        std::thread([stream, session, sdeps, sopts, tracker = tracker, ioc = ioc, root = root,
                     version = req.version()]() {
            try {
                StreamSSEWriter<Stream> writer(*stream, version);
                sse::ServeStream(sdeps, session, writer, root, sopts);
            } catch (const std::exception& e) {
                LOG_ERROR(*sdeps.logger, "HTTPServer: SSE stream {} failed: {}", session->Id(), e.what());
            }
            abortStream(*stream);
            tracker->leave();
        }).detach();
    }

    //////////////////////////////////////////// Connections ////////////////////////////////////////////
    template <class Stream>
    net::awaitable<void> serveConnection(std::shared_ptr<Stream> stream) {
        ActivityScope scope(tracker);
        bool handedOff = false;
        try {
            beast::flat_buffer buffer;
            Request req;
            co_await http::async_read(*stream, buffer, req, net::use_awaitable);
            auto [path, query] = splitTarget(toString(req.target()));
            if (path == "/sse" && req.method() == http::verb::get) {
                startStream(stream, req);
                handedOff = true;
            } else {
                auto res = co_await makeResponse(stream, req, path, query);
                co_await http::async_write(*stream, res, net::use_awaitable);
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer session error: ") + e.what());
            } else {
                LOG_DEBUG(*deps.logger, "HTTPServer session error suppressed during shutdown: {}", e.what());
            }
        }
        if (!handedOff) {
            finishStream(*stream);
        }
        co_return;
    }

    net::awaitable<void> serveTls(tcp::socket socket) {
        auto stream = std::make_shared<TlsStream>(std::move(socket), *sslCtx);
        try {
            co_await stream->async_handshake(ssl::stream_base::server, net::use_awaitable);
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer TLS handshake error: ") + e.what());
            }
            co_return;
        }
        co_await serveConnection(stream);
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::make_strand(*ioc), net::use_awaitable);
                auto ex = socket.get_executor();
                if (sslCtx) {
                    net::co_spawn(ex, serveTls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ex, serveConnection(std::make_shared<PlainStream>(std::move(socket))), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                setError(std::string("HTTPServer accept error: ") + e.what());
            } else {
                LOG_DEBUG(*deps.logger, "HTTPServer accept stopped: {}", e.what());
            }
        }
        co_return;
    }

    //////////////////////////////////////////// Lifecycle ////////////////////////////////////////////
    std::future<void> start(std::stop_token r) {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (running.load() || stopped) {
            throw std::logic_error("HTTPServer: already started");
        }
        root = std::move(r);

        tcp::resolver resolver(*ioc);
        auto results = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *results.begin();
        acceptor = std::make_unique<tcp::acceptor>(net::make_strand(*ioc));
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort = acceptor->local_endpoint().port();

        workers = std::make_unique<net::thread_pool>(opts.workerThreads);
        running.store(true);
        net::co_spawn(acceptor->get_executor(), acceptLoop(), net::detached);

        auto ready = std::make_shared<std::promise<void>>();
        auto fut = ready->get_future();
        net::post(*ioc, [ready] { ready->set_value(); });
        for (std::size_t i = 0; i < opts.ioThreads; ++i) {
            ioThreads.emplace_back([this] {
                try {
                    ioc->run();
                } catch (const std::exception& e) {
                    setError(std::string("HTTPServer I/O thread error: ") + e.what());
                }
            });
        }
        LOG_INFO(*deps.logger, "HTTPServer: listening on {}://{}:{}", opts.scheme, opts.address, boundPort);
        return fut;
    }

    void stop(std::chrono::milliseconds grace) {
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex);
            if (stopped) return;
            stopped = true;
        }
        const bool wasRunning = running.exchange(false);
        if (acceptor) {
            net::post(acceptor->get_executor(), [this] {
                boost::system::error_code ec;
                acceptor->close(ec);
            });
        }
        deps.registry->CloseAll();
        if (wasRunning && !tracker->waitIdle(grace)) {
            LOG_WARN(*deps.logger, "HTTPServer: grace period of {} ms elapsed with work still in flight",
                     static_cast<long long>(grace.count()));
        }
        ioc->stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) t.join();
        }
        ioThreads.clear();
        if (workers) {
            workers->stop();
            workers->join();
        }
        if (wasRunning) {
            LOG_INFO(*deps.logger, "HTTPServer: stopped");
        }
    }
};

HTTPServer::HTTPServer(const Options& opts, Dependencies deps)
    : pImpl(std::make_unique<Impl>(opts, std::move(deps))) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start(std::stop_token root) {
    return pImpl->start(std::move(root));
}

void HTTPServer::Stop(std::chrono::milliseconds grace) {
    pImpl->stop(grace);
}

unsigned short HTTPServer::LocalPort() const {
    return pImpl->boundPort;
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcpe
