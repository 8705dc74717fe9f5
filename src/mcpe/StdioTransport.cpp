//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Line-delimited stdio loop with epoll/eventfd interruptible reads
//==========================================================================================================

#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include "mcpe/MessageCodec.h"
#include "mcpe/StdioTransport.hpp"
#include "mcpe/errors/Errors.h"

namespace mcpe {

bool IsTerminalIOError(const std::error_code& ec) {
    if (!ec || ec.category() != std::generic_category()) {
        return false;
    }
    switch (ec.value()) {
        case EPIPE:
        case ECONNRESET:
        case ECONNABORTED:
        case ENOTCONN:
        case ESHUTDOWN:
        case EBADF:
            return true;
        default:
            return false;
    }
}

namespace {

std::error_code lastError() {
    return std::error_code(errno, std::generic_category());
}

// Trailing '\r' is tolerated; a line of only whitespace is skipped
bool isBlank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

} // namespace

class StdioTransport::Impl {
public:
    struct ReadEvent {
        enum class Kind { Line, Eof, Error, ReadFailure, Oversized };
        Kind kind{Kind::Line};
        std::string line;
        std::error_code ec;
    };

    std::shared_ptr<MethodRouter> router;
    std::shared_ptr<Logger> logger;
    Options opts;
    ErrorHandler errorHandler;

    // The reader stays at most this many events ahead of the loop
    static constexpr std::size_t MaxQueuedEvents = 4;

    std::mutex queueMutex;
    std::condition_variable_any queueCv;
    std::deque<ReadEvent> queue;

    int wakeFd{-1};
    std::stop_source readerStop;
    std::thread readerThread;

    Impl(std::shared_ptr<MethodRouter> r, std::shared_ptr<Logger> l, const Options& o)
        : router(std::move(r)), logger(std::move(l)), opts(o) {}

    ~Impl() {
        stopReader();
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    // Blocks while the queue is full; false when the reader was stopped first
    bool push(ReadEvent ev, std::stop_token stop) {
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            if (!queueCv.wait(lock, stop, [this] { return queue.size() < MaxQueuedEvents; })) {
                return false;
            }
            queue.push_back(std::move(ev));
        }
        queueCv.notify_all();
        return true;
    }

    void wakeReader() {
        if (wakeFd < 0) return;
        uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(wakeFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN) {
            LOG_WARN(*logger, "StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void stopReader() {
        readerStop.request_stop();
        wakeReader();
        if (readerThread.joinable()) {
            readerThread.join();
        }
        if (wakeFd >= 0) {
            ::close(wakeFd);
            wakeFd = -1;
        }
    }

    //////////////////////////////////////////// Reader ////////////////////////////////////////////
    bool splitLines(std::string& buffer, bool& discarding, std::stop_token stop) {
        std::size_t start = 0;
        for (;;) {
            auto nl = buffer.find('\n', start);
            if (nl == std::string::npos) break;
            std::string line = buffer.substr(start, nl - start);
            start = nl + 1;
            if (discarding) {
                discarding = false;
                continue;
            }
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.size() > opts.maxLineBytes) {
                if (!push(ReadEvent{ReadEvent::Kind::Oversized, {}, {}}, stop)) return false;
                continue;
            }
            if (!isBlank(line)) {
                if (!push(ReadEvent{ReadEvent::Kind::Line, std::move(line), {}}, stop)) return false;
            }
        }
        buffer.erase(0, start);
        if (!discarding && buffer.size() > opts.maxLineBytes) {
            // Drop the partial line and everything up to its newline
            buffer.clear();
            discarding = true;
            return push(ReadEvent{ReadEvent::Kind::Oversized, {}, {}}, stop);
        }
        return true;
    }

    void readerLoop(std::stop_token stop) {
        const int fd = opts.inputFd;
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        bool pollable = false;
        if (ep >= 0) {
            epoll_event evIn{};
            evIn.events = EPOLLIN | EPOLLRDHUP;
            evIn.data.fd = fd;
            // Regular files are not pollable (EPERM); they never block, so plain reads suffice
            pollable = ::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn) == 0;
            if (pollable && wakeFd >= 0) {
                epoll_event evWake{};
                evWake.events = EPOLLIN;
                evWake.data.fd = wakeFd;
                if (::epoll_ctl(ep, EPOLL_CTL_ADD, wakeFd, &evWake) != 0) {
                    LOG_WARN(*logger, "StdioTransport: cannot watch wake event (errno={} msg={})", errno, ::strerror(errno));
                }
            }
        } else {
            LOG_WARN(*logger, "StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
        }

        std::string buffer;
        bool discarding = false;
        std::vector<char> tmp(4096);
        while (!stop.stop_requested()) {
            if (pollable) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, -1);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    push(ReadEvent{ReadEvent::Kind::Error, {}, lastError()}, stop);
                    break;
                }
                bool readable = false;
                for (int i = 0; i < rc; ++i) {
                    if (events[i].data.fd == fd) readable = true;
                }
                if (!readable) continue; // woken for shutdown
            }

            ssize_t n = ::read(fd, tmp.data(), tmp.size());
            if (n > 0) {
                buffer.append(tmp.data(), static_cast<std::size_t>(n));
                if (!splitLines(buffer, discarding, stop)) break;
            } else if (n == 0) {
                // Final unterminated line still counts as a message
                if (!discarding && !isBlank(buffer)) {
                    if (buffer.back() == '\r') buffer.pop_back();
                    if (!push(ReadEvent{ReadEvent::Kind::Line, std::move(buffer), {}}, stop)) break;
                }
                push(ReadEvent{ReadEvent::Kind::Eof, {}, {}}, stop);
                break;
            } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            } else {
                auto ec = lastError();
                if (IsTerminalIOError(ec)) {
                    push(ReadEvent{ReadEvent::Kind::Error, {}, ec}, stop);
                    break;
                }
                // Reported from the loop thread, like every other failure
                if (!push(ReadEvent{ReadEvent::Kind::ReadFailure, {}, ec}, stop)) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        if (ep >= 0) {
            ::close(ep);
        }
    }

    //////////////////////////////////////////// Writer ////////////////////////////////////////////
    std::error_code writeLine(const std::string& payload) {
        std::string frame = payload;
        frame.push_back('\n');
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(opts.outputFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd pfd{opts.outputFd, POLLOUT, 0};
                (void)::poll(&pfd, 1, 100);
                continue;
            }
            return w < 0 ? lastError() : std::make_error_code(std::errc::io_error);
        }
        return {};
    }

    //////////////////////////////////////////// Loop ////////////////////////////////////////////
    std::error_code run(std::stop_token stop) {
        // A vanished reader must surface as EPIPE, not kill the process
        std::signal(SIGPIPE, SIG_IGN);

        wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeFd < 0) {
            LOG_ERROR(*logger, "StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        readerStop = std::stop_source();
        readerThread = std::thread([this, token = readerStop.get_token()] { readerLoop(token); });

        LOG_INFO(*logger, "StdioTransport: serving on fd {} -> fd {}", opts.inputFd, opts.outputFd);
        std::error_code result;
        for (;;) {
            ReadEvent ev;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                if (!queueCv.wait(lock, stop, [this] { return !queue.empty(); })) {
                    LOG_INFO(*logger, "StdioTransport: cancelled");
                    break;
                }
                ev = std::move(queue.front());
                queue.pop_front();
            }
            queueCv.notify_all();

            if (ev.kind == ReadEvent::Kind::Eof) {
                LOG_INFO(*logger, "StdioTransport: end of input");
                break;
            }
            if (ev.kind == ReadEvent::Kind::Error) {
                LOG_ERROR(*logger, "StdioTransport: terminal read error: {}", ev.ec.message());
                reportError("StdioTransport: terminal read error: " + ev.ec.message());
                result = ev.ec;
                break;
            }
            if (ev.kind == ReadEvent::Kind::ReadFailure) {
                LOG_ERROR(*logger, "StdioTransport: read error (errno={} msg={})", ev.ec.value(), ev.ec.message());
                reportError("StdioTransport: read error: " + ev.ec.message());
                continue;
            }

            std::optional<std::string> reply;
            CallCompletion pending;
            if (ev.kind == ReadEvent::Kind::Oversized) {
                LOG_WARN(*logger, "StdioTransport: discarded line over {} bytes", opts.maxLineBytes);
                reportError("StdioTransport: message too large");
                reply = codec::EncodeError(JSONRPCId{nullptr},
                                           errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error",
                                                             JSONValue(std::string("message too large"))));
            } else {
                try {
                    reply = router->HandleMessage(ev.line, stop, std::nullopt, &pending);
                } catch (const std::exception& e) {
                    // Router failures are per message; the stream stays up
                    LOG_ERROR(*logger, "StdioTransport: processing failed: {}", e.what());
                    reportError(std::string("StdioTransport: processing failed: ") + e.what());
                    reply = codec::EncodeError(JSONRPCId{nullptr},
                                               errors::makeError(JSONRPCErrorCodes::InternalError,
                                                                 std::string("Internal error: ") + e.what()));
                }
            }
            std::error_code ec;
            if (reply.has_value()) {
                ec = writeLine(*reply);
            }
            // The timeout reply is already out; the next line waits for the handler itself
            if (!pending.Done()) {
                LOG_WARN(*logger, "StdioTransport: waiting for a handler that outlived its deadline");
                if (!pending.Wait(stop)) {
                    LOG_INFO(*logger, "StdioTransport: cancelled while a handler was still running");
                    break;
                }
            }
            if (!ec) {
                continue;
            }
            if (IsTerminalIOError(ec)) {
                LOG_ERROR(*logger, "StdioTransport: terminal write error: {}", ec.message());
                reportError("StdioTransport: terminal write error: " + ec.message());
                result = ec;
                break;
            }
            LOG_WARN(*logger, "StdioTransport: write failed, response dropped: {}", ec.message());
            reportError("StdioTransport: write error: " + ec.message());
        }

        stopReader();
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            queue.clear();
        }
        return result;
    }
};

StdioTransport::StdioTransport(std::shared_ptr<MethodRouter> router, std::shared_ptr<Logger> logger)
    : StdioTransport(std::move(router), std::move(logger), Options{}) {}

StdioTransport::StdioTransport(std::shared_ptr<MethodRouter> router, std::shared_ptr<Logger> logger, const Options& opts)
    : pImpl(std::make_unique<Impl>(std::move(router), std::move(logger), opts)) {
    if (!pImpl->router || !pImpl->logger) {
        throw std::invalid_argument("StdioTransport: router and logger are required");
    }
}

StdioTransport::~StdioTransport() = default;

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::error_code StdioTransport::Run(std::stop_token stop) {
    return pImpl->run(std::move(stop));
}

} // namespace mcpe
