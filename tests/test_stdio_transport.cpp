//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: Tests for the newline-delimited stdio loop over pipes
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "TestSupport.h"
#include "mcpe/StdioTransport.hpp"

using namespace mcpe;
using namespace std::chrono_literals;

namespace {

// Owns both ends of a pipe and closes whatever is still open
struct Pipe {
    int fds[2]{-1, -1};
    Pipe() {
        if (::pipe(fds) != 0) {
            throw std::runtime_error("pipe() failed");
        }
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }
    void closeRead() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void closeWrite() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
    void write(const std::string& s) {
        std::size_t off = 0;
        while (off < s.size()) {
            ssize_t n = ::write(fds[1], s.data() + off, s.size() - off);
            if (n <= 0) throw std::runtime_error("pipe write failed");
            off += static_cast<std::size_t>(n);
        }
    }
    // Reads until EOF; the write end must be closed first
    std::string drain() {
        std::string out;
        char buf[4096];
        for (;;) {
            ssize_t n = ::read(fds[0], buf, sizeof(buf));
            if (n > 0) {
                out.append(buf, static_cast<std::size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        return out;
    }
};

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) {
        out.push_back(line);
    }
    return out;
}

StdioTransport::Options optionsFor(Pipe& in, Pipe& out) {
    StdioTransport::Options opts;
    opts.inputFd = in.readEnd();
    opts.outputFd = out.writeEnd();
    return opts;
}

} // namespace

TEST(StdioTransport, AnswersEachLineInOrder) {
    auto w = test::MakeWiring();
    Pipe in, out;
    in.write(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    in.write(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})" "\r\n");
    in.closeWrite();

    StdioTransport transport(w.router, w.logger, optionsFor(in, out));
    auto ec = transport.Run(std::stop_token{});
    EXPECT_FALSE(ec);
    out.closeWrite();

    auto got = lines(out.drain());
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0], R"({"jsonrpc":"2.0","id":1,"result":{}})");
    auto second = test::ParseResponse(got[1]);
    EXPECT_EQ(std::get<int64_t>(*second.id), 2);
    EXPECT_EQ(*second.result, parseJSON(R"({"content":[{"type":"text","text":"hi"}]})"));
}

TEST(StdioTransport, MalformedLineDoesNotStopTheLoop) {
    auto w = test::MakeWiring();
    Pipe in, out;
    in.write("{not json\n\n   \n");
    in.write(R"({"jsonrpc":"2.0","id":"after","method":"ping"})" "\n");
    in.closeWrite();

    StdioTransport transport(w.router, w.logger, optionsFor(in, out));
    EXPECT_FALSE(transport.Run(std::stop_token{}));
    out.closeWrite();

    auto got = lines(out.drain());
    ASSERT_EQ(got.size(), 2u);
    auto err = test::ParseResponse(got[0]);
    EXPECT_EQ(test::ErrorCode(err), -32700);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*err.id));
    EXPECT_EQ(got[1], R"({"jsonrpc":"2.0","id":"after","result":{}})");
}

TEST(StdioTransport, NotificationsProduceNoOutput) {
    auto w = test::MakeWiring();
    Pipe in, out;
    in.write(R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n");
    in.closeWrite();

    StdioTransport transport(w.router, w.logger, optionsFor(in, out));
    EXPECT_FALSE(transport.Run(std::stop_token{}));
    out.closeWrite();
    EXPECT_EQ(out.drain(), "");
}

TEST(StdioTransport, UnterminatedFinalLineIsServed) {
    auto w = test::MakeWiring();
    Pipe in, out;
    in.write(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
    in.closeWrite();

    StdioTransport transport(w.router, w.logger, optionsFor(in, out));
    EXPECT_FALSE(transport.Run(std::stop_token{}));
    out.closeWrite();
    EXPECT_EQ(out.drain(), "{\"jsonrpc\":\"2.0\",\"id\":3,\"result\":{}}\n");
}

TEST(StdioTransport, OversizedLineIsAnsweredWithParseError) {
    auto w = test::MakeWiring();
    Pipe in, out;
    in.write(std::string(200, 'x') + "\n");
    in.write(R"({"jsonrpc":"2.0","id":4,"method":"ping"})" "\n");
    in.closeWrite();

    auto opts = optionsFor(in, out);
    opts.maxLineBytes = 64;
    StdioTransport transport(w.router, w.logger, opts);
    EXPECT_FALSE(transport.Run(std::stop_token{}));
    out.closeWrite();

    auto got = lines(out.drain());
    ASSERT_EQ(got.size(), 2u);
    auto err = test::ParseResponse(got[0]);
    EXPECT_EQ(test::ErrorCode(err), -32700);
    EXPECT_EQ(std::get<std::string>(err.error->find("data")->value), "message too large");
    EXPECT_EQ(got[1], R"({"jsonrpc":"2.0","id":4,"result":{}})");
}

TEST(StdioTransport, CancellationInterruptsBlockedRead) {
    auto w = test::MakeWiring();
    Pipe in, out;
    StdioTransport transport(w.router, w.logger, optionsFor(in, out));

    std::stop_source stop;
    auto done = std::async(std::launch::async, [&] { return transport.Run(stop.get_token()); });
    std::this_thread::sleep_for(50ms);
    stop.request_stop();
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(done.get());
}

TEST(StdioTransport, BrokenOutputPipeIsTerminal) {
    auto w = test::MakeWiring();
    Pipe in, out;
    out.closeRead();
    in.write(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");

    std::vector<std::string> reported;
    StdioTransport transport(w.router, w.logger, optionsFor(in, out));
    transport.SetErrorHandler([&reported](const std::string& msg) { reported.push_back(msg); });

    auto done = std::async(std::launch::async, [&] { return transport.Run(std::stop_token{}); });
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    auto ec = done.get();
    EXPECT_EQ(ec, std::error_code(EPIPE, std::generic_category()));
    EXPECT_TRUE(IsTerminalIOError(ec));
    ASSERT_FALSE(reported.empty());
    EXPECT_NE(reported.back().find("terminal write error"), std::string::npos);
}

TEST(StdioTransport, NextLineWaitsForHandlerPastItsDeadline) {
    auto w = test::MakeWiring(100ms);
    auto running = std::make_shared<std::atomic<bool>>(false);
    auto overlapped = std::make_shared<std::atomic<bool>>(false);
    // Ignores its stop token and outlives the deadline
    w.router->Register("slow", [running](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        running->store(true);
        std::this_thread::sleep_for(400ms);
        running->store(false);
        return std::nullopt;
    });
    w.router->Register("check", [running, overlapped](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        overlapped->store(running->load());
        return std::nullopt;
    });

    Pipe in, out;
    in.write(R"({"jsonrpc":"2.0","id":1,"method":"slow"})" "\n");
    in.write(R"({"jsonrpc":"2.0","id":2,"method":"check"})" "\n");
    in.closeWrite();

    StdioTransport transport(w.router, w.logger, optionsFor(in, out));
    EXPECT_FALSE(transport.Run(std::stop_token{}));
    out.closeWrite();

    EXPECT_FALSE(overlapped->load());
    auto got = lines(out.drain());
    ASSERT_EQ(got.size(), 2u);
    auto timedOut = test::ParseResponse(got[0]);
    EXPECT_EQ(std::get<int64_t>(*timedOut.id), 1);
    EXPECT_EQ(test::ErrorMessage(timedOut), "Internal error: request timed out after 100 ms");
    EXPECT_EQ(got[1], R"({"jsonrpc":"2.0","id":2,"result":{}})");
}

TEST(StdioTransport, BlockedHandlerPushesBackOnTheWriter) {
    auto w = test::MakeWiring();
    auto started = std::make_shared<std::promise<void>>();
    auto release = std::make_shared<std::promise<void>>();
    std::shared_future<void> released = release->get_future().share();
    w.router->Register("block", [started, released](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        started->set_value();
        released.wait();
        return std::nullopt;
    });

    Pipe in, out;
    in.write(R"({"jsonrpc":"2.0","id":1,"method":"block"})" "\n");
    StdioTransport transport(w.router, w.logger, optionsFor(in, out));
    auto done = std::async(std::launch::async, [&] { return transport.Run(std::stop_token{}); });
    ASSERT_EQ(started->get_future().wait_for(2s), std::future_status::ready);

    // Write until the pipe stays full
    ASSERT_EQ(::fcntl(in.writeEnd(), F_SETFL, ::fcntl(in.writeEnd(), F_GETFL) | O_NONBLOCK), 0);
    const std::string note = std::string(R"({"jsonrpc":"2.0","method":"notifications/initialized"})") + "\n";
    std::size_t accepted = 0;
    int fullInARow = 0;
    const auto giveUp = std::chrono::steady_clock::now() + 5s;
    while (fullInARow < 20 && std::chrono::steady_clock::now() < giveUp) {
        ssize_t n = ::write(in.writeEnd(), note.data(), note.size());
        if (n > 0) {
            accepted += static_cast<std::size_t>(n);
            fullInARow = 0;
        } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            ++fullInARow;
            std::this_thread::sleep_for(10ms);
        } else {
            ADD_FAILURE() << "unexpected write failure: " << errno;
            break;
        }
    }
    EXPECT_EQ(fullInARow, 20);
    // Pipe capacity plus a read chunk and a few queued lines, nowhere near unbounded
    EXPECT_LT(accepted, 1024u * 1024u);

    release->set_value();
    in.closeWrite();
    ASSERT_EQ(done.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(done.get());
    out.closeWrite();
    EXPECT_EQ(lines(out.drain()), std::vector<std::string>{R"({"jsonrpc":"2.0","id":1,"result":{}})"});
}

TEST(StdioTransport, ErrorHandlerRunsOnTheLoopThread) {
    auto w = test::MakeWiring();
    // Reading a directory fails with EISDIR, which is not terminal
    int dirFd = ::open("/", O_RDONLY | O_DIRECTORY);
    ASSERT_GE(dirFd, 0);
    Pipe out;
    StdioTransport::Options opts;
    opts.inputFd = dirFd;
    opts.outputFd = out.writeEnd();

    std::mutex m;
    std::vector<std::thread::id> callers;
    std::vector<std::string> reported;
    StdioTransport transport(w.router, w.logger, opts);
    transport.SetErrorHandler([&](const std::string& msg) {
        std::lock_guard<std::mutex> lock(m);
        callers.push_back(std::this_thread::get_id());
        reported.push_back(msg);
    });

    std::stop_source stop;
    std::thread::id loopThread;
    auto done = std::async(std::launch::async, [&] {
        loopThread = std::this_thread::get_id();
        return transport.Run(stop.get_token());
    });
    std::this_thread::sleep_for(100ms);
    stop.request_stop();
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(done.get());
    ::close(dirFd);

    std::lock_guard<std::mutex> lock(m);
    ASSERT_FALSE(reported.empty());
    EXPECT_NE(reported.front().find("read error"), std::string::npos);
    for (const auto& id : callers) {
        EXPECT_EQ(id, loopThread);
    }
}

TEST(StdioTransport, TerminalErrorClassification) {
    for (int code : {EPIPE, ECONNRESET, ECONNABORTED, ENOTCONN, ESHUTDOWN, EBADF}) {
        EXPECT_TRUE(IsTerminalIOError(std::error_code(code, std::generic_category()))) << code;
    }
    EXPECT_FALSE(IsTerminalIOError(std::error_code()));
    EXPECT_FALSE(IsTerminalIOError(std::error_code(EAGAIN, std::generic_category())));
    EXPECT_FALSE(IsTerminalIOError(std::error_code(EIO, std::generic_category())));
    EXPECT_FALSE(IsTerminalIOError(std::make_error_code(std::future_errc::broken_promise)));
}

TEST(StdioTransport, RequiresRouterAndLogger) {
    auto w = test::MakeWiring();
    EXPECT_THROW(StdioTransport(nullptr, w.logger), std::invalid_argument);
    EXPECT_THROW(StdioTransport(w.router, nullptr), std::invalid_argument);
}
