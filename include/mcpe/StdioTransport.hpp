//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Serial newline-delimited JSON-RPC loop over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <system_error>

#include <unistd.h>

#include "logging/Logger.h"
#include "mcpe/MethodRouter.h"

namespace mcpe {

//==========================================================================================================
// IsTerminalIOError
// Purpose: Classifies an I/O failure. Broken pipe, reset, aborted, shut down, not connected and bad
//          descriptor end the loop; everything else is logged and the loop keeps serving.
//==========================================================================================================
bool IsTerminalIOError(const std::error_code& ec);

//==========================================================================================================
// StdioTransport
// Purpose: Reads one message per line and answers each one (response plus '\n') before the next line is
//          processed. A helper thread owns the blocking reads so cancellation interrupts a pending read.
//==========================================================================================================
class StdioTransport {
public:
    struct Options {
        int inputFd{STDIN_FILENO};
        int outputFd{STDOUT_FILENO};
        // Lines longer than this are discarded and answered with a parse error
        std::size_t maxLineBytes{4 * 1024 * 1024};
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    StdioTransport(std::shared_ptr<MethodRouter> router, std::shared_ptr<Logger> logger);
    StdioTransport(std::shared_ptr<MethodRouter> router, std::shared_ptr<Logger> logger, const Options& opts);
    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    // Invoked for every I/O or processing failure, terminal or not.
    void SetErrorHandler(ErrorHandler handler);

    //==========================================================================================================
    // Run
    // Purpose: Serves until end of input, cancellation, or a terminal I/O error.
    // Returns:
    //   Empty error_code on end of input or cancellation; the terminal error otherwise.
    //==========================================================================================================
    std::error_code Run(std::stop_token stop);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpe
