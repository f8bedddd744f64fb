//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over the process's standard input and output
//==========================================================================================================
#pragma once

#include "deepr/Transport.h"
#include <chrono>
#include <cstddef>
#include <memory>

namespace deepr {

//==========================================================================================================
// StdioTransport
// Purpose: Reads one encoded Message per line from an input descriptor and writes one encoded Message per
//          line to an output descriptor. State machine: idle -> running -> stopped.
// Notes:
//   - Malformed lines are answered with a -32700 error carrying a null id; the loop keeps reading.
//   - A throwing handler produces a -32603 error, but only for messages that carry an id.
//   - End of input moves the transport to stopped.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    // Binds to STDIN_FILENO / STDOUT_FILENO.
    StdioTransport();

    //==========================================================================================================
    // Binds to caller-owned descriptors (pipes, sockets). The descriptors are not closed by the transport.
    // Args:
    //   inFd: Descriptor to read lines from.
    //   outFd: Descriptor to write lines to.
    //==========================================================================================================
    StdioTransport(int inFd, int outFd);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Stop() override;
    bool IsRunning() const override;
    bool IsLocal() const override { return true; }
    bool Send(const Message& message) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    TransportStats GetStats() const override;

    //==========================================================================================================
    // WaitUntilStopped
    // Purpose: Blocks until the read loop has ended (end of input or Stop()).
    // Args:
    //   timeout: Maximum time to wait.
    // Returns:
    //   true when the transport is stopped; false on timeout.
    //==========================================================================================================
    void WaitUntilStopped();
    bool WaitUntilStopped(std::chrono::milliseconds timeout);

    //==========================================================================================================
    // SetMaxLineBytes
    // Purpose: Upper bound for one inbound line. Longer lines are discarded and answered with a parse error.
    //==========================================================================================================
    void SetMaxLineBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates stdio transports. Accepts "" or "stdio".
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace deepr
