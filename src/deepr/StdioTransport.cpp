//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <cstring>
#ifdef __linux__
#  include <sys/eventfd.h>
#endif

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "deepr/StdioTransport.hpp"

namespace deepr {

namespace {
enum class State { Idle, Running, Stopped };
}

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    std::atomic<State> state{State::Idle};
    std::atomic<bool> stopRequested{false};
    std::thread readerThread;

    std::mutex handlerMutex;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;

    std::mutex writeMutex;
    std::mutex stateMutex;
    std::condition_variable cvStopped;

    TransportCounters counters;
    std::size_t maxLineBytes;

#ifdef __linux__
    int wakeEventFd{-1};
#else
    int wakePipe[2]{-1, -1};
#endif

    Impl(int in, int out) : inFd(in), outFd(out) {
        maxLineBytes = static_cast<std::size_t>(GetEnvUnsignedOrDefault("DEEPR_STDIO_MAX_LINE_BYTES", 4u * 1024u * 1024u));
#ifdef __linux__
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
#else
        if (::pipe(wakePipe) != 0) {
            LOG_ERROR("StdioTransport: failed to create self-pipe (errno={} msg={})", errno, ::strerror(errno));
        } else {
            for (int p : wakePipe) {
                int fl = ::fcntl(p, F_GETFL, 0);
                if (fl >= 0) {
                    (void)::fcntl(p, F_SETFL, fl | O_NONBLOCK);
                }
            }
        }
#endif
    }

    ~Impl() {
#ifdef __linux__
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
#else
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
#endif
    }

    int wakeReadFd() const {
#ifdef __linux__
        return wakeEventFd;
#else
        return wakePipe[0];
#endif
    }

    void signalWake() {
#ifdef __linux__
        if (wakeEventFd >= 0) {
            uint64_t one = 1;
            ssize_t wr;
            do {
                wr = ::write(wakeEventFd, &one, sizeof(one));
            } while (wr < 0 && errno == EINTR);
            if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
#else
        if (wakePipe[1] >= 0) {
            char b = 'x';
            ssize_t wr;
            do {
                wr = ::write(wakePipe[1], &b, 1);
            } while (wr < 0 && errno == EINTR);
            if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioTransport: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
#endif
    }

    void drainWake() {
        int fd = wakeReadFd();
        if (fd < 0) return;
        char sink[64];
        while (::read(fd, sink, sizeof(sink)) > 0) {
        }
    }

    void reportError(const std::string& msg) {
        ITransport::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = errorHandler;
        }
        if (h) {
            h(msg);
        }
    }

    bool writeLine(const Message& message) {
        std::string payload = EncodeMessage(message);
        std::string frame = payload;
        frame.push_back('\n');
        std::lock_guard<std::mutex> lk(writeMutex);
        std::size_t written = 0;
        while (written < frame.size()) {
            ssize_t n = ::write(outFd, frame.data() + written, frame.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    pollfd pfd{outFd, POLLOUT, 0};
                    (void)::poll(&pfd, 1, 100);
                    continue;
                }
                int err = errno;
                counters.RecordError();
                LOG_ERROR("StdioTransport: write failed (errno={} msg={})", err, ::strerror(err));
                reportError(std::string("StdioTransport: write failed: ") + ::strerror(err));
                return false;
            }
            written += static_cast<std::size_t>(n);
        }
        counters.RecordSent(payload.size());
        return true;
    }

    void sendError(const JSONRPCId& id, int code, const std::string& message) {
        (void)writeLine(Message::ErrorResponse(id, code, message));
    }

    void processLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            return;
        }
        counters.RecordReceived(line.size());

        Message message;
        try {
            message = DecodeMessage(line);
        } catch (const MessageDecodeError& e) {
            counters.RecordError();
            LOG_WARN("StdioTransport: rejected inbound line: {}", e.what());
            const std::string text = (e.Code() == JSONRPCErrorCodes::ParseError)
                ? std::string("Parse error")
                : std::string("Invalid Request: ") + e.what();
            sendError(JSONRPCId(nullptr), e.Code(), text);
            return;
        }

        ITransport::MessageHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = messageHandler;
        }
        if (!handler) {
            LOG_DEBUG("StdioTransport: no handler registered; dropping message");
            return;
        }

        const bool answerable = message.id.has_value() && !std::holds_alternative<std::nullptr_t>(*message.id);
        std::string failure;
        try {
            std::optional<Message> response = handler(message);
            if (response.has_value()) {
                (void)writeLine(*response);
            }
            return;
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }
        counters.RecordError();
        LOG_ERROR("StdioTransport: handler failed: {}", failure);
        reportError("StdioTransport: handler failed: " + failure);
        if (answerable) {
            sendError(*message.id, JSONRPCErrorCodes::InternalError, "Internal error: " + failure);
        }
    }

    void drainLines(std::string& buffer, bool& discarding) {
        std::size_t start = 0;
        while (true) {
            std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) break;
            if (discarding) {
                discarding = false;
            } else {
                processLine(buffer.substr(start, nl - start));
            }
            start = nl + 1;
        }
        buffer.erase(0, start);
        if (!discarding && buffer.size() > maxLineBytes) {
            counters.RecordError();
            LOG_WARN("StdioTransport: line exceeds {} bytes; discarding", maxLineBytes);
            sendError(JSONRPCId(nullptr), JSONRPCErrorCodes::ParseError, "Parse error");
            buffer.clear();
            discarding = true;
        } else if (discarding) {
            buffer.clear();
        }
    }

    void readLoop() {
        std::string buffer;
        bool discarding = false;
        std::vector<char> tmp(4096);
        constexpr int waitTimeoutMs = 100;

        while (!stopRequested.load()) {
            pollfd fds[2];
            fds[0] = pollfd{inFd, POLLIN, 0};
            fds[1] = pollfd{wakeReadFd(), POLLIN, 0};
            nfds_t count = (fds[1].fd >= 0) ? 2 : 1;
            int rc = ::poll(fds, count, waitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                counters.RecordError();
                LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: poll failed");
                break;
            }
            if (rc == 0) continue;
            if (count == 2 && (fds[1].revents & POLLIN)) {
                drainWake();
                break;
            }
            if (fds[0].revents & POLLNVAL) {
                counters.RecordError();
                reportError("StdioTransport: input descriptor is invalid");
                break;
            }
            if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = ::read(inFd, tmp.data(), tmp.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                counters.RecordError();
                LOG_ERROR("StdioTransport: read failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: read failed");
                break;
            }
            if (n == 0) {
                // A final line without a trailing newline is still a message
                if (!discarding && !buffer.empty()) {
                    processLine(std::move(buffer));
                    buffer.clear();
                }
                LOG_INFO("StdioTransport: end of input");
                break;
            }
            buffer.append(tmp.data(), static_cast<std::size_t>(n));
            drainLines(buffer, discarding);
        }
        markStopped();
    }

    void markStopped() {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            state = State::Stopped;
        }
        cvStopped.notify_all();
    }
};

StdioTransport::StdioTransport() : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {}

StdioTransport::StdioTransport(int inFd, int outFd) : pImpl(std::make_unique<Impl>(inFd, outFd)) {
    FUNC_SCOPE();
}

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    Stop().get();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    if (pImpl->state == State::Running) {
        ready.set_value();
        return ready.get_future();
    }
    // Stopped is terminal: a stopped transport never reads again.
    if (pImpl->state == State::Stopped) {
        LOG_WARN("StdioTransport: start ignored; transport already stopped");
        ready.set_value();
        return ready.get_future();
    }
    pImpl->stopRequested = false;
    pImpl->state = State::Running;
    pImpl->readerThread = std::thread([this]() { pImpl->readLoop(); });
    LOG_INFO("StdioTransport: started (in={} out={})", pImpl->inFd, pImpl->outFd);
    ready.set_value();
    return ready.get_future();
}

std::future<void> StdioTransport::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    pImpl->stopRequested = true;
    pImpl->signalWake();
    if (pImpl->readerThread.joinable() && pImpl->readerThread.get_id() != std::this_thread::get_id()) {
        pImpl->readerThread.join();
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        pImpl->state = State::Stopped;
    }
    pImpl->cvStopped.notify_all();
    done.set_value();
    return done.get_future();
}

bool StdioTransport::IsRunning() const {
    return pImpl->state == State::Running;
}

bool StdioTransport::Send(const Message& message) {
    return pImpl->writeLine(message);
}

void StdioTransport::SetMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->messageHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

TransportStats StdioTransport::GetStats() const {
    return pImpl->counters.Snapshot();
}

void StdioTransport::WaitUntilStopped() {
    std::unique_lock<std::mutex> lk(pImpl->stateMutex);
    pImpl->cvStopped.wait(lk, [this]() { return pImpl->state == State::Stopped; });
}

bool StdioTransport::WaitUntilStopped(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pImpl->stateMutex);
    return pImpl->cvStopped.wait_for(lk, timeout, [this]() { return pImpl->state == State::Stopped; });
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    pImpl->maxLineBytes = maxBytes;
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    if (!config.empty() && config != "stdio") {
        throw std::invalid_argument("StdioTransportFactory: unsupported config '" + config + "'");
    }
    return std::make_unique<StdioTransport>();
}

} // namespace deepr
