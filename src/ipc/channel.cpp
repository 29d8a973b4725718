/*
 * channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "channel.hpp"
#include "message.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>

namespace warden::ipc {

namespace {

/**
 * @brief Blocks SIGPIPE for the calling thread while writing to a pipe
 *
 * A SIGPIPE raised by our own write is consumed before the mask is
 * restored, so a dead peer surfaces as EPIPE only.
 */
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        pendingBefore_ = sigismember(&pending, SIGPIPE) == 1;

        sigset_t block;
        sigemptyset(&block);
        sigaddset(&block, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &block, &previous_);
    }

    ~SigpipeGuard() {
        if (broken_ && !pendingBefore_) {
            sigset_t pipeSet;
            sigemptyset(&pipeSet);
            sigaddset(&pipeSet, SIGPIPE);
            struct timespec zero {0, 0};
            while (sigtimedwait(&pipeSet, nullptr, &zero) == -1 &&
                   errno == EINTR) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

    void markBroken() noexcept { broken_ = true; }

private:
    sigset_t previous_{};
    bool pendingBefore_{false};
    bool broken_{false};
};

IPCResult<void> readExactly(int fd, uint8_t* buffer, size_t size) {
    size_t total = 0;
    while (total < size) {
        auto bytesRead = ::read(fd, buffer + total, size - total);
        if (bytesRead == 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }
        if (bytesRead < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(IPCError::PipeError);
        }
        total += static_cast<size_t>(bytesRead);
    }
    return {};
}

}  // namespace

// ============================================================================
// PipeChannel::Impl Implementation
// ============================================================================

class PipeChannel::Impl {
public:
    Impl() : readFd_(-1), writeFd_(-1), sequenceId_(0) {}

    ~Impl() {
        close();
    }

    IPCResult<void> create() {
        close();
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            spdlog::error("Failed to create pipe: {}", std::strerror(errno));
            return std::unexpected(IPCError::PipeError);
        }
        readFd_ = fds[0];
        writeFd_ = fds[1];
        return {};
    }

    void adopt(int readFd, int writeFd) {
        close();
        readFd_ = readFd;
        writeFd_ = writeFd;
    }

    void close() {
        closeRead();
        closeWrite();
    }

    bool isOpen() const noexcept {
        return readFd_ >= 0 || writeFd_ >= 0;
    }

    IPCResult<void> send(const Message& message) {
        if (writeFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }

        auto data = message.serialize();

        std::lock_guard<std::mutex> lock(writeMutex_);
        SigpipeGuard sigpipe;

        size_t totalWritten = 0;
        while (totalWritten < data.size()) {
            auto written = ::write(writeFd_, data.data() + totalWritten,
                                   data.size() - totalWritten);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EPIPE) {
                    sigpipe.markBroken();
                    return std::unexpected(IPCError::ChannelClosed);
                }
                spdlog::error("Write failed: {}", std::strerror(errno));
                return std::unexpected(IPCError::PipeError);
            }
            totalWritten += static_cast<size_t>(written);
        }

        return {};
    }

    IPCResult<Message> receive(std::chrono::milliseconds timeout) {
        if (readFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) {
                remaining = std::chrono::milliseconds{0};
            }

            struct pollfd pfd;
            pfd.fd = readFd_;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ret > 0) {
                break;
            }
            if (ret == 0) {
                return std::unexpected(IPCError::Timeout);
            }
            if (errno != EINTR) {
                return std::unexpected(IPCError::PipeError);
            }
        }

        // Read header
        std::vector<uint8_t> headerData(MessageHeader::SIZE);
        if (auto r = readExactly(readFd_, headerData.data(), headerData.size()); !r) {
            return std::unexpected(r.error());
        }

        auto headerResult = MessageHeader::deserialize(headerData);
        if (!headerResult) {
            return std::unexpected(headerResult.error());
        }

        // Read payload
        std::vector<uint8_t> payload(headerResult->payloadSize);
        if (!payload.empty()) {
            if (auto r = readExactly(readFd_, payload.data(), payload.size()); !r) {
                return std::unexpected(r.error());
            }
        }

        Message msg;
        msg.header = *headerResult;
        msg.payload = std::move(payload);

        return msg;
    }

    bool hasData() const {
        if (readFd_ < 0) {
            return false;
        }
        struct pollfd pfd;
        pfd.fd = readFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        return ::poll(&pfd, 1, 0) > 0;
    }

    int getReadFd() const noexcept { return readFd_; }
    int getWriteFd() const noexcept { return writeFd_; }

    void closeRead() {
        if (readFd_ >= 0) {
            ::close(readFd_);
            readFd_ = -1;
        }
    }

    void closeWrite() {
        if (writeFd_ >= 0) {
            ::close(writeFd_);
            writeFd_ = -1;
        }
    }

    uint32_t nextSequenceId() {
        return sequenceId_++;
    }

private:
    int readFd_;
    int writeFd_;
    std::atomic<uint32_t> sequenceId_;
    std::mutex writeMutex_;
};

// ============================================================================
// PipeChannel Implementation
// ============================================================================

PipeChannel::PipeChannel() : pImpl_(std::make_unique<Impl>()) {}
PipeChannel::~PipeChannel() = default;

PipeChannel::PipeChannel(PipeChannel&& other) noexcept = default;
PipeChannel& PipeChannel::operator=(PipeChannel&& other) noexcept = default;

IPCResult<void> PipeChannel::create() { return pImpl_->create(); }
void PipeChannel::adopt(int readFd, int writeFd) { pImpl_->adopt(readFd, writeFd); }
void PipeChannel::close() { pImpl_->close(); }
bool PipeChannel::isOpen() const noexcept { return pImpl_->isOpen(); }
IPCResult<void> PipeChannel::send(const Message& message) { return pImpl_->send(message); }
IPCResult<void> PipeChannel::send(MessageType type, const json& payload) {
    auto message = Message::create(type, payload, nextSequenceId());
    if (!message) {
        return std::unexpected(message.error());
    }
    return send(*message);
}
IPCResult<Message> PipeChannel::receive(std::chrono::milliseconds timeout) {
    return pImpl_->receive(timeout);
}
bool PipeChannel::hasData() const { return pImpl_->hasData(); }
int PipeChannel::getReadFd() const noexcept { return pImpl_->getReadFd(); }
int PipeChannel::getWriteFd() const noexcept { return pImpl_->getWriteFd(); }
void PipeChannel::closeRead() { pImpl_->closeRead(); }
void PipeChannel::closeWrite() { pImpl_->closeWrite(); }
uint32_t PipeChannel::nextSequenceId() { return pImpl_->nextSequenceId(); }

// ============================================================================
// BidirectionalChannel Implementation
// ============================================================================

BidirectionalChannel::BidirectionalChannel() = default;
BidirectionalChannel::~BidirectionalChannel() = default;

IPCResult<void> BidirectionalChannel::create() {
    auto result1 = parentToChild_.create();
    if (!result1) return result1;

    auto result2 = childToParent_.create();
    if (!result2) {
        parentToChild_.close();
        return result2;
    }

    role_ = Role::Parent;
    return {};
}

void BidirectionalChannel::attach(int readFd, int writeFd) {
    parentToChild_.adopt(readFd, -1);
    childToParent_.adopt(-1, writeFd);
    role_ = Role::Child;
}

void BidirectionalChannel::close() {
    parentToChild_.close();
    childToParent_.close();
}

bool BidirectionalChannel::isOpen() const noexcept {
    return parentToChild_.isOpen() && childToParent_.isOpen();
}

BidirectionalChannel::Role BidirectionalChannel::role() const noexcept {
    return role_;
}

PipeChannel& BidirectionalChannel::outbound() noexcept {
    return role_ == Role::Parent ? parentToChild_ : childToParent_;
}

PipeChannel& BidirectionalChannel::inbound() noexcept {
    return role_ == Role::Parent ? childToParent_ : parentToChild_;
}

IPCResult<void> BidirectionalChannel::send(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbound().send(message);
}

IPCResult<void> BidirectionalChannel::send(MessageType type, const json& payload) {
    auto message = Message::create(type, payload, sequenceId_++);
    if (!message) {
        return std::unexpected(message.error());
    }
    return send(*message);
}

IPCResult<Message> BidirectionalChannel::receive(std::chrono::milliseconds timeout) {
    return inbound().receive(timeout);
}

std::pair<int, int> BidirectionalChannel::getSubprocessFds() const noexcept {
    return {parentToChild_.getReadFd(), childToParent_.getWriteFd()};
}

void BidirectionalChannel::setupParent() {
    // Parent keeps: write end of parentToChild, read end of childToParent
    parentToChild_.closeRead();
    childToParent_.closeWrite();
    role_ = Role::Parent;
}

void BidirectionalChannel::setupChild() {
    // Child keeps: read end of parentToChild, write end of childToParent
    parentToChild_.closeWrite();
    childToParent_.closeRead();
    role_ = Role::Child;
}

IPCResult<HandshakePayload> BidirectionalChannel::performHandshake(
    std::chrono::milliseconds timeout) {

    HandshakePayload request;
    request.version = "1.0";
    request.pid = static_cast<uint32_t>(::getpid());
    request.capabilities = {"execute", "output-stream"};

    auto sendResult = send(MessageType::Handshake, request.toJson());
    if (!sendResult) {
        return std::unexpected(sendResult.error());
    }

    auto response = receive(timeout);
    if (!response) {
        return std::unexpected(response.error());
    }

    if (response->header.type != MessageType::HandshakeAck) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    auto payloadResult = response->getPayloadAsJson();
    if (!payloadResult) {
        return std::unexpected(payloadResult.error());
    }

    return HandshakePayload::fromJson(*payloadResult);
}

IPCResult<HandshakePayload> BidirectionalChannel::respondToHandshake(
    const HandshakePayload& payload, std::chrono::milliseconds timeout) {

    auto greeting = receive(timeout);
    if (!greeting) {
        return std::unexpected(greeting.error());
    }
    if (greeting->header.type != MessageType::Handshake) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    auto greetingJson = greeting->getPayloadAsJson();
    if (!greetingJson) {
        return std::unexpected(greetingJson.error());
    }
    auto host = HandshakePayload::fromJson(*greetingJson);
    if (!host) {
        return std::unexpected(host.error());
    }

    auto sendResult = send(MessageType::HandshakeAck, payload.toJson());
    if (!sendResult) {
        return std::unexpected(sendResult.error());
    }
    return host;
}

}  // namespace warden::ipc
