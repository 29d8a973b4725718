/*
 * channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file channel.hpp
 * @brief IPC Channel abstraction for pipe-based communication
 * @date 2024
 * @version 1.2.0
 *
 * This module provides pipe-based communication channels for IPC:
 * - PipeChannel: Unidirectional pipe communication
 * - BidirectionalChannel: Full-duplex communication using two pipes
 */

#ifndef WARDEN_IPC_CHANNEL_HPP
#define WARDEN_IPC_CHANNEL_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <utility>

#include "message_types.hpp"

namespace warden::ipc {

using json = nlohmann::json;

// Forward declarations
struct HandshakePayload;
struct Message;

/**
 * @brief Unidirectional pipe channel
 *
 * Both ends are created close-on-exec; a spawner that wants the child to
 * inherit an end must dup2() it explicitly.
 */
class PipeChannel {
public:
    PipeChannel();
    ~PipeChannel();

    // Disable copy
    PipeChannel(const PipeChannel&) = delete;
    PipeChannel& operator=(const PipeChannel&) = delete;

    // Enable move
    PipeChannel(PipeChannel&& other) noexcept;
    PipeChannel& operator=(PipeChannel&& other) noexcept;

    /**
     * @brief Create the pipe
     *
     * @return IPCResult<void> Success or error code
     */
    [[nodiscard]] IPCResult<void> create();

    /**
     * @brief Take ownership of already-open descriptors
     *
     * Used by a worker process to wrap the descriptors it inherited.
     * Pass -1 for an end that is not available.
     */
    void adopt(int readFd, int writeFd);

    /**
     * @brief Close both ends of the pipe
     */
    void close();

    /**
     * @brief Check if pipe is open
     */
    [[nodiscard]] bool isOpen() const noexcept;

    /**
     * @brief Send a message
     *
     * A closed peer yields ChannelClosed; SIGPIPE is never delivered to the
     * calling process.
     */
    [[nodiscard]] IPCResult<void> send(const Message& message);

    /**
     * @brief Send a message with type and JSON payload
     */
    [[nodiscard]] IPCResult<void> send(MessageType type, const json& payload);

    /**
     * @brief Receive a message with timeout
     *
     * Waits for the next message. If no data arrives within the timeout,
     * returns a Timeout error. End-of-file yields ChannelClosed.
     *
     * @param timeout Maximum time to wait (default 5000ms)
     */
    [[nodiscard]] IPCResult<Message> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Check if data is available to read
     */
    [[nodiscard]] bool hasData() const;

    /**
     * @brief Get read file descriptor (-1 if not open)
     */
    [[nodiscard]] int getReadFd() const noexcept;

    /**
     * @brief Get write file descriptor (-1 if not open)
     */
    [[nodiscard]] int getWriteFd() const noexcept;

    /**
     * @brief Close the read end
     */
    void closeRead();

    /**
     * @brief Close the write end
     */
    void closeWrite();

    /**
     * @brief Get next sequence ID
     */
    [[nodiscard]] uint32_t nextSequenceId();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Bidirectional channel for full-duplex communication
 *
 * Provides full-duplex communication using two unidirectional pipes:
 * one for host->worker and one for worker->host. The same class is used
 * on both sides; setupParent() or attach() selects which pipe send() and
 * receive() use.
 */
class BidirectionalChannel {
public:
    /**
     * @brief Which side of the channel this process is
     */
    enum class Role { Parent, Child };

    BidirectionalChannel();
    ~BidirectionalChannel();

    // Disable copy
    BidirectionalChannel(const BidirectionalChannel&) = delete;
    BidirectionalChannel& operator=(const BidirectionalChannel&) = delete;

    /**
     * @brief Create both pipe pairs
     */
    [[nodiscard]] IPCResult<void> create();

    /**
     * @brief Wrap descriptors inherited by a worker process
     * @param readFd Read end of the host->worker pipe
     * @param writeFd Write end of the worker->host pipe
     */
    void attach(int readFd, int writeFd);

    /**
     * @brief Close the channel
     */
    void close();

    /**
     * @brief Check if channel is open
     */
    [[nodiscard]] bool isOpen() const noexcept;

    /**
     * @brief Current role
     */
    [[nodiscard]] Role role() const noexcept;

    /**
     * @brief Send a message towards the peer
     */
    [[nodiscard]] IPCResult<void> send(const Message& message);

    /**
     * @brief Build and send a JSON message towards the peer
     */
    [[nodiscard]] IPCResult<void> send(MessageType type, const json& payload);

    /**
     * @brief Receive a message from the peer
     *
     * @param timeout Maximum time to wait (default 5000ms)
     */
    [[nodiscard]] IPCResult<Message> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Get file descriptors for subprocess
     *
     * @return std::pair<int, int> Pair of (readFd, writeFd) for subprocess
     */
    [[nodiscard]] std::pair<int, int> getSubprocessFds() const noexcept;

    /**
     * @brief Setup for parent process (after spawn)
     *
     * Closes the descriptors that belong to the child.
     */
    void setupParent();

    /**
     * @brief Setup for child process (after fork, same address space)
     *
     * Closes the descriptors that belong to the parent.
     */
    void setupChild();

    /**
     * @brief Perform handshake with subprocess
     *
     * @param timeout Maximum time to wait for handshake response
     * @return IPCResult<HandshakePayload> Subprocess handshake info or error
     */
    [[nodiscard]] IPCResult<HandshakePayload> performHandshake(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Wait for the host's handshake and answer it
     *
     * Called by the worker during initialization.
     *
     * @param payload Handshake payload with worker information
     * @param timeout Maximum time to wait for the host's greeting
     * @return IPCResult<HandshakePayload> The host's greeting or error
     */
    [[nodiscard]] IPCResult<HandshakePayload> respondToHandshake(
        const HandshakePayload& payload,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

private:
    PipeChannel& outbound() noexcept;
    PipeChannel& inbound() noexcept;

    PipeChannel parentToChild_;   ///< Host -> worker pipe
    PipeChannel childToParent_;   ///< Worker -> host pipe
    std::atomic<uint32_t> sequenceId_{0};
    std::atomic<Role> role_{Role::Parent};
    mutable std::mutex mutex_;
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_CHANNEL_HPP
