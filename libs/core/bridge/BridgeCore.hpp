#pragma once
/*
wsbridge — BridgeCore
Role: Owns the I/O thread and every long-lived component of the bridge process.
Inputs/Outputs: Host commands on the input descriptor; events on the host output stream.
Threading: One Boost.Asio io_context on a dedicated worker thread. The host channel and every
           destination run on their own strands; the calling thread only starts, waits and stops.
Lifecycle: start() -> waitForShutdown() -> stop(). Shutdown is requested by closePlugin, end of
           host input or SIGINT/SIGTERM. stop() cancels retries, closes connections within the
           configured grace period, then stops the io_context and joins the thread.
Related: HostChannel.hpp, MessageRouter.hpp, ConnectionManager.hpp, DestinationRegistry.hpp.
*/
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "BridgeConfig.hpp"
#include "bridge/host/HostChannel.hpp"
#include "bridge/registry/DestinationRegistry.hpp"
#include "bridge/registry/TargetResolver.hpp"
#include "bridge/router/MessageRouter.hpp"
#include "bridge/ws/ConnectionManager.hpp"

class BridgeCore {
public:
    explicit BridgeCore(BridgeConfig config, std::ostream& hostOut = std::cout);
    ~BridgeCore();

    // Opens the host channel on inputFd and starts the I/O thread
    bool start(int inputFd, std::string* error = nullptr);

    // Blocks until shutdown is requested; returns the reason
    std::string waitForShutdown();

    void requestShutdown(std::string reason);
    void stop();

    // Non-copyable, non-movable (manages thread)
    BridgeCore(const BridgeCore&) = delete;
    BridgeCore& operator=(const BridgeCore&) = delete;
    BridgeCore(BridgeCore&&) = delete;
    BridgeCore& operator=(BridgeCore&&) = delete;

private:
    void run();
    void waitForSignal();

    BridgeConfig                m_config;

    boost::asio::io_context     m_ioc;
    boost::asio::ssl::context   m_sslCtx{boost::asio::ssl::context::tls_client};
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_workGuard;
    boost::asio::signal_set     m_signals;

    TargetResolver              m_resolver;
    HostChannel                 m_host;
    DestinationRegistry         m_registry;
    ConnectionManager           m_connections;
    MessageRouter               m_router;

    std::thread                 m_ioThread;
    std::atomic<bool>           m_running{false};

    std::mutex                  m_shutdownMutex;
    std::condition_variable     m_shutdownCv;
    std::optional<std::string>  m_shutdownReason;
};
