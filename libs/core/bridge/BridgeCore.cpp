#include "BridgeCore.hpp"
#include "BridgeLogging.hpp"
#include "bridge/ws/BeastWsTransport.hpp"
#include <boost/asio/post.hpp>
#include <QString>
#include <csignal>

namespace net = boost::asio;
namespace ssl = net::ssl;

BridgeCore::BridgeCore(BridgeConfig config, std::ostream& hostOut)
    : m_config(std::move(config))
    , m_signals(m_ioc, SIGINT, SIGTERM)
    , m_resolver(m_config.aliases)
    , m_host(m_ioc, hostOut)
    , m_registry(m_ioc.get_executor(), m_config.backoff)
    , m_connections(
          [this](ConnectionManager::Strand strand, const Endpoint&) -> std::shared_ptr<WsTransport> {
              return std::make_shared<BeastWsTransport>(std::move(strand), m_sslCtx);
          },
          m_resolver, m_host, m_config.queueCapacity)
    , m_router(m_registry, m_connections, m_resolver, m_host)
{
    // Configure SSL context
    boost::system::error_code ec;
    m_sslCtx.set_default_verify_paths(ec);
    if (ec) {
        bLog_Warning(QString("No default CA certificates (%1); wss:// destinations will fail verification")
            .arg(QString::fromStdString(ec.message())));
    }
    m_sslCtx.set_verify_mode(ssl::verify_peer);

    m_host.setCommandHandler([this](const HostCommand& cmd) { m_router.handle(cmd); });
    m_host.onInputClosed([this]() { requestShutdown("end of host input"); });
    m_router.onShutdownRequested([this](std::string reason) { requestShutdown(std::move(reason)); });

    bLog_App(QString("BridgeCore initialized (queue capacity %1, backoff %2..%3ms +%4ms jitter, %5 alias(es))")
        .arg(m_config.queueCapacity)
        .arg(static_cast<qlonglong>(m_config.backoff.base.count()))
        .arg(static_cast<qlonglong>(m_config.backoff.cap.count()))
        .arg(static_cast<qlonglong>(m_config.backoff.maxJitter.count()))
        .arg(m_config.aliases.size()));
}

BridgeCore::~BridgeCore() {
    stop();
}

bool BridgeCore::start(int inputFd, std::string* error) {
    if (m_running.exchange(true)) return true;
    bLog_App("Starting BridgeCore...");

    // Create work guard to keep io_context alive
    m_workGuard.emplace(m_ioc.get_executor());

    if (!m_host.open(inputFd, error)) {
        m_workGuard.reset();
        m_running.store(false);
        return false;
    }

    waitForSignal();

    // Start I/O thread
    m_ioThread = std::thread(&BridgeCore::run, this);
    return true;
}

std::string BridgeCore::waitForShutdown() {
    std::unique_lock<std::mutex> lock(m_shutdownMutex);
    m_shutdownCv.wait(lock, [this] { return m_shutdownReason.has_value(); });
    return *m_shutdownReason;
}

void BridgeCore::requestShutdown(std::string reason) {
    std::lock_guard<std::mutex> lock(m_shutdownMutex);
    if (m_shutdownReason) return;
    bLog_App(QString("Shutdown requested: %1").arg(QString::fromStdString(reason)));
    m_shutdownReason = std::move(reason);
    m_shutdownCv.notify_all();
}

void BridgeCore::stop() {
    if (!m_running.exchange(false)) return;
    bLog_App("Stopping BridgeCore...");

    boost::system::error_code ignored;
    m_signals.cancel(ignored);
    m_host.close();

    // Cancel retry timers and close every connection on its own strand
    m_connections.beginShutdown();
    for (const auto& dest : m_registry.list()) {
        net::post(dest->strand(), [this, dest]() { m_connections.shutdown(dest); });
    }

    // Release work guard so the io_context exits once the closes complete
    m_workGuard.reset();

    if (!m_connections.waitForIdle(m_config.shutdownGrace)) {
        bLog_Warning(QString("%1 connection(s) still open after %2ms, abandoning them")
            .arg(m_connections.liveTransports())
            .arg(static_cast<qlonglong>(m_config.shutdownGrace.count())));
    }

    // Stop io_context to unblock the I/O thread
    m_ioc.stop();

    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }

    bLog_App("BridgeCore stopped");
}

void BridgeCore::run() {
    bLog_Net("IO context running");
    m_ioc.run();
    bLog_Net("IO context stopped");
}

void BridgeCore::waitForSignal() {
    m_signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        requestShutdown("signal " + std::to_string(signo));
    });
}
