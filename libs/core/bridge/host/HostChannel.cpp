#include "HostChannel.hpp"
#include "HostProtocol.hpp"
#include "BridgeLogging.hpp"
#include "StringUtils.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <QString>

namespace net = boost::asio;

HostChannel::HostChannel(net::io_context& ioc, std::ostream& out)
    : m_strand(net::make_strand(ioc))
    , m_out(out)
{}

HostChannel::~HostChannel() {
    if (m_input) {
        boost::system::error_code ignored;
        m_input->cancel(ignored);
        m_input->release();
    }
}

bool HostChannel::open(int fd, std::string* error) {
    m_input.emplace(m_strand);
    boost::system::error_code ec;
    m_input->assign(fd, ec);
    if (ec) {
        m_input.reset();
        if (error) *error = "cannot read host input (fd " + std::to_string(fd) + "): " + ec.message();
        return false;
    }
    bLog_Host("Host channel open");
    net::post(m_strand, [this]() { readSome(); });
    return true;
}

void HostChannel::close() {
    net::dispatch(m_strand, [this]() {
        m_inputClosed = true;
        if (!m_input) return;
        boost::system::error_code ignored;
        m_input->cancel(ignored);
        m_input->release();
        m_input.reset();
    });
}

void HostChannel::readSome() {
    if (!m_input || m_inputClosed) return;
    m_input->async_read_some(net::buffer(m_readBuf),
        net::bind_executor(m_strand, [this](boost::system::error_code ec, std::size_t n) {
            if (ec == net::error::operation_aborted) return;
            if (n > 0) handleInput(std::string_view(m_readBuf.data(), n));
            if (ec) {
                if (ec != net::error::eof) {
                    bLog_Error(QString("Host input failed: %1").arg(QString::fromStdString(ec.message())));
                }
                handleEndOfInput();
                return;
            }
            readSome();
        }));
}

void HostChannel::handleInput(std::string_view chunk) {
    if (m_inputClosed) return;
    for (const auto& line : m_framer.feed(chunk)) {
        handleLine(line);
    }
    if (m_framer.overflows() != m_reportedOverflows) {
        const auto count = m_framer.overflows() - m_reportedOverflows;
        m_reportedOverflows = m_framer.overflows();
        bLog_Warning(QString("Discarded %1 oversized host line(s)").arg(count));
        publish(BridgeEvent{EventKind::Error, std::nullopt, std::string("command line too long"),
                            std::nullopt, std::nullopt});
    }
}

void HostChannel::handleEndOfInput() {
    if (m_inputClosed) return;
    m_inputClosed = true;
    if (m_framer.hasPartial()) {
        bLog_Warning(QString("Host input ended with an unterminated line (%1 bytes), discarded")
            .arg(m_framer.partialSize()));
        m_framer.reset();
    }
    bLog_Host("Host input closed");
    if (m_onClosed) m_onClosed();
}

void HostChannel::handleLine(const std::string& line) {
    if (StringUtils::trimView(line).empty()) return;

    bLog_DebugN(1, QString("<- %1").arg(QString::fromStdString(line)));
    auto result = HostProtocol::parse(line);
    if (auto* err = std::get_if<ProtocolError>(&result)) {
        bLog_Warning(QString("Rejected host command: %1").arg(QString::fromStdString(err->message)));
        publish(BridgeEvent{EventKind::Error, std::nullopt, err->message, err->correlationId, std::nullopt});
        return;
    }
    if (m_onCommand) m_onCommand(std::get<HostCommand>(result));
}

void HostChannel::publish(BridgeEvent event) {
    const auto line = HostProtocol::serialize(event);
    std::lock_guard<std::mutex> lock(m_outMutex);
    if (m_outputBroken) return;
    m_out << line << '\n';
    m_out.flush();
    if (!m_out) {
        m_outputBroken = true;
        bLog_Error("Host output closed; further events are dropped");
        return;
    }
    bLog_DebugN(1, QString("-> %1").arg(QString::fromStdString(line)));
}
