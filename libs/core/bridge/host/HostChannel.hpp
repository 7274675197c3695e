#pragma once
/*
wsbridge — HostChannel
Role: The bridge's side of the host connection. Reads commands from stdin, writes events to stdout.
Inputs/Outputs: Raw stdin bytes -> LineFramer -> HostProtocol::parse -> command handler;
                BridgeEvent -> HostProtocol::serialize -> one line on the output stream.
Threading: Input is read on the channel strand, so commands are handled one at a time in arrival order.
           publish() may be called from any strand; writes are serialized by a mutex and flushed per line.
Related: HostProtocol.hpp, LineFramer.hpp, MessageRouter.hpp.
*/
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>
#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "HostCommand.hpp"
#include "LineFramer.hpp"
#include "bridge/events/IEventSink.hpp"

class HostChannel : public IEventSink {
public:
    using CommandHandler = std::function<void(const HostCommand&)>;
    using ClosedHandler  = std::function<void()>;

    HostChannel(boost::asio::io_context& ioc, std::ostream& out);
    ~HostChannel() override;

    void setCommandHandler(CommandHandler handler) { m_onCommand = std::move(handler); }
    void onInputClosed(ClosedHandler handler) { m_onClosed = std::move(handler); }

    // Start reading fd (stdin). False when fd cannot be used with the reactor.
    bool open(int fd, std::string* error = nullptr);

    // Stop reading. The descriptor is released, not closed.
    void close();

    void publish(BridgeEvent event) override;

    // Entry points of the read loop; public so tests can drive the channel without a descriptor
    void handleInput(std::string_view chunk);
    void handleEndOfInput();

    HostChannel(const HostChannel&) = delete;
    HostChannel& operator=(const HostChannel&) = delete;

private:
    void readSome();
    void handleLine(const std::string& line);

    boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
    std::optional<boost::asio::posix::stream_descriptor>        m_input;
    std::array<char, 4096>  m_readBuf{};
    LineFramer              m_framer;
    size_t                  m_reportedOverflows = 0;
    bool                    m_inputClosed = false;

    CommandHandler          m_onCommand;
    ClosedHandler           m_onClosed;

    std::mutex              m_outMutex;
    std::ostream&           m_out;
    bool                    m_outputBroken = false;
};
