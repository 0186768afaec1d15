#pragma once

#include "ConnectionContext.hpp"
#include "IngestionEvents.hpp"
#include "common/AppContext.hpp"
#include "common/protocol/RecordDispatcher.hpp"
#include "common/protocol/wire/Wire.Parser.hpp"
#include "common/protocol/wire/Wire.Utils.hpp"

#include <trantor/net/EventLoopThread.h>
#include <trantor/net/TcpServer.h>
#include <trantor/utils/Logger.h>

#include <memory>
#include <string_view>
#include <thread>

/**
 * @brief 现场单元接入服务
 *
 * 单一多路复用 Reactor：一个监听 EventLoop + TcpServer 内部的 IO 线程池，
 * 每个连接固定在一个 IO 线程上，按行分帧、解码后交给 RecordDispatcher。
 *
 * 单个连接的慢读或坏包只影响它自己：解码错误计数后继续读下一行，
 * 交接队列满时丢弃最旧记录，IO 线程从不等待融合。
 */
class IngestionServer {
public:
    using TcpServer = trantor::TcpServer;
    using TcpConnectionPtr = trantor::TcpConnectionPtr;
    using MsgBuffer = trantor::MsgBuffer;
    using EventLoopThread = trantor::EventLoopThread;
    using InetAddress = trantor::InetAddress;

    IngestionServer(AppContext& ctx, RecordDispatcher& dispatcher)
        : ctx_(ctx)
        , config_(ctx.config.ingestion)
        , dispatcher_(dispatcher)
        , parser_(ctx.config.calibration) {}

    ~IngestionServer() {
        stop();
    }

    IngestionServer(const IngestionServer&) = delete;
    IngestionServer& operator=(const IngestionServer&) = delete;

    /**
     * @brief 启动监听
     *
     * 端口无法绑定时 trantor 直接以 FATAL 终止进程，这是唯一的致命错误。
     */
    void start() {
        if (server_) {
            LOG_WARN << "[Ingestion] Server already started";
            return;
        }

        size_t ioThreads = config_.ioThreads;
        if (ioThreads == 0) {
            ioThreads = std::thread::hardware_concurrency();
            if (ioThreads == 0) {
                ioThreads = 4;
            }
        }

        acceptThread_ = std::make_unique<EventLoopThread>("IngestAccept");
        acceptThread_->run();
        auto* loop = acceptThread_->getLoop();

        bool ipv6 = config_.host.find(':') != std::string::npos;
        InetAddress addr(config_.host, config_.port, ipv6);
        server_ = std::make_unique<TcpServer>(loop, addr, "IngestionServer");
        server_->setIoLoopNum(ioThreads);
        if (config_.idleTimeoutSeconds > 0) {
            server_->kickoffIdleConnections(static_cast<size_t>(config_.idleTimeoutSeconds));
        }

        server_->setConnectionCallback([this](const TcpConnectionPtr& conn) {
            try {
                onConnection(conn);
            } catch (const std::exception& e) {
                LOG_ERROR << "[Ingestion] Connection callback error: " << e.what();
            }
        });

        server_->setRecvMessageCallback([this](const TcpConnectionPtr& conn, MsgBuffer* buf) {
            try {
                onMessage(conn, buf);
            } catch (const std::exception& e) {
                LOG_ERROR << "[Ingestion] Message callback error from "
                          << conn->peerAddr().toIpPort() << ": " << e.what();
                buf->retrieveAll();
            }
        });

        server_->start();
        LOG_INFO << "[Ingestion] Listening on " << config_.host << ":" << config_.port
                 << " (" << ioThreads << " IO threads, idle timeout "
                 << config_.idleTimeoutSeconds << "s)";
    }

    /**
     * @brief 停止监听并关闭所有连接（未完成的半包被丢弃）
     */
    void stop() {
        if (!server_) return;
        server_->stop();
        server_.reset();
        acceptThread_.reset();
        LOG_INFO << "[Ingestion] Server stopped";
    }

    bool isRunning() const { return server_ != nullptr; }

private:
    AppContext& ctx_;
    IngestionConfig config_;
    RecordDispatcher& dispatcher_;
    wire::Parser parser_;

    std::unique_ptr<EventLoopThread> acceptThread_;
    std::unique_ptr<TcpServer> server_;

    void onConnection(const TcpConnectionPtr& conn) {
        std::string peer = conn->peerAddr().toIp();

        if (conn->connected()) {
            auto context = std::make_shared<ConnectionContext>(peer);
            conn->setContext(context);
            ctx_.metrics.connectionOpened();
            LOG_INFO << "[Ingestion] Field unit connected: " << conn->peerAddr().toIpPort();

            if (!config_.greeting.empty()) {
                conn->send(config_.greeting + "\n");
            }
            ctx_.eventBus.publish(FieldUnitConnected{peer});
            return;
        }

        auto context = conn->getContext<ConnectionContext>();
        if (!context) return;

        ctx_.metrics.connectionClosed();
        LOG_INFO << "[Ingestion] Field unit disconnected: " << conn->peerAddr().toIpPort()
                 << " location=" << context->effectiveLocation()
                 << " packets=" << context->packets
                 << " errors=" << context->errors;
        ctx_.eventBus.publish(FieldUnitDisconnected{
            peer, context->effectiveLocation(), context->packets, context->errors});
        conn->clearContext();
    }

    void onMessage(const TcpConnectionPtr& conn, MsgBuffer* buf) {
        auto context = conn->getContext<ConnectionContext>();
        if (!context) {
            buf->retrieveAll();
            return;
        }
        context->bytes += buf->readableBytes();

        while (buf->readableBytes() > 0) {
            std::string_view pending(buf->peek(), buf->readableBytes());

            if (context->discarding) {
                auto nl = pending.find('\n');
                if (nl == std::string_view::npos) {
                    buf->retrieveAll();
                    return;
                }
                buf->retrieve(nl + 1);
                context->discarding = false;
                continue;
            }

            auto slice = wire::nextPacket(pending, config_.maxPacketBytes);
            if (slice.status == wire::PacketSlice::Status::NeedMore) {
                return;
            }
            if (slice.status == wire::PacketSlice::Status::Oversized) {
                // 无换行的超长数据：丢弃已到部分，剩余部分跳到下一个换行
                if (slice.consumed == pending.size() && pending.back() != '\n') {
                    context->discarding = true;
                }
                buf->retrieve(slice.consumed);
                recordError(*context, wire::ParseError{wire::ParseErrorKind::Oversized,
                    "packet exceeds " + std::to_string(config_.maxPacketBytes) + " bytes"});
                continue;
            }

            auto result = parser_.decode(slice.packet);
            buf->retrieve(slice.consumed);

            if (!result.ok()) {
                recordError(*context, *result.error);
                continue;
            }
            handleRecord(*context, result.format, std::move(*result.record));
        }
    }

    void handleRecord(ConnectionContext& context, wire::PacketFormat format, wire::DecodedRecord record) {
        ++context.packets;

        if (const auto* identity = std::get_if<wire::IdentityRecord>(&record)) {
            if (!identity->serial.empty()) {
                context.setSerial(identity->serial);
                LOG_DEBUG << "[Ingestion] " << context.peerIp() << " serial=" << identity->serial;
            }
            if (!identity->locationId.empty()) {
                if (context.bindLocation(identity->locationId)) {
                    LOG_INFO << "[Ingestion] " << context.peerIp() << " bound to location "
                             << identity->locationId;
                } else {
                    LOG_WARN << "[Ingestion] " << context.peerIp() << " already bound to "
                             << *context.boundLocation() << ", ignoring locid "
                             << identity->locationId;
                }
            }
            ctx_.metrics.recordPacket(context.effectiveLocation());
            return;
        }

        const auto& explicitLocation = wire::recordLocation(record);
        if (!explicitLocation.empty() && !context.boundLocation()) {
            context.bindLocation(explicitLocation);
        }
        std::string locationId = context.resolveLocation(explicitLocation);

        ctx_.metrics.recordPacket(locationId);
        if (std::holds_alternative<wire::ThermalFrame>(record)) {
            ctx_.metrics.recordThermalFrame(locationId);
        } else {
            ctx_.metrics.recordSensorSample(locationId);
        }
        LOG_TRACE << "[Ingestion] " << wire::packetFormatToString(format) << " record for " << locationId;

        dispatcher_.submit(locationId, std::move(record));
    }

    void recordError(ConnectionContext& context, const wire::ParseError& error) {
        ++context.errors;
        ctx_.metrics.recordPacketError(context.effectiveLocation());
        LOG_DEBUG << "[Ingestion] Parse error from " << context.peerIp()
                  << " (" << context.effectiveLocation() << "): [" << error.code() << "] "
                  << error.message;
    }
};
