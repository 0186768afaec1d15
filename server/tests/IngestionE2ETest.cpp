#include "common/network/IngestionServer.hpp"
#include "common/protocol/wire/Wire.Builder.hpp"
#include "modules/fusion/FusionEngine.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

/**
 * @brief 阻塞式 loopback 客户端，模拟现场单元
 */
class LoopbackClient {
public:
    explicit LoopbackClient(uint16_t port) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        // 监听在接入线程上异步开启，连接被拒绝时稍后重试
        for (int attempt = 0; attempt < 100 && !connected_; ++attempt) {
            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
                connected_ = true;
                break;
            }
            ::close(fd_);
            fd_ = -1;
            std::this_thread::sleep_for(20ms);
        }
        if (connected_) {
            timeval tv{2, 0};
            ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }
    }

    ~LoopbackClient() {
        if (fd_ >= 0) ::close(fd_);
    }

    LoopbackClient(const LoopbackClient&) = delete;
    LoopbackClient& operator=(const LoopbackClient&) = delete;

    bool connected() const { return connected_; }

    bool send(const std::string& data) {
        size_t offset = 0;
        while (offset < data.size()) {
            auto n = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n <= 0) return false;
            offset += static_cast<size_t>(n);
        }
        return true;
    }

    std::string readLine() {
        std::string line;
        char c;
        while (::recv(fd_, &c, 1, 0) == 1) {
            if (c == '\n') break;
            line += c;
        }
        return line;
    }

private:
    int fd_ = -1;
    bool connected_ = false;
};

bool waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

std::string sensorLine(const std::string& location, int adc1, bool flame = false, int adc2 = 10) {
    wire::SensorSample sample;
    sample.locationId = location;
    sample.adc1 = adc1;
    sample.adc2 = adc2;
    sample.flameFlag = flame;
    return wire::Builder::encodeLine(sample, location.empty() ? wire::PacketFormat::NoLoc
                                                              : wire::PacketFormat::Embedded);
}

std::string frameLine(double celsius) {
    wire::ThermalCalibration cal;
    std::vector<uint16_t> raw(Constants::THERMAL_CELLS, wire::Builder::rawFromCelsius(celsius, cal));
    return wire::Builder::encodeLine(wire::Builder::makeFrame(raw, cal), wire::PacketFormat::NoLoc);
}

}  // namespace

/**
 * @brief 接入服务 + 交接队列 + 融合引擎，消费端先融合再记录到达的记录
 */
class IngestionE2ETest : public ::testing::Test {
protected:
    struct Received {
        std::string locationId;
        wire::DecodedRecord record;
    };

    void startServer(uint16_t port, size_t queueCapacity = 256) {
        AppConfig cfg;
        cfg.ingestion.host = "127.0.0.1";
        cfg.ingestion.port = port;
        cfg.ingestion.ioThreads = 2;
        cfg.ingestion.fusionThreads = 2;
        cfg.ingestion.queueCapacity = queueCapacity;
        cfg.ingestion.maxPacketBytes = 8192;
        ctx_ = std::make_unique<AppContext>(std::move(cfg));
        fusion_ = std::make_unique<FusionEngine>(*ctx_);

        records_ = std::make_unique<RecordDispatcher>(*ctx_,
            [this](const std::string& loc, const wire::DecodedRecord& record, RecordDispatcher::TimePoint) {
                fusion_->ingest(loc, record);
                std::lock_guard lock(mutex_);
                received_.push_back({loc, record});
            });
        server_ = std::make_unique<IngestionServer>(*ctx_, *records_);

        records_->start();
        server_->start();
    }

    void TearDown() override {
        if (server_) server_->stop();
        if (records_) records_->stop();
        server_.reset();
        records_.reset();
        fusion_.reset();
        ctx_.reset();
    }

    std::vector<Received> receivedFor(const std::string& location) {
        std::lock_guard lock(mutex_);
        std::vector<Received> result;
        for (const auto& r : received_) {
            if (r.locationId == location) result.push_back(r);
        }
        return result;
    }

    size_t receivedCount() {
        std::lock_guard lock(mutex_);
        return received_.size();
    }

    std::unique_ptr<AppContext> ctx_;
    std::unique_ptr<FusionEngine> fusion_;
    std::unique_ptr<RecordDispatcher> records_;
    std::unique_ptr<IngestionServer> server_;

    std::mutex mutex_;
    std::vector<Received> received_;
};

TEST_F(IngestionE2ETest, GreetsAndRoutesByBoundLocation) {
    startServer(39017);
    LoopbackClient client(39017);
    ASSERT_TRUE(client.connected());
    EXPECT_EQ(client.readLine(), "PERIOD_ON");

    ASSERT_TRUE(client.send(wire::Builder::serialPacket("SIM001") + "\n"
                            + wire::Builder::locationPacket("RoomA") + "\n"
                            + frameLine(45.0)
                            + sensorLine("", 1734, true)));

    ASSERT_TRUE(waitFor([this]() { return receivedFor("RoomA").size() == 2; }));
    auto records = receivedFor("RoomA");
    EXPECT_TRUE(std::holds_alternative<wire::ThermalFrame>(records[0].record));
    EXPECT_NEAR(std::get<wire::ThermalFrame>(records[0].record).maxTemperature(), 45.0, 0.01);
    EXPECT_EQ(std::get<wire::SensorSample>(records[1].record).adc1, 1734);

    EXPECT_EQ(ctx_->metrics.thermalFrames("RoomA"), 1);
    EXPECT_EQ(ctx_->metrics.sensorSamples("RoomA"), 1);
    EXPECT_EQ(ctx_->metrics.activeConnections(), 1);
}

TEST_F(IngestionE2ETest, FlameSampleReachesFusionStateForBoundLocation) {
    startServer(39023);
    LoopbackClient client(39023);
    ASSERT_TRUE(client.connected());
    client.readLine();

    ASSERT_TRUE(client.send(wire::Builder::serialPacket("SIM001") + "\n"
                            + wire::Builder::locationPacket("RoomA") + "\n"
                            + frameLine(45.0)
                            + sensorLine("", 1734, true, 2293)));

    ASSERT_TRUE(waitFor([this]() { return receivedFor("RoomA").size() == 2; }));

    auto records = receivedFor("RoomA");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<wire::ThermalFrame>(records[0].record));
    const auto& sample = std::get<wire::SensorSample>(records[1].record);
    EXPECT_EQ(sample.adc1, 1734);
    EXPECT_EQ(sample.adc2, 2293);
    EXPECT_TRUE(sample.flameFlag);

    auto snap = fusion_->snapshot("RoomA");
    ASSERT_TRUE(snap.has_value());
    EXPECT_TRUE(snap->flameDetected);
    EXPECT_DOUBLE_EQ(snap->flamePct, 100.0);
    EXPECT_EQ(snap->framesSeen, 1u);
    EXPECT_EQ(snap->samplesSeen, 1u);
    EXPECT_NEAR(snap->maxTemperature, 45.0, 0.01);
    EXPECT_TRUE(snap->alarmActive);

    EXPECT_EQ(ctx_->metrics.thermalFrames("RoomA"), 1);
    EXPECT_EQ(ctx_->metrics.sensorSamples("RoomA"), 1);
    EXPECT_EQ(ctx_->metrics.packetErrors("RoomA"), 0);
    EXPECT_EQ(ctx_->metrics.totalPacketErrors(), 0);
    EXPECT_EQ(fusion_->locationCount(), 1u);
}

TEST_F(IngestionE2ETest, UnboundConnectionFallsBackToPeerIp) {
    startServer(39018);
    LoopbackClient client(39018);
    ASSERT_TRUE(client.connected());
    client.readLine();

    ASSERT_TRUE(client.send(sensorLine("", 42)));
    ASSERT_TRUE(waitFor([this]() { return receivedFor("127.0.0.1").size() == 1; }));
    EXPECT_EQ(ctx_->metrics.packetsReceived("127.0.0.1"), 1);
}

TEST_F(IngestionE2ETest, MalformedPacketsDoNotCloseConnection) {
    startServer(39019);
    LoopbackClient client(39019);
    ASSERT_TRUE(client.connected());
    client.readLine();

    ASSERT_TRUE(client.send("garbage\n#status:ok!\n" + sensorLine("RoomB", 7)));
    ASSERT_TRUE(waitFor([this]() { return receivedFor("RoomB").size() == 1; }));

    EXPECT_EQ(ctx_->metrics.packetErrors("127.0.0.1"), 2);
    EXPECT_EQ(ctx_->metrics.sensorSamples("RoomB"), 1);

    // 连接已绑定到 RoomB，后续无位置报文也归到 RoomB
    ASSERT_TRUE(client.send(sensorLine("", 8)));
    ASSERT_TRUE(waitFor([this]() { return receivedFor("RoomB").size() == 2; }));
}

TEST_F(IngestionE2ETest, ReassemblesPacketsSplitAcrossWrites) {
    startServer(39020);
    LoopbackClient client(39020);
    ASSERT_TRUE(client.connected());
    client.readLine();

    std::string line = frameLine(30.0);
    size_t half = line.size() / 2;
    ASSERT_TRUE(client.send(wire::Builder::locationPacket("RoomC") + "\n" + line.substr(0, half)));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(receivedFor("RoomC").size(), 0u);

    ASSERT_TRUE(client.send(line.substr(half)));
    ASSERT_TRUE(waitFor([this]() { return receivedFor("RoomC").size() == 1; }));
    EXPECT_EQ(ctx_->metrics.totalPacketErrors(), 0);
}

TEST_F(IngestionE2ETest, OversizedLineIsSkipped) {
    startServer(39021);
    LoopbackClient client(39021);
    ASSERT_TRUE(client.connected());
    client.readLine();

    ASSERT_TRUE(client.send(std::string(10000, 'A') + "\n" + sensorLine("RoomD", 3)));
    ASSERT_TRUE(waitFor([this]() { return receivedFor("RoomD").size() == 1; }));
    EXPECT_GE(ctx_->metrics.totalPacketErrors(), 1);
}

TEST_F(IngestionE2ETest, SustainsConcurrentFieldUnits) {
    constexpr int kClients = 10;
    constexpr int kPackets = 100;
    constexpr auto kPacketInterval = 50ms;   // 每个客户端 20 包/秒
    startServer(39022, kPackets);

    std::atomic<int> failures{0};
    std::atomic<int> finished{0};
    std::atomic<bool> release{false};
    std::vector<std::thread> threads;
    for (int c = 0; c < kClients; ++c) {
        threads.emplace_back([c, &failures, &finished, &release, kPacketInterval]() {
            LoopbackClient client(39022);
            bool ok = client.connected();
            if (ok) {
                client.readLine();
                std::string location = "Load" + std::to_string(c);
                auto next = std::chrono::steady_clock::now();
                for (int i = 0; i < kPackets && ok; ++i) {
                    ok = client.send(sensorLine(location, i));
                    next += kPacketInterval;
                    std::this_thread::sleep_until(next);
                }
            }
            if (!ok) ++failures;
            ++finished;

            // 所有断言完成前保持连接
            auto deadline = std::chrono::steady_clock::now() + 20s;
            while (!release.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(5ms);
            }
        });
    }

    bool allConnected = waitFor([this]() { return ctx_->metrics.activeConnections() == kClients; }, 5000ms);
    int64_t minActive = ctx_->metrics.activeConnections();
    while (finished.load() < kClients) {
        minActive = std::min(minActive, ctx_->metrics.activeConnections());
        std::this_thread::sleep_for(10ms);
    }
    bool allReceived = waitFor([this]() { return receivedCount() == kClients * kPackets; }, 10000ms);
    int64_t activeAfterSending = ctx_->metrics.activeConnections();
    int64_t packetsReceived = ctx_->metrics.totalPacketsReceived();

    release.store(true);
    for (auto& t : threads) t.join();

    ASSERT_EQ(failures.load(), 0);
    EXPECT_TRUE(allConnected);
    EXPECT_EQ(minActive, kClients) << "a connection dropped while sending";
    EXPECT_EQ(activeAfterSending, kClients);
    ASSERT_TRUE(allReceived) << "received " << receivedCount();
    EXPECT_EQ(packetsReceived, kClients * kPackets);
    EXPECT_EQ(ctx_->metrics.totalPacketErrors(), 0);

    for (int c = 0; c < kClients; ++c) {
        std::string location = "Load" + std::to_string(c);
        auto records = receivedFor(location);
        ASSERT_EQ(records.size(), static_cast<size_t>(kPackets)) << location;
        for (int i = 0; i < kPackets; ++i) {
            EXPECT_EQ(std::get<wire::SensorSample>(records[static_cast<size_t>(i)].record).adc1, i);
        }
        EXPECT_EQ(ctx_->metrics.packetsReceived(location), kPackets);
        EXPECT_EQ(ctx_->metrics.recordsDropped(location), 0);
    }

    // 客户端关闭后连接数归零
    EXPECT_TRUE(waitFor([this]() { return ctx_->metrics.activeConnections() == 0; }));
}
