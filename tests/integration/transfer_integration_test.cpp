/**
 * @file transfer_integration_test.cpp
 * @brief End-to-end sender/receiver sessions over loopback and TCP transports
 */

#include <gtest/gtest.h>
#include <json/json.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <thread>

#include "Constants.h"
#include "EventBus.h"
#include "LoopbackTransport.h"
#include "Logger.h"
#include "MockTransport.h"
#include "TcpFrameTransport.h"
#include "TransferEvents.h"
#include "TransferReceiver.h"
#include "TransferSender.h"

using namespace PeerBeam;
using namespace PeerBeam::mocks;

namespace {

std::vector<uint8_t> makeContent(size_t size, uint32_t seed = 1) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed;
    for (auto& byte : data) {
        state = state * 1664525u + 1013904223u;
        byte = static_cast<uint8_t>(state >> 24);
    }
    return data;
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    return root;
}

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

class TransferIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::ERROR);
        auto pair = LoopbackTransport::createPair("sender", "receiver");
        senderEnd_ = pair.first;
        receiverEnd_ = pair.second;

        receiverBus_.subscribe(events::PROGRESS, [this](const std::any& data) {
            receiverProgress_.push_back(std::any_cast<const ProgressUpdate&>(data));
        });
    }

    /// Start both sides on the loopback pair and pump to quiescence
    void runSession(TransferSender& sender, TransferReceiver& receiver, std::vector<uint8_t> content,
                    const std::string& name = "payload.bin") {
        ASSERT_TRUE(receiver.start().ok());
        ASSERT_TRUE(sender.start(name, std::move(content)).ok());
        LoopbackTransport::pumpAll(*senderEnd_, *receiverEnd_);
    }

    std::shared_ptr<LoopbackTransport> senderEnd_;
    std::shared_ptr<LoopbackTransport> receiverEnd_;
    EventBus senderBus_;
    EventBus receiverBus_;
    std::vector<ProgressUpdate> receiverProgress_;
};

TEST_F(TransferIntegrationTest, RoundTripAcrossChunkBoundaries) {
    struct Case {
        size_t size;
        size_t chunks;
    };
    const Case cases[] = {{0, 0}, {1, 1}, {65536, 1}, {65537, 2}, {150000, 3}};

    for (const auto& c : cases) {
        SCOPED_TRACE("size " + std::to_string(c.size));
        auto pair = LoopbackTransport::createPair();
        TransferSender sender(*pair.first);
        TransferReceiver receiver(*pair.second);

        auto content = makeContent(c.size, static_cast<uint32_t>(c.size) + 7);
        ASSERT_TRUE(receiver.start().ok());
        ASSERT_TRUE(sender.start("file.bin", content).ok());
        LoopbackTransport::pumpAll(*pair.first, *pair.second);

        EXPECT_EQ(sender.state(), SenderState::DONE);
        ASSERT_EQ(receiver.state(), ReceiverState::COMPLETE);
        EXPECT_EQ(sender.chunksSent(), c.chunks);
        EXPECT_EQ(receiver.chunksReceived(), c.chunks);
        ASSERT_NE(receiver.output(), nullptr);
        EXPECT_EQ(*receiver.output(), content);
        EXPECT_EQ(receiver.metadata()->hash, Crypto::digest(content));
    }
}

TEST_F(TransferIntegrationTest, FingerprintsMatchOnBothSides) {
    TransferSender sender(*senderEnd_, TransferOptions{}, &senderBus_);
    TransferReceiver receiver(*receiverEnd_, &receiverBus_);

    std::string senderEvent;
    std::string receiverEvent;
    senderBus_.subscribe(events::FINGERPRINT, [&](const std::any& d) { senderEvent = std::any_cast<const std::string&>(d); });
    receiverBus_.subscribe(events::FINGERPRINT, [&](const std::any& d) { receiverEvent = std::any_cast<const std::string&>(d); });

    runSession(sender, receiver, makeContent(4096));

    ASSERT_EQ(receiver.state(), ReceiverState::COMPLETE);
    EXPECT_FALSE(sender.fingerprint().empty());
    EXPECT_EQ(sender.fingerprint(), receiver.fingerprint());
    EXPECT_EQ(senderEvent, receiverEvent);
    EXPECT_EQ(sender.fingerprint().size(), 19u);
}

TEST_F(TransferIntegrationTest, ReceiverProgressIsMonotonicAndReachesHundred) {
    TransferSender sender(*senderEnd_);
    TransferReceiver receiver(*receiverEnd_, &receiverBus_);

    runSession(sender, receiver, makeContent(5 * config::CHUNK_SIZE + 123));

    ASSERT_EQ(receiver.state(), ReceiverState::COMPLETE);
    ASSERT_GE(receiverProgress_.size(), 6u);
    for (size_t i = 1; i < receiverProgress_.size(); ++i) {
        EXPECT_GE(receiverProgress_[i].percent, receiverProgress_[i - 1].percent);
    }
    EXPECT_DOUBLE_EQ(receiverProgress_.back().percent, 100.0);
    EXPECT_EQ(receiverProgress_.back().bytesTransferred, 5 * config::CHUNK_SIZE + 123);
}

TEST_F(TransferIntegrationTest, EveryChunkUsesAFreshIv) {
    std::set<std::vector<uint8_t>> ivs;
    size_t headers = 0;
    TamperingTransport observer(*senderEnd_, [&](Frame& frame, size_t) {
        if (frame.type != FrameType::Text) {
            return;
        }
        auto decoded = ChunkCodec::decode(frame.text);
        if (decoded) {
            if (auto* header = std::get_if<ChunkHeader>(&decoded.value())) {
                ivs.insert(std::vector<uint8_t>(header->iv.begin(), header->iv.end()));
                ++headers;
            }
        }
    });

    // Same plaintext in every chunk
    std::vector<uint8_t> content(8 * config::CHUNK_SIZE, 0x42);
    TransferSender sender(observer);
    TransferReceiver receiver(*receiverEnd_);
    runSession(sender, receiver, content);

    ASSERT_EQ(receiver.state(), ReceiverState::COMPLETE);
    EXPECT_EQ(headers, 8u);
    EXPECT_EQ(ivs.size(), 8u);
}

TEST_F(TransferIntegrationTest, FlippedCiphertextBitFailsAuthentication) {
    bool flipped = false;
    TamperingTransport attacker(*senderEnd_, [&](Frame& frame, size_t) {
        if (frame.type == FrameType::Binary && !flipped) {
            frame.data[frame.data.size() / 2] ^= 0x80;
            flipped = true;
        }
    });

    TransferSender sender(attacker);
    TransferReceiver receiver(*receiverEnd_);
    runSession(sender, receiver, makeContent(3 * config::CHUNK_SIZE));

    EXPECT_TRUE(flipped);
    ASSERT_EQ(receiver.state(), ReceiverState::FAILED);
    EXPECT_EQ(receiver.lastError()->code, ErrorCode::AuthenticationFailed);
    EXPECT_EQ(receiver.output(), nullptr);
}

TEST_F(TransferIntegrationTest, AlteredAnnouncedHashFailsIntegrity) {
    TamperingTransport attacker(*senderEnd_, [](Frame& frame, size_t index) {
        if (index != 0) {
            return;
        }
        Json::Value meta = parseJson(frame.text);
        meta["hash"] = std::string(config::DIGEST_HEX_LENGTH, '0');
        frame.text = writeJson(meta);
    });

    TransferSender sender(attacker);
    TransferReceiver receiver(*receiverEnd_);
    runSession(sender, receiver, makeContent(10000));

    EXPECT_EQ(sender.state(), SenderState::DONE);
    ASSERT_EQ(receiver.state(), ReceiverState::FAILED);
    EXPECT_EQ(receiver.lastError()->code, ErrorCode::IntegrityMismatch);
}

TEST_F(TransferIntegrationTest, StrayBinaryBeforeFirstChunkIsIgnored) {
    TransferSender sender(*senderEnd_);
    TransferReceiver receiver(*receiverEnd_);
    ASSERT_TRUE(receiver.start().ok());
    ASSERT_TRUE(sender.start("doc.txt", makeContent(70000)).ok());

    // meta -> ekey, then a stray binary lands ahead of the stream
    receiverEnd_->pump();
    ASSERT_EQ(receiver.state(), ReceiverState::RECEIVING);
    ASSERT_TRUE(senderEnd_->sendBinary(std::vector<uint8_t>(48, 0x00)));
    LoopbackTransport::pumpAll(*senderEnd_, *receiverEnd_);

    EXPECT_EQ(receiver.state(), ReceiverState::COMPLETE);
}

TEST_F(TransferIntegrationTest, LegacyKeyFieldInMetaIsAccepted) {
    TamperingTransport legacy(*senderEnd_, [](Frame& frame, size_t index) {
        if (index != 0) {
            return;
        }
        Json::Value meta = parseJson(frame.text);
        meta["ecdhPub"] = meta["exchangePublicKey"];
        meta.removeMember("exchangePublicKey");
        frame.text = writeJson(meta);
    });

    TransferSender sender(legacy);
    TransferReceiver receiver(*receiverEnd_);
    runSession(sender, receiver, makeContent(2000));

    EXPECT_EQ(receiver.state(), ReceiverState::COMPLETE);
    EXPECT_EQ(sender.fingerprint(), receiver.fingerprint());
}

TEST_F(TransferIntegrationTest, SilentReceiverTimesOut) {
    auto now = std::make_shared<ThroughputMeter::Clock::time_point>(ThroughputMeter::Clock::now());
    TransferOptions options;
    options.peerKeyTimeout = std::chrono::seconds(5);

    TransferSender sender(*senderEnd_, options, &senderBus_, [now] { return *now; });
    std::vector<Error> failures;
    senderBus_.subscribe(events::FAILED, [&](const std::any& d) { failures.push_back(std::any_cast<const Error&>(d)); });

    // The receiver exists but never started, so meta is dropped
    TransferReceiver receiver(*receiverEnd_);
    ASSERT_TRUE(sender.start("a.bin", makeContent(10)).ok());
    LoopbackTransport::pumpAll(*senderEnd_, *receiverEnd_);
    EXPECT_EQ(sender.state(), SenderState::AWAITING_PEER_KEY);

    *now += std::chrono::seconds(5);
    EXPECT_TRUE(sender.checkTimeout());
    EXPECT_EQ(sender.state(), SenderState::FAILED);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].code, ErrorCode::PeerKeyTimeout);
}

TEST_F(TransferIntegrationTest, CloseMidTransferFailsReceiver) {
    TransferSender sender(*senderEnd_);
    TransferReceiver receiver(*receiverEnd_);
    ASSERT_TRUE(receiver.start().ok());
    ASSERT_TRUE(sender.start("big.bin", makeContent(4 * config::CHUNK_SIZE)).ok());

    receiverEnd_->pump();   // meta
    senderEnd_->pump();     // ekey; the whole stream is queued
    ASSERT_EQ(sender.state(), SenderState::DONE);
    receiverEnd_->pump(3);  // header, body, header

    senderEnd_->close();
    EXPECT_EQ(sender.state(), SenderState::DONE);
    ASSERT_EQ(receiver.state(), ReceiverState::FAILED);
    EXPECT_EQ(receiver.lastError()->code, ErrorCode::ChannelClosed);
    EXPECT_EQ(receiver.chunksReceived(), 1u);
}

TEST_F(TransferIntegrationTest, SenderFailsWhenChannelClosesBeforeKey) {
    TransferSender sender(*senderEnd_, TransferOptions{}, &senderBus_);
    ASSERT_TRUE(sender.start("a.bin", makeContent(10)).ok());

    receiverEnd_->close();
    ASSERT_EQ(sender.state(), SenderState::FAILED);
    EXPECT_EQ(sender.lastError()->code, ErrorCode::ChannelClosed);
}

TEST_F(TransferIntegrationTest, TcpRoundTripOnLocalhost) {
    auto listener = TcpListener::bind(0);
    ASSERT_TRUE(listener.ok()) << listener.error().toString();
    const int port = listener.value()->port();
    ASSERT_GT(port, 0);

    auto content = makeContent(3 * config::CHUNK_SIZE + 999, 42);

    std::atomic<bool> receiverDone{false};
    ReceiverState finalState = ReceiverState::INIT;
    std::vector<uint8_t> received;

    std::thread receiverThread([&] {
        auto accepted = listener.value()->accept(5000);
        if (!accepted) {
            receiverDone = true;
            return;
        }
        auto& transport = *accepted.value();
        TransferReceiver receiver(transport);
        if (receiver.start().ok()) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!receiver.isFinished() && std::chrono::steady_clock::now() < deadline) {
                transport.poll(config::POLL_INTERVAL_MS);
            }
        }
        finalState = receiver.state();
        if (receiver.output()) {
            received = *receiver.output();
        }
        transport.close();
        receiverDone = true;
    });

    // No ASSERTs until the receiver thread is joined
    SenderState senderState = SenderState::INIT;
    size_t chunksSent = 0;
    auto connection = TcpFrameTransport::connectTo("127.0.0.1", port);
    EXPECT_TRUE(connection.ok());
    if (connection) {
        auto& transport = *connection.value();
        TransferSender sender(transport);
        EXPECT_TRUE(sender.start("tcp.bin", content).ok());

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!sender.isFinished() && std::chrono::steady_clock::now() < deadline) {
            transport.poll(config::POLL_INTERVAL_MS);
        }
        // Wait for the receiver to verify and hang up
        while (transport.isOpen() && !receiverDone && std::chrono::steady_clock::now() < deadline) {
            transport.poll(config::POLL_INTERVAL_MS);
        }
        senderState = sender.state();
        chunksSent = sender.chunksSent();
        transport.close();
    }
    receiverThread.join();

    EXPECT_EQ(senderState, SenderState::DONE);
    EXPECT_EQ(chunksSent, 4u);
    ASSERT_EQ(finalState, ReceiverState::COMPLETE);
    EXPECT_EQ(received, content);
}

TEST_F(TransferIntegrationTest, ConnectToClosedPortFails) {
    auto listener = TcpListener::bind(0);
    ASSERT_TRUE(listener.ok());
    const int port = listener.value()->port();
    listener.value().reset();

    auto connection = TcpFrameTransport::connectTo("127.0.0.1", port);
    ASSERT_FALSE(connection.ok());
    EXPECT_EQ(connection.error().code, ErrorCode::ConnectionFailed);

    auto badPort = TcpFrameTransport::connectTo("127.0.0.1", 70000);
    ASSERT_FALSE(badPort.ok());
    EXPECT_EQ(badPort.error().code, ErrorCode::InvalidArgument);
}
