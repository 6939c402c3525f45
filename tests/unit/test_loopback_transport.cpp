#include "LoopbackTransport.h"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace PeerBeam;

void test_frames_wait_for_pump() {
    std::cout << "Running test_frames_wait_for_pump..." << std::endl;
    auto [alice, bob] = LoopbackTransport::createPair("alice", "bob");
    assert(alice->name() == "alice");

    std::vector<Frame> received;
    bob->setFrameHandler([&](const Frame& frame) { received.push_back(frame); });

    assert(alice->sendText("{\"type\":\"end\"}"));
    assert(alice->sendBinary({1, 2, 3}));
    assert(received.empty());
    assert(bob->pendingFrames() == 2);
    assert(alice->pendingFrames() == 0);

    assert(bob->pump() == 2);
    assert(received.size() == 2);
    assert(received[0].type == FrameType::Text);
    assert(received[0].text == "{\"type\":\"end\"}");
    assert(received[1].type == FrameType::Binary);
    assert((received[1].data == std::vector<uint8_t>{1, 2, 3}));

    std::cout << "test_frames_wait_for_pump passed." << std::endl;
}

void test_pump_limit_and_missing_handler() {
    std::cout << "Running test_pump_limit_and_missing_handler..." << std::endl;
    auto [a, b] = LoopbackTransport::createPair();

    a->sendText("1");
    a->sendText("2");
    a->sendText("3");
    assert(b->pump() == 0);   // no handler yet, frames stay queued
    assert(b->pendingFrames() == 3);

    int count = 0;
    b->setFrameHandler([&](const Frame&) { ++count; });
    assert(b->pump(2) == 2);
    assert(count == 2);
    assert(b->pendingFrames() == 1);

    std::cout << "test_pump_limit_and_missing_handler passed." << std::endl;
}

void test_ping_pong_with_pump_all() {
    std::cout << "Running test_ping_pong_with_pump_all..." << std::endl;
    auto [a, b] = LoopbackTransport::createPair();

    int rounds = 0;
    a->setFrameHandler([&](const Frame&) {
        if (++rounds < 5) {
            a->sendText("ping");
        }
    });
    b->setFrameHandler([&](const Frame& frame) { b->sendText(frame.text); });

    a->sendText("ping");
    size_t delivered = LoopbackTransport::pumpAll(*a, *b);
    assert(rounds == 5);
    assert(delivered == 10);

    std::cout << "test_ping_pong_with_pump_all passed." << std::endl;
}

void test_close_notifies_both_sides_once() {
    std::cout << "Running test_close_notifies_both_sides_once..." << std::endl;
    auto [a, b] = LoopbackTransport::createPair();

    std::vector<std::string> reasonsA;
    std::vector<std::string> reasonsB;
    a->setCloseHandler([&](const std::string& reason) { reasonsA.push_back(reason); });
    b->setCloseHandler([&](const std::string& reason) { reasonsB.push_back(reason); });

    a->sendText("queued");
    a->close();
    a->close();
    b->close();

    assert(!a->isOpen());
    assert(!b->isOpen());
    assert(reasonsA.size() == 1 && reasonsA[0] == "closed locally");
    assert(reasonsB.size() == 1 && reasonsB[0] == "closed by peer");
    assert(b->pendingFrames() == 0);

    assert(!a->sendText("late"));
    assert(!b->sendBinary({9}));

    std::cout << "test_close_notifies_both_sides_once passed." << std::endl;
}

void test_send_after_peer_destroyed() {
    std::cout << "Running test_send_after_peer_destroyed..." << std::endl;
    auto pair = LoopbackTransport::createPair();
    auto a = pair.first;
    pair.second.reset();

    assert(a->isOpen());
    assert(!a->sendText("nobody home"));

    std::cout << "test_send_after_peer_destroyed passed." << std::endl;
}

int main() {
    try {
        test_frames_wait_for_pump();
        test_pump_limit_and_missing_handler();
        test_ping_pong_with_pump_all();
        test_close_notifies_both_sides_once();
        test_send_after_peer_destroyed();
        std::cout << "All LoopbackTransport tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
