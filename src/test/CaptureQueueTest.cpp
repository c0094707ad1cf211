#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <cassert>
#include "application/CaptureQueue.hpp"

using meetinglens::application::CaptureQueue;
using meetinglens::domain::AudioChunk;

namespace {

std::vector<int16_t> Block(int16_t value, size_t samples = 16) {
    return std::vector<int16_t>(samples, value);
}

void TestSequenceAndTimeout() {
    std::cout << "[Test] Sequence numbers and pop timeout..." << std::endl;
    CaptureQueue queue;
    assert(queue.push(Block(1)));
    assert(queue.push(Block(2)));
    assert(queue.push(Block(3)));
    assert(queue.size() == 3);
    assert(queue.highWaterMark() == 3);

    AudioChunk chunk;
    for (uint64_t expected = 0; expected < 3; ++expected) {
        auto status = queue.popFor(chunk, std::chrono::milliseconds(10));
        assert(status == CaptureQueue::PopStatus::Chunk);
        assert(chunk.sequence == expected);
        assert(chunk.samples.front() == static_cast<int16_t>(expected + 1));
    }

    auto start = std::chrono::steady_clock::now();
    auto status = queue.popFor(chunk, std::chrono::milliseconds(50));
    auto waited = std::chrono::steady_clock::now() - start;
    assert(status == CaptureQueue::PopStatus::Timeout);
    assert(waited >= std::chrono::milliseconds(40));
    std::cout << "[PASS] Sequence numbers and pop timeout" << std::endl;
}

void TestCloseDrainsThenReportsClosed() {
    std::cout << "[Test] Close drains remaining chunks..." << std::endl;
    CaptureQueue queue;
    queue.push(Block(7));
    queue.push(Block(8));
    queue.close();

    assert(queue.isClosed());
    assert(!queue.push(Block(9)));

    AudioChunk chunk;
    assert(queue.popFor(chunk, std::chrono::milliseconds(10)) == CaptureQueue::PopStatus::Chunk);
    assert(chunk.samples.front() == 7);
    assert(queue.popFor(chunk, std::chrono::milliseconds(10)) == CaptureQueue::PopStatus::Chunk);
    assert(chunk.samples.front() == 8);
    assert(queue.popFor(chunk, std::chrono::milliseconds(10)) == CaptureQueue::PopStatus::Closed);
    std::cout << "[PASS] Close drains remaining chunks" << std::endl;
}

void TestCloseWakesBlockedConsumer() {
    std::cout << "[Test] Close wakes a waiting consumer..." << std::endl;
    CaptureQueue queue;
    CaptureQueue::PopStatus observed = CaptureQueue::PopStatus::Chunk;

    std::thread consumer([&]() {
        AudioChunk chunk;
        observed = queue.popFor(chunk, std::chrono::seconds(10));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto start = std::chrono::steady_clock::now();
    queue.close();
    consumer.join();

    assert(observed == CaptureQueue::PopStatus::Closed);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    std::cout << "[PASS] Close wakes a waiting consumer" << std::endl;
}

void TestProducerConsumerOrder() {
    std::cout << "[Test] Producer/consumer preserve arrival order..." << std::endl;
    const int kChunks = 2000;
    CaptureQueue queue(8);

    std::thread producer([&]() {
        for (int i = 0; i < kChunks; ++i) {
            queue.push(Block(static_cast<int16_t>(i % 30000), 4));
        }
        queue.close();
    });

    std::vector<uint64_t> sequences;
    AudioChunk chunk;
    while (true) {
        auto status = queue.popFor(chunk, std::chrono::milliseconds(100));
        if (status == CaptureQueue::PopStatus::Closed) break;
        if (status == CaptureQueue::PopStatus::Timeout) continue;
        assert(chunk.samples.front() == static_cast<int16_t>(chunk.sequence % 30000));
        sequences.push_back(chunk.sequence);
    }
    producer.join();

    assert(sequences.size() == static_cast<size_t>(kChunks));
    for (size_t i = 0; i < sequences.size(); ++i) {
        assert(sequences[i] == i);
    }
    assert(queue.highWaterMark() >= 1);
    std::cout << "[PASS] Producer/consumer preserve arrival order" << std::endl;
}

} // namespace

int main() {
    TestSequenceAndTimeout();
    TestCloseDrainsThenReportsClosed();
    TestCloseWakesBlockedConsumer();
    TestProducerConsumerOrder();
    std::cout << "[Test] CaptureQueue: all tests passed." << std::endl;
    return 0;
}
