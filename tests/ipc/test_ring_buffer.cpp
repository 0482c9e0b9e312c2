// coherence_ipc RingBuffer and SharedMemoryRegion tests

#include <catch2/catch_test_macros.hpp>
#include <coherence/ipc/ring_buffer.hpp>
#include <coherence/ipc/shared_memory.hpp>

#include <unistd.h>

#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace coherence_ipc;
using coherence_core::ErrorCode;
using coherence_core::ErrorException;
using coherence_core::IpcError;

namespace {

std::string unique_name(const std::string& prefix) {
    static int counter = 0;
    return "coherence_test_" + prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++);
}

std::size_t write_bytes(RingBuffer& ring, const std::string& text, std::chrono::milliseconds timeout) {
    return ring.write([&](std::span<std::byte> node) -> std::size_t {
        std::memcpy(node.data(), text.data(), text.size());
        return text.size();
    }, timeout);
}

std::string read_bytes(RingBuffer& ring, std::chrono::milliseconds timeout) {
    std::string out;
    ring.read([&](std::span<const std::byte> node) -> std::size_t {
        out.assign(reinterpret_cast<const char*>(node.data()), node.size());
        return node.size();
    }, timeout);
    return out;
}

} // anonymous namespace

// =============================================================================
// SharedMemoryRegion Tests
// =============================================================================

TEST_CASE("SharedMemoryRegion lifecycle", "[ipc][shm]") {
    const auto name = unique_name("shm");

    SECTION("open before create fails with ChannelNotFound") {
        auto opened = SharedMemoryRegion::open(name);
        REQUIRE(opened.is_err());
        REQUIRE(opened.error().as<IpcError>()->kind == IpcError::Kind::ChannelNotFound);
        REQUIRE_FALSE(SharedMemoryRegion::exists(name));
    }

    SECTION("creator unlinks on destruction") {
        {
            auto created = SharedMemoryRegion::create(name, 4096);
            REQUIRE(created.is_ok());
            REQUIRE(created.value()->is_owner());
            REQUIRE(created.value()->size() == 4096);
            REQUIRE(SharedMemoryRegion::exists(name));

            auto opened = SharedMemoryRegion::open(name);
            REQUIRE(opened.is_ok());
            REQUIRE_FALSE(opened.value()->is_owner());

            created.value()->data()[10] = std::byte{0x5A};
            REQUIRE(opened.value()->data()[10] == std::byte{0x5A});
        }
        REQUIRE_FALSE(SharedMemoryRegion::exists(name));
    }

    SECTION("object names get a leading slash") {
        REQUIRE(shm_object_name("abc") == "/abc");
        REQUIRE(shm_object_name("/abc") == "/abc");
    }
}

// =============================================================================
// RingBuffer Tests
// =============================================================================

TEST_CASE("RingBuffer create and open", "[ipc][ring]") {
    const auto name = unique_name("ring");

    auto master = RingBuffer::create(name, 4, 256);
    REQUIRE(master.is_ok());
    REQUIRE(master.value()->is_master());
    REQUIRE(master.value()->node_count() == 4);
    REQUIRE(master.value()->node_size() == 256);

    SECTION("open with matching dimensions") {
        auto slave = RingBuffer::open(name, 4, 256);
        REQUIRE(slave.is_ok());
        REQUIRE_FALSE(slave.value()->is_master());
    }

    SECTION("open with zero expectations adopts the layout") {
        auto slave = RingBuffer::open(name);
        REQUIRE(slave.is_ok());
        REQUIRE(slave.value()->node_count() == 4);
        REQUIRE(slave.value()->node_size() == 256);
    }

    SECTION("dimension mismatch is an error") {
        auto slave = RingBuffer::open(name, 8, 256);
        REQUIRE(slave.is_err());
        REQUIRE(slave.error().code() == ErrorCode::IncompatibleVersion);
    }

    SECTION("zero sized rings are rejected") {
        auto bad = RingBuffer::create(unique_name("ring"), 0, 256);
        REQUIRE(bad.is_err());
    }
}

TEST_CASE("RingBuffer transfers nodes in order", "[ipc][ring]") {
    const auto name = unique_name("ring");
    auto master = RingBuffer::create(name, 3, 64).value();
    auto slave = RingBuffer::open(name).value();

    REQUIRE(write_bytes(*master, "one", std::chrono::milliseconds(0)) == 3);
    REQUIRE(write_bytes(*master, "two", std::chrono::milliseconds(0)) == 3);
    REQUIRE(slave->pending() == 2);

    REQUIRE(read_bytes(*slave, std::chrono::milliseconds(0)) == "one");
    REQUIRE(read_bytes(*slave, std::chrono::milliseconds(0)) == "two");
    REQUIRE(slave->pending() == 0);

    SECTION("empty ring times out") {
        std::size_t consumed = slave->read([](std::span<const std::byte> node) { return node.size(); },
                                           std::chrono::milliseconds(5));
        REQUIRE(consumed == 0);
    }

    SECTION("wraps around") {
        for (int i = 0; i < 10; ++i) {
            const std::string text = "msg" + std::to_string(i);
            REQUIRE(write_bytes(*master, text, std::chrono::milliseconds(0)) == text.size());
            REQUIRE(read_bytes(*slave, std::chrono::milliseconds(0)) == text);
        }
    }

    SECTION("producer returning zero publishes nothing") {
        REQUIRE(master->write([](std::span<std::byte>) -> std::size_t { return 0; },
                              std::chrono::milliseconds(0)) == 0);
        REQUIRE(slave->pending() == 0);
    }

    SECTION("producer overrun throws") {
        REQUIRE_THROWS_AS(master->write([](std::span<std::byte> node) { return node.size() + 1; },
                                        std::chrono::milliseconds(0)),
                          ErrorException);
    }
}

TEST_CASE("RingBuffer write times out when every node is full", "[ipc][ring]") {
    const auto name = unique_name("ring");
    auto master = RingBuffer::create(name, 10, 32).value();
    auto slave = RingBuffer::open(name).value();

    for (int i = 0; i < 10; ++i) {
        REQUIRE(write_bytes(*master, "x", std::chrono::milliseconds(0)) == 1);
    }

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(write_bytes(*master, "x", std::chrono::milliseconds(20)) == 0);
    REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(20));

    // One read frees one node
    REQUIRE(read_bytes(*slave, std::chrono::milliseconds(0)) == "x");
    REQUIRE(write_bytes(*master, "y", std::chrono::milliseconds(0)) == 1);
}

TEST_CASE("RingBuffer close", "[ipc][ring]") {
    const auto name = unique_name("ring");
    auto master = RingBuffer::create(name, 4, 32).value();
    auto slave = RingBuffer::open(name).value();

    SECTION("pending nodes drain before the close is reported") {
        REQUIRE(write_bytes(*master, "last", std::chrono::milliseconds(0)) == 4);
        master->close();

        REQUIRE(slave->is_closed());
        REQUIRE(read_bytes(*slave, std::chrono::milliseconds(0)) == "last");
        REQUIRE_THROWS_AS(read_bytes(*slave, std::chrono::milliseconds(0)), ErrorException);
    }

    SECTION("writing to a closed ring throws") {
        master->close();
        REQUIRE_THROWS_AS(write_bytes(*slave, "late", std::chrono::milliseconds(0)), ErrorException);
    }

    SECTION("master destruction closes the channel") {
        master.reset();
        REQUIRE(slave->is_closed());
    }
}

TEST_CASE("RingBuffer across threads", "[ipc][ring]") {
    const auto name = unique_name("ring");
    auto master = RingBuffer::create(name, 2, 16).value();
    auto slave = RingBuffer::open(name).value();

    constexpr int k_count = 200;
    std::thread producer([&] {
        for (int i = 0; i < k_count; ++i) {
            while (master->write([i](std::span<std::byte> node) -> std::size_t {
                       std::memcpy(node.data(), &i, sizeof(i));
                       return sizeof(i);
                   }, std::chrono::milliseconds(10)) == 0) {
            }
        }
    });

    std::vector<int> received;
    while (received.size() < k_count) {
        slave->read([&](std::span<const std::byte> node) -> std::size_t {
            int value = 0;
            std::memcpy(&value, node.data(), sizeof(value));
            received.push_back(value);
            return node.size();
        }, std::chrono::milliseconds(10));
    }
    producer.join();

    for (int i = 0; i < k_count; ++i) {
        REQUIRE(received[static_cast<std::size_t>(i)] == i);
    }
}
