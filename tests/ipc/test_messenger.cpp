// coherence_ipc Messenger tests

#include <catch2/catch_test_macros.hpp>
#include <coherence/ipc/entity.hpp>
#include <coherence/ipc/messenger.hpp>

#include <unistd.h>

#include <cstring>
#include <string>
#include <vector>

using namespace coherence_ipc;
using coherence_core::ErrorCode;
using coherence_core::ErrorException;

namespace {

std::string unique_name(const std::string& prefix) {
    static int counter = 0;
    return "coherence_test_" + prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++);
}

#pragma pack(push, 1)
struct Counter {
    std::int32_t value;
};
#pragma pack(pop)

struct Received {
    std::string target;
    MessageHeader header{};
    std::vector<std::byte> payload;

    template<typename T>
    T as() const {
        T out{};
        std::memcpy(&out, payload.data(), sizeof(T));
        return out;
    }
};

/// Master/slave pair over two rings
struct Pair {
    std::string a = unique_name("a");
    std::string b = unique_name("b");
    Messenger master;
    Messenger slave;

    explicit Pair(std::uint32_t node_count = 8, std::uint32_t node_size = 256) {
        REQUIRE(master.connect_as_master(a, b, node_count, node_size).is_ok());
        REQUIRE(slave.connect_as_slave(b, a, node_count, node_size).is_ok());
    }
};

std::vector<Received> drain(Messenger& messenger) {
    std::vector<Received> out;
    auto dispatch = [&](const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
        out.push_back({target, header, {payload.begin(), payload.end()}});
        return payload.size();
    };
    while (messenger.read(dispatch) > 0) {
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Connection
// =============================================================================

TEST_CASE("Messenger connection", "[ipc][messenger]") {
    SECTION("slave fails before the master exists") {
        Messenger slave;
        auto result = slave.connect_as_slave(unique_name("in"), unique_name("out"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        REQUIRE_FALSE(slave.is_connected());
    }

    SECTION("pair connects") {
        Pair pair;
        REQUIRE(pair.master.is_connected());
        REQUIRE(pair.master.is_master());
        REQUIRE(pair.slave.is_connected());
        REQUIRE_FALSE(pair.slave.is_master());
        REQUIRE(pair.slave.node_size() == 256);
    }

    SECTION("close keeps the queue") {
        Pair pair;
        pair.slave.queue(RpcRequest::Connect, "x", Counter{1});
        pair.slave.close();
        REQUIRE_FALSE(pair.slave.is_connected());
        REQUIRE(pair.slave.queued_count() == 1);
        REQUIRE(pair.slave.process_outbound_queue() == 0);
    }
}

// =============================================================================
// Queue Coalescing
// =============================================================================

TEST_CASE("Messenger replace_or_queue coalesces by slot", "[ipc][messenger]") {
    Messenger messenger;

    SECTION("Connect then two state updates leave two messages") {
        messenger.queue(RpcRequest::Connect, "Coherence", Counter{1});
        REQUIRE_FALSE(messenger.replace_or_queue(RpcRequest::UpdateState, "Coherence", Counter{2}));
        REQUIRE(messenger.replace_or_queue(RpcRequest::UpdateState, "Coherence", Counter{3}));

        REQUIRE(messenger.queued_count() == 2);
        const auto& last = messenger.queued_messages().back();
        REQUIRE(last.header.type == RpcRequest::UpdateState);

        Counter payload{};
        std::memcpy(&payload, last.payload.data(), sizeof(payload));
        REQUIRE(payload.value == 3);
    }

    SECTION("replacement keeps the original position") {
        messenger.queue(RpcRequest::UpdateObject, "Cube", Counter{1});
        messenger.queue(RpcRequest::UpdateObject, "Sphere", Counter{1});
        messenger.replace_or_queue(RpcRequest::UpdateObject, "Cube", Counter{9});

        REQUIRE(messenger.queued_count() == 2);
        REQUIRE(messenger.queued_messages().front().target == "Cube");
    }

    SECTION("different targets or types are separate slots") {
        messenger.replace_or_queue(RpcRequest::UpdateObject, "Cube", Counter{1});
        messenger.replace_or_queue(RpcRequest::UpdateObject, "Sphere", Counter{1});
        messenger.replace_or_queue(RpcRequest::AddObject, "Cube", Counter{1});
        REQUIRE(messenger.queued_count() == 3);
    }

    SECTION("requeue moves the slot to the back") {
        messenger.queue(RpcRequest::UpdateMesh, "Cube", Counter{1});
        messenger.queue(RpcRequest::UpdateObject, "Cube", Counter{1});
        messenger.requeue(RpcRequest::UpdateMesh, "Cube", Counter{2});

        REQUIRE(messenger.queued_count() == 2);
        REQUIRE(messenger.queued_messages().back().header.type == RpcRequest::UpdateMesh);
    }

    SECTION("clear_queue drops everything") {
        messenger.queue_signal(RpcRequest::Disconnect, "");
        messenger.clear_queue();
        REQUIRE(messenger.queued_count() == 0);
    }
}

// =============================================================================
// Arrays
// =============================================================================

TEST_CASE("Messenger arrays", "[ipc][messenger]") {
    Pair pair(8, 128);
    std::vector<std::int32_t> ids{1, 2, 3};

    SECTION("contents are copied at write time") {
        pair.slave.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #1", ids);
        ids.push_back(4);

        REQUIRE(pair.slave.process_outbound_queue() == 1);
        auto received = drain(pair.master);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0].header.count == 4);
        REQUIRE(received[0].header.index == 0);
        REQUIRE(received[0].payload.size() == 4 * sizeof(std::int32_t));
    }

    SECTION("same slot is queued once") {
        pair.slave.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #1", ids);
        pair.slave.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #1", ids);
        REQUIRE(pair.slave.queued_count() == 1);
    }

    SECTION("oversized arrays are rejected when queued") {
        std::vector<std::int32_t> big(64);
        try {
            pair.slave.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #1", big);
            FAIL("expected PayloadTooLarge");
        } catch (const ErrorException& e) {
            REQUIRE(e.code() == ErrorCode::CapacityExceeded);
        }
        REQUIRE(pair.slave.queued_count() == 0);
    }

    SECTION("arrays need a connection") {
        Messenger offline;
        REQUIRE_THROWS_AS(offline.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #1", ids), ErrorException);
    }

    SECTION("array that grew past the node size is dropped at send time") {
        pair.slave.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #1", ids);
        pair.slave.queue(RpcRequest::UpdateState, "x", Counter{5});
        ids.resize(64);

        REQUIRE(pair.slave.process_outbound_queue() == 1);
        auto received = drain(pair.master);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0].header.type == RpcRequest::UpdateState);
    }

    SECTION("discard_queued drops only arrays for the target") {
        pair.slave.queue(RpcRequest::RemoveViewport, "Viewport #1", Counter{1});
        pair.slave.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #1", ids);
        pair.slave.queue_array(RpcRequest::UpdateVisibleObjects, "Viewport #2", ids);

        REQUIRE(pair.slave.discard_queued("Viewport #1") == 1);
        REQUIRE(pair.slave.queued_count() == 2);
    }

    SECTION("send_array skips empty arrays") {
        std::vector<std::int32_t> empty;
        REQUIRE_FALSE(send_array(pair.slave, RpcRequest::UpdateVisibleObjects, "Viewport #1", empty));
        REQUIRE(send_array(pair.slave, RpcRequest::UpdateVisibleObjects, "Viewport #1", ids));
        REQUIRE(pair.slave.queued_count() == 1);
    }
}

// =============================================================================
// Transfer
// =============================================================================

TEST_CASE("Messenger keeps FIFO order under backpressure", "[ipc][messenger]") {
    Pair pair(2, 64);

    for (std::int32_t i = 0; i < 5; ++i) {
        pair.slave.queue(RpcRequest::UpdateObject, "obj" + std::to_string(i), Counter{i});
    }

    std::vector<std::int32_t> order;
    for (int round = 0; round < 5 && order.size() < 5; ++round) {
        pair.slave.process_outbound_queue(std::chrono::milliseconds(1));
        for (const auto& msg : drain(pair.master)) {
            order.push_back(msg.as<Counter>().value);
        }
    }

    REQUIRE(order == std::vector<std::int32_t>{0, 1, 2, 3, 4});
    REQUIRE(pair.slave.queued_count() == 0);
    REQUIRE(pair.slave.messages_written() == 5);
    REQUIRE(pair.master.messages_read() == 5);
}

TEST_CASE("Messenger round trip", "[ipc][messenger]") {
    Pair pair;

    pair.master.queue(RpcRequest::UpdateState, "Coherence", Counter{42});
    pair.master.queue_signal(RpcRequest::Disconnect, "");
    REQUIRE(pair.master.process_outbound_queue() == 2);

    auto received = drain(pair.slave);
    REQUIRE(received.size() == 2);
    REQUIRE(received[0].target == "Coherence");
    REQUIRE(received[0].header.type == RpcRequest::UpdateState);
    REQUIRE(received[0].as<Counter>().value == 42);

    Counter decoded{};
    REQUIRE(read_value(received[0].payload, decoded));
    REQUIRE(decoded.value == 42);

    REQUIRE(received[1].header.type == RpcRequest::Disconnect);
    REQUIRE(received[1].payload.empty());
    REQUIRE_FALSE(read_value(received[1].payload, decoded));
}

TEST_CASE("Messenger write_disconnect bypasses the queue", "[ipc][messenger]") {
    Pair pair;
    pair.slave.queue(RpcRequest::UpdateState, "x", Counter{1});

    REQUIRE(pair.slave.write_disconnect(std::chrono::milliseconds(10)));
    REQUIRE(pair.slave.queued_count() == 1);

    auto received = drain(pair.master);
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].header.type == RpcRequest::Disconnect);
}

TEST_CASE("Messenger framing errors", "[ipc][messenger]") {
    Pair pair;
    // Attach a raw writer to the ring the master reads from
    auto raw = RingBuffer::open(pair.a).value();

    auto write_raw = [&](std::int32_t target_len, const std::string& target, std::uint8_t type) {
        return raw->write([&](std::span<std::byte> node) -> std::size_t {
            std::size_t offset = 0;
            std::memcpy(node.data(), &target_len, sizeof(target_len));
            offset += sizeof(target_len);
            std::memcpy(node.data() + offset, target.data(), target.size());
            offset += target.size();
            const std::uint8_t header[9] = {type, 0, 0, 0, 0, 0, 0, 0, 0};
            std::memcpy(node.data() + offset, header, sizeof(header));
            return offset + sizeof(header);
        }, std::chrono::milliseconds(0));
    };

    int dispatched = 0;
    auto dispatch = [&](const std::string&, const MessageHeader&, std::span<const std::byte>) {
        ++dispatched;
        return std::size_t{0};
    };

    SECTION("unknown message types are skipped") {
        REQUIRE(write_raw(3, "abc", 200) > 0);
        REQUIRE(pair.master.read(dispatch) > 0);
        REQUIRE(dispatched == 0);
    }

    SECTION("bad target length is a desync") {
        REQUIRE(write_raw(100000, "abc", static_cast<std::uint8_t>(RpcRequest::UpdateState)) > 0);
        try {
            pair.master.read(dispatch);
            FAIL("expected FrameDesync");
        } catch (const ErrorException& e) {
            REQUIRE(e.code() == ErrorCode::ProtocolError);
        }
        REQUIRE(dispatched == 0);
    }

    SECTION("known types reach the dispatcher") {
        REQUIRE(write_raw(3, "abc", static_cast<std::uint8_t>(RpcRequest::UpdateState)) > 0);
        REQUIRE(pair.master.read(dispatch) > 0);
        REQUIRE(dispatched == 1);
    }
}
