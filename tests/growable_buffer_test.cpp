#include "growable-buffer.h"
#include "test-host.h"

#include <catch2/catch.hpp>

#include <string>

using nix_wasm::CallScope;
using nix_wasm::GrowableBuffer;
using nix_wasm::resetCallArena;

TEST_CASE("Buffer starts with the default capacity", "[growable-buffer]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    GrowableBuffer buffer{scope};
    CHECK(buffer.size() == 0);
    CHECK(buffer.currentCapacity() == nix_wasm::config::bufferInitialBytes);
    CHECK(buffer.result().empty());
}

TEST_CASE("Appending bytes and strings", "[growable-buffer]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    GrowableBuffer buffer{scope};
    buffer.writeByte('[');
    buffer.writeRaw("1,2");
    buffer.writeRaw("");
    buffer.writeByte(']');
    CHECK(buffer.result() == "[1,2]");
    CHECK(scope.arena.owns(buffer.result().data(), buffer.size()));
}

TEST_CASE("Buffer doubles when full", "[growable-buffer]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    GrowableBuffer buffer{scope, 4};
    buffer.writeRaw("abcd");
    CHECK(buffer.currentCapacity() == 4);
    buffer.writeByte('e');
    CHECK(buffer.currentCapacity() == 8);
    CHECK(buffer.result() == "abcde");

    // A single large write jumps straight to what's needed
    std::string big(100, 'x');
    buffer.writeRaw(big);
    CHECK(buffer.currentCapacity() == 105);
    CHECK(buffer.result() == "abcde" + big);
}

TEST_CASE("Growth beyond the arena is fatal", "[growable-buffer]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    GrowableBuffer buffer{scope};
    std::string chunk(64*1024, 'c');
    CHECK_THROWS_AS([&]() {
        while (true) buffer.writeRaw(chunk);
    }(), HostPanic);
    REQUIRE(testHost.panics.size() == 1);
    CHECK(testHost.panics[0] == "out of memory");
}
