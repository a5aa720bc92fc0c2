#include "call-scope.h"
#include "test-host.h"

#include <catch2/catch.hpp>

#include <string>

using nix_wasm::CallScope;
using nix_wasm::resetCallArena;

// Copy function over a fixed string, following the host's copy convention
struct FakeSource {
    std::string data;
    size_t calls = 0;
    size_t extraOnSecondCall = 0;

    size_t operator()(char *ptr, size_t maxLength) {
        ++calls;
        size_t length = data.size() + (calls == 2 ? extraOnSecondCall : 0);
        if (ptr && maxLength >= length) data.copy(ptr, data.size());
        return length;
    }
};

TEST_CASE("Stack probe copies small data with one call", "[call-scope]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    FakeSource source{"hello"};
    auto result = scope.stackProbeCopy<char, 16>(source);
    CHECK(source.calls == 1);
    CHECK(nix_wasm::toStringView(result) == "hello");
    CHECK(scope.arena.owns(result));
}

TEST_CASE("Stack probe falls back to the arena", "[call-scope]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    FakeSource source{std::string(100, 'x')};
    auto result = scope.stackProbeCopy<char, 16>(source);
    CHECK(source.calls == 2);
    CHECK(result.length == 100);
    CHECK(nix_wasm::toStringView(result) == source.data);
    CHECK(scope.arena.owns(result));
}

TEST_CASE("Empty results don't allocate", "[call-scope]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    FakeSource source{""};
    auto probed = scope.probeThenCopy<char>(source);
    CHECK(probed.length == 0);
    CHECK(source.calls == 1);

    auto stacked = scope.stackProbeCopy<char, 8>(source);
    CHECK(stacked.length == 0);
    CHECK(scope.arena.empty());
}

TEST_CASE("Probe then copy asks for the length first", "[call-scope]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    FakeSource source{"some text"};
    auto result = scope.probeThenCopy<char>(source);
    CHECK(source.calls == 2);
    CHECK(nix_wasm::toStringView(result) == "some text");
}

TEST_CASE("Changing lengths between calls are fatal", "[call-scope]") {
    TestHost testHost;

    SECTION("probe then copy") {
        CallScope scope{testHost.host, resetCallArena()};
        FakeSource source{"abc", 0, 1};
        CHECK_THROWS_AS(scope.probeThenCopy<char>(source), HostPanic);
    }
    SECTION("stack probe fallback") {
        CallScope scope{testHost.host, resetCallArena()};
        FakeSource source{std::string(40, 'y'), 0, 3};
        CHECK_THROWS_AS((scope.stackProbeCopy<char, 8>(source)), HostPanic);
    }
    REQUIRE(testHost.panics.size() == 1);
    CHECK(testHost.panics[0] == "length mismatch");
}

TEST_CASE("Arena exhaustion is fatal", "[call-scope]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    CHECK(scope.makeArrayOrPanic<char>(0).ptr == nullptr);
    CHECK_THROWS_AS(scope.makeArrayOrPanic<char>(nix_wasm::config::arenaBytes + 1), HostPanic);
    REQUIRE(testHost.panics.size() == 1);
    CHECK(testHost.panics[0] == "out of memory");
}

TEST_CASE("Formatted messages", "[call-scope]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};

    scope.warnf("%d items in %s", 3, "list");
    REQUIRE(testHost.warnings.size() == 1);
    CHECK(testHost.warnings[0] == "3 items in list");

    CHECK_THROWS_AS(scope.fatalf("bad value: %zu", size_t(42)), HostPanic);
    CHECK(testHost.panics.back() == "bad value: 42");

    // Long messages are cut short rather than overflowing
    std::string longMessage(1000, 'm');
    scope.warn(longMessage);
    CHECK(testHost.warnings.back().size() == nix_wasm::config::maxMessageLength);
    CHECK_THROWS_AS(scope.fatalf("%s", longMessage.c_str()), HostPanic);
    CHECK(testHost.panics.back().size() == nix_wasm::config::maxMessageLength);
}

TEST_CASE("Scope resets the arena on exit", "[call-scope]") {
    TestHost testHost;
    auto &arena = resetCallArena();
    {
        CallScope scope{testHost.host, arena};
        scope.makeArrayOrPanic<char>(100);
        CHECK(arena.used() >= 100);
    }
    CHECK(arena.empty());

    // Also when the call ends with a panic
    try {
        CallScope scope{testHost.host, arena};
        scope.makeArrayOrPanic<char>(100);
        scope.fatal("stop");
    } catch (const HostPanic &) {}
    CHECK(arena.empty());
}

TEST_CASE("Nested calls are rejected", "[call-scope]") {
    TestHost testHost;
    CallScope outer{testHost.host, resetCallArena()};
    CHECK_THROWS_AS((CallScope{testHost.host, outer.arena}), HostPanic);
    REQUIRE(testHost.panics.size() == 1);
    CHECK(testHost.panics[0] == "re-entrant call into the WASM module");

    // The outer scope is still usable
    CHECK(outer.makeArrayOrPanic<char>(4).length == 4);
}

TEST_CASE("Long messages aren't cut inside a UTF-8 character", "[call-scope]") {
    TestHost testHost;
    CallScope scope{testHost.host, resetCallArena()};
    size_t limit = nix_wasm::config::maxMessageLength;

    // A two-byte character straddling the limit is dropped whole
    std::string straddling = std::string(limit - 1, 'a') + "\xc3\xa9" + "tail";
    scope.warn(straddling);
    CHECK(testHost.warnings.back() == std::string(limit - 1, 'a'));

    // Same for a four-byte one, through the formatted path
    std::string emoji = std::string(limit - 2, 'b') + "\xf0\x9f\x98\x80";
    CHECK_THROWS_AS(scope.fatalf("%s", emoji.c_str()), HostPanic);
    CHECK(testHost.panics.back() == std::string(limit - 2, 'b'));

    // A character which ends exactly at the limit is kept
    std::string fits = std::string(limit - 2, 'c') + "\xc3\xa9" + "more";
    CHECK_THROWS_AS(scope.fatal(fits), HostPanic);
    CHECK(testHost.panics.back() == fits.substr(0, limit));
}
