#pragma once

#include "nix-wasm.h"
#include "./arena.h"

#include <cstring>
#include <string_view>

#if defined(__GNUC__) || defined(__clang__)
#	define NIX_WASM_PRINTF_FORMAT(fmtIndex, argIndex) __attribute__((format(printf, fmtIndex, argIndex)))
#else
#	define NIX_WASM_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace nix_wasm {

/* Everything an exported call needs: the host it's talking to, and the arena for transient data.

	It's passed explicitly to every operation instead of living in globals.  Only one may be active at a time - the arena storage is shared between calls.
*/
struct CallScope {
	const nix_wasm_host &host;
	Arena &arena;

	CallScope(const nix_wasm_host &host, Arena &arena);
	~CallScope(); // resets the arena

	CallScope(const CallScope &other) = delete;
	CallScope & operator=(const CallScope &other) = delete;

	// Sends the message to the host's panic(), which ends the call.  Aborts if the host returns anyway.
	[[noreturn]] void fatal(std::string_view message);
	[[noreturn]] void fatalf(const char *format, ...) NIX_WASM_PRINTF_FORMAT(2, 3);

	void warn(std::string_view message);
	void warnf(const char *format, ...) NIX_WASM_PRINTF_FORMAT(2, 3);

	[[noreturn]] void lengthMismatch(size_t expected, size_t actual);

	template<class T>
	Slice<T> makeArrayOrPanic(size_t count) {
		if (count == 0) return {};
		auto result = arena.makeArray<T>(count);
		if (!result.ptr) fatal("out of memory");
		return result;
	}

	// Tries a fixed-size stack buffer first, and only allocates the exact size in the arena if the data didn't fit.
	// `copy(T *ptr, size_t maxLength)` returns the full length, and only copies if it fits.
	template<class T, size_t stackCount, class CopyFn>
	Slice<T> stackProbeCopy(CopyFn &&copy) {
		T stackBuffer[stackCount];
		size_t length = copy(stackBuffer, stackCount);
		if (length > stackCount) {
			auto result = makeArrayOrPanic<T>(length);
			size_t actual = copy(result.ptr, length);
			if (actual != length) lengthMismatch(length, actual);
			return result;
		}
		auto result = makeArrayOrPanic<T>(length);
		if (length) std::memcpy(result.ptr, stackBuffer, length*sizeof(T));
		return result;
	}

	// Zero-capacity length query, then one copy into an exactly-sized arena block
	template<class T, class CopyFn>
	Slice<T> probeThenCopy(CopyFn &&copy) {
		size_t length = copy((T *)nullptr, 0);
		auto result = makeArrayOrPanic<T>(length);
		if (length) {
			size_t actual = copy(result.ptr, length);
			if (actual != length) lengthMismatch(length, actual);
		}
		return result;
	}
};

} // namespace
