#pragma once

#include "./arena.h"
#include "./call-scope.h"

#include <string_view>

namespace nix_wasm {

/* Append-only byte buffer in the arena, for output of unknown size.

	Growing allocates a new block (at least double the size) and copies across.  The old block is simply abandoned, since the arena can't reuse it.
*/
struct GrowableBuffer {
	explicit GrowableBuffer(CallScope &scope, size_t initialCapacity=config::bufferInitialBytes);

	void writeByte(unsigned char byte) {
		if (length >= capacity) grow(length + 1);
		buffer[length++] = byte;
	}
	void writeRaw(std::string_view bytes);

	// Valid until the arena is reset
	std::string_view result() const {
		return {(const char *)buffer.ptr, length};
	}
	size_t size() const {
		return length;
	}
	size_t currentCapacity() const {
		return capacity;
	}

private:
	CallScope &scope;
	Slice<unsigned char> buffer;
	size_t length = 0;
	size_t capacity = 0;

	void grow(size_t needed);
};

} // namespace
