#include "./growable-buffer.h"

#include <cstring>

namespace nix_wasm {

GrowableBuffer::GrowableBuffer(CallScope &scope, size_t initialCapacity) : scope(scope) {
	if (initialCapacity == 0) initialCapacity = 1;
	buffer = scope.makeArrayOrPanic<unsigned char>(initialCapacity);
	capacity = initialCapacity;
}

void GrowableBuffer::writeRaw(std::string_view bytes) {
	if (bytes.empty()) return;
	if (bytes.size() > capacity - length) grow(length + bytes.size());
	std::memcpy(buffer.ptr + length, bytes.data(), bytes.size());
	length += bytes.size();
}

void GrowableBuffer::grow(size_t needed) {
	size_t newCapacity = capacity*2;
	if (newCapacity < needed) newCapacity = needed;
	auto newBuffer = scope.makeArrayOrPanic<unsigned char>(newCapacity);
	if (length) std::memcpy(newBuffer.ptr, buffer.ptr, length);
	buffer = newBuffer;
	capacity = newCapacity;
}

} // namespace
