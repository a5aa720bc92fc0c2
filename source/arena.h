#pragma once

#include "./config.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace nix_wasm {

// Pointer + length view into memory we don't own (usually the arena)
template<class T>
struct Slice {
	T *ptr = nullptr;
	size_t length = 0;

	Slice() {}
	Slice(T *ptr, size_t length) : ptr(ptr), length(length) {}
	// Slice<T> -> Slice<const T>
	template<class U, class=typename std::enable_if<std::is_convertible<U *, T *>::value>::type>
	Slice(const Slice<U> &other) : ptr(other.ptr), length(other.length) {}

	size_t size() const {
		return length;
	}
	bool empty() const {
		return length == 0;
	}
	T & operator[](size_t index) const {
		return ptr[index];
	}
	T * begin() const {
		return ptr;
	}
	T * end() const {
		return ptr + length;
	}
	Slice prefix(size_t n) const {
		return {ptr, n < length ? n : length};
	}
};

inline std::string_view toStringView(Slice<char> chars) {
	return {chars.ptr, chars.length};
}
inline std::string_view toStringView(Slice<const char> chars) {
	return {chars.ptr, chars.length};
}

/* Bump-pointer region over a caller-supplied block of memory.

	Individual allocations are never freed - the whole region is released with `deallocateAll()`.  The storage isn't owned, so the same block can be re-bound with `initialize()` at the start of each call.
*/
template<size_t minAlign=config::arenaAlign>
struct Region {
	static_assert(minAlign > 0 && (minAlign&(minAlign - 1)) == 0, "minAlign must be a positive power of two");
	static constexpr size_t alignment = minAlign;

	Region() {}
	Region(unsigned char *store, size_t size) {
		initialize(store, size);
	}
	// It's a unique handle onto the memory
	Region(const Region &other) = delete;
	Region & operator=(const Region &other) = delete;

	void initialize(unsigned char *store, size_t size) {
		base = store;
		cap = size;
		offset = 0;
	}
	void initialize(Slice<unsigned char> store) {
		initialize(store.ptr, store.length);
	}

	// Returns exactly `n` bytes, or a null slice if there isn't room
	Slice<unsigned char> allocate(size_t n) {
		if (n == 0) return {base, 0};
		// Align the address rather than the offset, in case `base` isn't aligned
		size_t start = size_t(base) + offset;
		size_t alignedOffset = ((start + (minAlign - 1))&~size_t(minAlign - 1)) - size_t(base);
		if (alignedOffset > cap || n > cap - alignedOffset) return {};

		Slice<unsigned char> result{base + alignedOffset, n};
		offset = alignedOffset + n;
		return result;
	}

	bool deallocateAll() {
		offset = 0;
		return true;
	}

	// Rolls the region back to where it was when this was created
	struct ScopedReset {
		ScopedReset(Region &region, size_t pos) : region(region), pos(pos) {}
		ScopedReset(ScopedReset &&other) : region(other.region), pos(other.pos) {
			other.active = false;
		}
		ScopedReset(const ScopedReset &other) = delete;
		~ScopedReset() {
			// Already released further than this (e.g. by `deallocateAll()`)
			if (active && pos <= region.offset) region.offset = pos;
		}
	private:
		Region &region;
		size_t pos;
		bool active = true;
	};
	// Everything allocated while this is alive is released when it goes out of scope
	ScopedReset scopedReset() {
		return {*this, offset};
	}

	bool owns(const void *ptr, size_t length) const {
		auto *p = (const unsigned char *)ptr;
		if (!p || !base) return false;
		return p >= base && p <= base + cap && length <= size_t(base + cap - p);
	}
	template<class T>
	bool owns(Slice<T> slice) const {
		return owns(slice.ptr, slice.length*sizeof(T));
	}

	bool empty() const {
		return offset == 0;
	}
	size_t available() const {
		return cap - offset;
	}
	size_t capacity() const {
		return cap;
	}
	size_t used() const {
		return offset;
	}

	// Empty (null) result for `length == 0`, without touching the region
	template<class T>
	Slice<T> makeArray(size_t length) {
		static_assert(std::is_trivially_copyable<T>::value && std::is_trivially_destructible<T>::value, "arena memory is never destructed");
		if (length == 0) return {};
		if (length > SIZE_MAX/sizeof(T)) return {};
		auto bytes = allocate(length*sizeof(T));
		if (!bytes.ptr) return {};
		return {(T *)bytes.ptr, length};
	}

	Slice<unsigned char> makeOpaqueArray(size_t n) {
		return makeArray<unsigned char>(n);
	}

private:
	unsigned char *base = nullptr;
	size_t cap = 0;
	size_t offset = 0;
};

using Arena = Region<config::arenaAlign>;

// Re-binds the process-wide call arena to its static storage and returns it.  Only one exported call may be active at a time.
Arena & resetCallArena();

} // namespace
