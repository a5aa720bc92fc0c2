#pragma once

#include <cstddef>

#ifndef NIX_WASM_ARENA_BYTES
#	define NIX_WASM_ARENA_BYTES (1024*1024)
#endif

namespace nix_wasm { namespace config {

// Backing storage for the per-call arena
inline constexpr size_t arenaBytes = NIX_WASM_ARENA_BYTES;
inline constexpr size_t arenaAlign = 8;

// Stack buffers tried before falling back to the arena
inline constexpr size_t pathProbeBytes = 256;
inline constexpr size_t fileProbeBytes = 1024;
inline constexpr size_t listProbeCount = 64;
inline constexpr size_t attrsetProbeCount = 32;

inline constexpr size_t bufferInitialBytes = 4096;

// Fixed ceilings - exceeding them is a parse error, not a growth case
inline constexpr size_t jsonMaxArrayItems = 4096;
inline constexpr size_t jsonMaxObjectEntries = 4096;
// Containers collect their items in a block which doubles (up to the ceiling) as needed
inline constexpr size_t jsonInitialItems = 16;

// panic()/warn() messages are truncated to this
inline constexpr size_t maxMessageLength = 256;

}}; // namespace
