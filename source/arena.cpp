#include "./arena.h"

namespace nix_wasm {

Arena & resetCallArena() {
	alignas(Arena::alignment) static unsigned char storage[config::arenaBytes];
	static Arena arena;
	arena.initialize(storage, sizeof(storage));
	return arena;
}

} // namespace
