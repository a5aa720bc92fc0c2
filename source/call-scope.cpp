#ifndef LOG_EXPR
#	ifdef __wasm__
// No iostream inside the plugin
#		define LOG_EXPR(expr)
#	else
#		include <iostream>
#		define LOG_EXPR(expr) std::cout << #expr " = " << (expr) << std::endl;
#	endif
#endif

#include "./call-scope.h"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace nix_wasm {

// The arena is shared, so there can only be one
static CallScope *activeScope = nullptr;

// Cuts to `maxMessageLength` bytes, backing off so a UTF-8 sequence isn't split
static std::string_view truncateMessage(std::string_view message) {
	if (message.size() <= config::maxMessageLength) return message;
	size_t end = config::maxMessageLength;
	// Continuation bytes are 0b10xxxxxx
	while (end > 0 && (((unsigned char)message[end])&0xC0) == 0x80) --end;
	return message.substr(0, end);
}

CallScope::CallScope(const nix_wasm_host &host, Arena &arena) : host(host), arena(arena) {
	if (activeScope) {
		LOG_EXPR(activeScope);
		fatal("re-entrant call into the WASM module");
	}
	activeScope = this;
}

CallScope::~CallScope() {
	arena.deallocateAll();
	activeScope = nullptr;
}

void CallScope::fatal(std::string_view message) {
	message = truncateMessage(message);
	host.panic(&host, message.data(), message.size());
	// panic() is supposed to end the call
	LOG_EXPR(message);
	std::abort();
}

void CallScope::fatalf(const char *format, ...) {
	// Longer than the limit, so truncateMessage() can tell if the cut splits a character
	char buffer[config::maxMessageLength + 4];
	va_list args;
	va_start(args, format);
	int length = std::vsnprintf(buffer, sizeof(buffer), format, args);
	va_end(args);
	if (length < 0) fatal(format);
	fatal({buffer, std::strlen(buffer)});
}

void CallScope::warn(std::string_view message) {
	message = truncateMessage(message);
	host.warn(&host, message.data(), message.size());
}

void CallScope::warnf(const char *format, ...) {
	char buffer[config::maxMessageLength + 4];
	va_list args;
	va_start(args, format);
	int length = std::vsnprintf(buffer, sizeof(buffer), format, args);
	va_end(args);
	if (length < 0) {
		warn(format);
		return;
	}
	warn({buffer, std::strlen(buffer)});
}

void CallScope::lengthMismatch(size_t expected, size_t actual) {
	LOG_EXPR(expected);
	LOG_EXPR(actual);
	fatal("length mismatch");
}

} // namespace
