#include "nix-wasm.h"

#include "./arena.h"
#include "./call-scope.h"
#include "./value.h"
#include "./json/json.h"

#include <cstdlib>

#ifndef __wasm__
#	include <iostream>
#endif

#ifdef __wasm__
#	include "./wasm-env/env-host.hxx"
static const nix_wasm_host *currentHost = &nix_wasm::envHost;
#else
static const nix_wasm_host *currentHost = nullptr;
#endif

// Misconfigured embedding - there's no host to panic() to
[[noreturn]] static void configurationError(const char *message) {
#ifdef __wasm__
	(void)message;
#else
	std::cerr << message << std::endl;
#endif
	abort();
}

static bool hostIsComplete(const nix_wasm_host *host) {
	return host->get_type && host->make_int && host->get_int && host->make_float && host->get_float
		&& host->make_bool && host->get_bool && host->make_null
		&& host->make_string && host->copy_string && host->make_path && host->copy_path
		&& host->make_list && host->copy_list
		&& host->make_attrset && host->copy_attrset && host->copy_attrname && host->get_attr
		&& host->call_function && host->make_app && host->read_file
		&& host->panic && host->warn;
}

void nix_wasm_set_host(const nix_wasm_host *host) {
	if (host && !hostIsComplete(host)) configurationError("nix_wasm_host is missing functions");
	currentHost = host;
}

const nix_wasm_host * nix_wasm_get_host() {
	return currentHost;
}

static const nix_wasm_host & requireHost() {
	if (!currentHost) configurationError("No host registered - did you call nix_wasm_set_host()?");
	return *currentHost;
}

void nix_wasm_init_v1() {
	nix_wasm::CallScope scope{requireHost(), nix_wasm::resetCallArena()};
	scope.warn("hello from nix-wasm");
	scope.warn("json wasm module");
}

nix_value_id fromJSON(nix_value_id arg) {
	using namespace nix_wasm;
	CallScope scope{requireHost(), resetCallArena()};

	Value input{arg};
	auto type = input.type(scope);
	if (type != Type::string) {
		auto *name = typeName(type);
		scope.fatalf("fromJSON: expected a string, got %s", name ? name : "an unknown type");
	}
	return json::decode(scope, input.getString(scope)).id;
}

nix_value_id toJSON(nix_value_id arg) {
	using namespace nix_wasm;
	CallScope scope{requireHost(), resetCallArena()};

	auto text = json::encode(scope, Value{arg});
	return Value::makeString(scope, text).id;
}
