/**
 * In-process evaluator for testing nix-wasm natively
 *
 * Implements `nix_wasm_host` over a simple value table.  Attribute sets are kept sorted by name (like Nix), panics are thrown as `HostPanic`.
 */

#pragma once

#include "nix-wasm.h"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct HostPanic : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TestHost {
    using Function = std::function<nix_value_id(TestHost &, const std::vector<nix_value_id> &)>;

    struct Entry {
        nix_type type = NIX_TYPE_NULL;
        int64_t integer = 0;
        double number = 0.0;
        bool boolean = false;
        std::string text; // strings and paths
        std::vector<nix_value_id> items; // list items, or the arguments of an unforced application
        std::vector<std::pair<std::string, nix_value_id>> attrs;
        size_t function = 0;
        // Non-zero until a lazy application is forced
        nix_value_id appFunction = 0;
    };

    nix_wasm_host host;

    std::vector<Entry> values;
    std::vector<Function> functions;
    std::map<std::string, std::string> files;

    std::vector<std::string> warnings;
    std::vector<std::string> panics;
    size_t copyCalls = 0;
    size_t forcedApps = 0;
    // 1-based index of a copy_*()/read_file() call which reports one byte more than it has (0 = never)
    size_t lieOnCopyCall = 0;

    TestHost();
    ~TestHost();
    TestHost(const TestHost &other) = delete;
    TestHost & operator=(const TestHost &other) = delete;

    //---------- Building values directly ----------

    nix_value_id integer(int64_t n);
    nix_value_id number(double f);
    nix_value_id boolean(bool b);
    nix_value_id null();
    nix_value_id string(std::string_view s);
    nix_value_id path(std::string_view p);
    nix_value_id list(std::vector<nix_value_id> items);
    // Later duplicates win
    nix_value_id attrs(std::vector<std::pair<std::string, nix_value_id>> attrs);
    nix_value_id function(Function fn);

    //---------- Inspecting values ----------

    // Forces lazy applications
    const Entry & get(nix_value_id id);
    // Nix-style rendering, e.g. `{ x = [ 1 2 3 ]; y = null; }`
    std::string show(nix_value_id id);
    bool equal(nix_value_id a, nix_value_id b);

private:
    nix_value_id add(Entry entry);
    size_t reportCopy(size_t length);
};
