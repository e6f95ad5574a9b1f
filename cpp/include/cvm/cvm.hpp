// include/cvm/cvm.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "program.hpp"
#include "registers.hpp"
#include "value.hpp"

namespace cvm {

// Bump when the byte encoding changes.
inline constexpr const char *CVM_VERSION = "0.1.0";

struct RunConfig {
  bool enable_trace = false;      // allow callbacks
  std::uint32_t trace_stride = 1; // call back every N instructions (0 = 1)
};

struct RunResult {
  Registers registers;
  std::uint64_t instructions = 0; // instructions evaluated
  std::uint64_t ns_elapsed = 0;   // wall-clock nanoseconds (best effort)
  std::string engine_info;        // e.g. "gmp:6.2.1; gcc:12.2.0"
};

// Trace callback: instruction index, the instruction, and the value it wrote.
using TraceCb =
    std::function<void(std::uint32_t, const Instruction &, const Value &)>;

using Binding = std::pair<Register, Value>;

// Parses "rN=<value>". Throws cvm::ParseError.
Binding parse_binding(std::string_view in);

// Binds `inputs`, then evaluates every instruction in order.
// A cvm::Halt from any step propagates unchanged; the run is over.
RunResult run(const Program &program, const std::vector<Binding> &inputs,
              const RunConfig &cfg = {}, TraceCb cb = {});

// GMP version and compiler, for logs and CLI output.
std::string engine_info();

// Sets the spdlog level from its name ("trace" ... "off"). Returns false and
// leaves the level alone when the name is unknown.
bool set_log_level(std::string_view name);

} // namespace cvm
