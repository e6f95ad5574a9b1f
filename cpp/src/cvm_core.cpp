// src/cvm_core.cpp
#include "cvm/cvm.hpp"
#include "cvm/errors.hpp"
#include "cvm/parse.hpp"

#include <chrono>
#include <cstdint>
#include <gmp.h>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}
} // namespace

namespace cvm {

std::string engine_info() {
  return std::string("gmp:") + (::gmp_version ? ::gmp_version : "?") + "; " +
         compiler_info();
}

Binding parse_binding(std::string_view in) {
  std::size_t eq = in.find('=');
  if (eq == std::string_view::npos)
    throw ParseError("expected rN=<value>, got " + text::near(in));
  return {Register::from_string(in.substr(0, eq)),
          Value::parse(in.substr(eq + 1))};
}

bool set_log_level(std::string_view name) {
  auto level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to off.
  if (level == spdlog::level::off && name != "off")
    return false;
  spdlog::set_level(level);
  return true;
}

RunResult run(const Program &program, const std::vector<Binding> &inputs,
              const RunConfig &cfg, TraceCb cb) {
  RunResult out;
  const std::uint32_t stride = cfg.trace_stride != 0 ? cfg.trace_stride : 1;

  auto t0 = std::chrono::steady_clock::now();

  for (const Binding &b : inputs)
    out.registers.assign(b.first, b.second);

  const auto &instructions = program.instructions();
  for (std::uint32_t i = 0; i < instructions.size(); ++i) {
    const Instruction &ins = instructions[i];
    ins.evaluate(out.registers);
    ++out.instructions;

    if (cb && cfg.enable_trace &&
        ((i + 1) % stride == 0 || i + 1 == instructions.size()))
      cb(i, ins, out.registers.load(ins.destination()));
  }

  auto t1 = std::chrono::steady_clock::now();
  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
  out.engine_info = engine_info();

  spdlog::debug("ran {} instruction(s) in {} ns", out.instructions,
                out.ns_elapsed);
  return out;
}

} // namespace cvm
