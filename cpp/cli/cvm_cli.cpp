#include "cvm/cvm.hpp"
#include "cvm/errors.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

int usage() {
  std::cerr << "usage: cvm_cli [--log-level=L] [--bench=N] [--trace] [--hex] [--binary]\n"
               "               <program-file> [rN=<value> ...]\n"
               "       cvm_cli --hash=psd2|psd4|psd8 <value>\n";
  return 2;
}

std::vector<std::uint8_t> read_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("cannot open '" + path + "'");
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(f), {});
}

std::string to_hex(const std::vector<std::uint8_t>& bytes) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[2 * i] = hex[(bytes[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[bytes[i] & 0xF];
  }
  return out;
}

int hash_one(const std::string& variant, const std::string& text) {
  if (variant != "psd2" && variant != "psd4" && variant != "psd8") {
    std::cerr << "unknown hash variant '" << variant << "'\n";
    return 2;
  }

  // Same path as a one-instruction program, so halts look identical.
  cvm::Program program = cvm::Program::parse("hash." + variant + " r0 into r1;");
  auto res = cvm::run(program, {{cvm::Register(0), cvm::Value::parse(text)}});
  std::cout << res.registers.load(cvm::Register(1)).to_string() << "\n";
  spdlog::debug("hash.{} engine={}", variant, res.engine_info);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  // Flags: --bench=N (repeat), --trace, --hex, --binary, --log-level=L, --hash=V
  unsigned repeats = 1;
  bool trace = false, print_hex = false, binary = false;
  std::string hash_variant, path;
  std::vector<std::string> bindings;

  spdlog::set_level(spdlog::level::warn);

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--bench=", 0) == 0) {
      try { repeats = std::stoul(a.substr(8)); } catch (const std::exception&) { return usage(); }
      if (repeats == 0) repeats = 1;
    } else if (a.rfind("--log-level=", 0) == 0) {
      if (!cvm::set_log_level(a.substr(12))) {
        std::cerr << "unknown log level '" << a.substr(12) << "'\n";
        return usage();
      }
    } else if (a.rfind("--hash=", 0) == 0) {
      hash_variant = a.substr(7);
    } else if (a == "--trace") {
      trace = true;
    } else if (a == "--hex") {
      print_hex = true;
    } else if (a == "--binary") {
      binary = true;
    } else if (a == "--version") {
      std::cout << "cvm " << cvm::CVM_VERSION << " (" << cvm::engine_info() << ")\n";
      return 0;
    } else if (a.rfind("--", 0) == 0) {
      std::cerr << "unknown flag '" << a << "'\n";
      return usage();
    } else if (path.empty() && hash_variant.empty()) {
      path = a;
    } else {
      bindings.push_back(a);
    }
  }

  try {
    if (!hash_variant.empty()) {
      if (bindings.size() != 1) return usage();
      return hash_one(hash_variant, bindings[0]);
    }
    if (path.empty()) return usage();

    auto bytes = read_file(path);
    cvm::Program program = binary
        ? cvm::Program::from_bytes(bytes)
        : cvm::Program::parse(std::string(bytes.begin(), bytes.end()));
    if (print_hex) std::cout << to_hex(program.to_bytes()) << "\n";

    std::vector<cvm::Binding> inputs;
    for (const auto& b : bindings) inputs.push_back(cvm::parse_binding(b));

    auto on_trace = [](std::uint32_t idx, const cvm::Instruction& ins, const cvm::Value& v) {
      std::cout << "  [" << idx << "] " << ins.to_string() << " => " << v.to_string() << "\n";
    };

    std::uint64_t best = UINT64_MAX, sum = 0;
    cvm::RunResult last;
    for (unsigned r = 0; r < repeats; ++r) {
      cvm::RunConfig cfg{trace && r == 0, 1};
      last = cvm::run(program, inputs, cfg, trace ? on_trace : cvm::TraceCb{});
      sum += last.ns_elapsed;
      if (last.ns_elapsed < best) best = last.ns_elapsed;
    }

    for (const auto& [locator, value] : last.registers.entries())
      std::cout << "r" << locator << " = " << value.to_string() << "\n";
    if (repeats > 1) {
      std::cout << "bench repeats=" << repeats << " | best(ns)=" << best
                << " | avg(ns)=" << (sum / repeats) << " | engine=" << last.engine_info << "\n";
    }
  } catch (const cvm::Halt& e) {
    std::cerr << "halted: " << e.what() << "\n";
    return 1;
  } catch (const cvm::ParseError& e) {
    std::cerr << "parse error: " << e.what() << "\n";
    return 1;
  } catch (const cvm::DecodeError& e) {
    std::cerr << "decode error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
