#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "cvm/cvm.hpp"
#include "cvm/errors.hpp"

namespace py = pybind11;

static std::string hash_py(const std::string& value, int rate) {
  if (rate != 2 && rate != 4 && rate != 8)
    throw std::invalid_argument("rate must be 2, 4 or 8");
  auto program = cvm::Program::parse("hash.psd" + std::to_string(rate) + " r0 into r1;");
  auto res = cvm::run(program, {{cvm::Register(0), cvm::Value::parse(value)}});
  return res.registers.load(cvm::Register(1)).to_string();
}

static std::map<std::string, std::string> run_py(const std::string& program_text,
                       const std::map<std::string, std::string>& inputs) {
  auto program = cvm::Program::parse(program_text);

  std::vector<cvm::Binding> bindings;
  for (const auto& kv : inputs)
    bindings.emplace_back(cvm::Register::from_string(kv.first), cvm::Value::parse(kv.second));

  // Release the GIL for the evaluation itself.
  cvm::RunResult res;
  {
    py::gil_scoped_release nogil;
    res = cvm::run(program, bindings);
  }

  std::map<std::string, std::string> registers;
  for (const auto& [locator, value] : res.registers.entries())
    registers.emplace(cvm::Register(locator).to_string(), value.to_string());
  return registers;
}

static py::bytes encode_py(const std::string& program_text) {
  auto bytes = cvm::Program::parse(program_text).to_bytes();
  return py::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

static std::string decode_py(const py::bytes& data) {
  std::string raw = data;
  std::vector<std::uint8_t> bytes(raw.begin(), raw.end());
  return cvm::Program::from_bytes(bytes).to_string();
}

PYBIND11_MODULE(cvmcore, m) {
  m.doc() = "Register VM hash instructions (pybind11)";

  // Parse and decode failures are ValueError; halts are RuntimeError.
  py::register_exception<cvm::ParseError>(m, "ParseError", PyExc_ValueError);
  py::register_exception<cvm::DecodeError>(m, "DecodeError", PyExc_ValueError);
  py::register_exception<cvm::Halt>(m, "Halt", PyExc_RuntimeError);

  m.def("hash", &hash_py, py::arg("value"), py::arg("rate") = 8,
        R"pbdoc(
Hash one value with hash.psd<rate>.

Args:
  value (str): literal or composite text, e.g. "1field" or "m { 1u8, 2u8.private }".
  rate (int): Poseidon input rate, 2, 4 or 8.

Returns:
  str: the digest literal, e.g. "3999...555field".
)pbdoc");

  m.def("run", &run_py, py::arg("program"), py::arg("inputs") = std::map<std::string, std::string>{},
        R"pbdoc(
Run a program. `inputs` maps register names ("r0") to value text.

Returns:
  dict[str, str]: every defined register ("r0", "r1", ...) to its value text.
)pbdoc");

  m.def("encode", &encode_py, py::arg("program"),
        R"pbdoc(Encode program text to its byte form.)pbdoc");
  m.def("decode", &decode_py, py::arg("data"),
        R"pbdoc(Decode program bytes back to text, one instruction per line.)pbdoc");

  m.attr("__version__") = cvm::CVM_VERSION;
}
