// src/errors.cpp
#include "cvm/errors.hpp"

#include <spdlog/spdlog.h>

namespace cvm {

void halt(const std::string &message) {
  spdlog::error("halt: {}", message);
  throw Halt(message);
}

} // namespace cvm
