#pragma once
#include "model/Memory.hpp"

namespace ideguard::collectors {

class MemoryCollector {
public:
  bool sample(ideguard::model::Memory& out) const; // returns true on success
};

} // namespace ideguard::collectors
