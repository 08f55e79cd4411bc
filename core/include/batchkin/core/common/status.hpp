#pragma once
#include <cstdint>

namespace batchkin::core {

// Error kinds reported by every public operation. Validation happens before any
// output is written, so a non-Success status never leaves partial results behind.
enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,           // I/O or parser failure
  InvalidParameter = 2,  // null output pointer, bad option
  Precondition = 3,      // empty batch, batch-size mismatch, column count != ndof
  ShapeMismatch = 4,     // wrong trailing shape of an input batch
  NonFinite = 5,         // NaN/Inf input or intermediate
  Construction = 6       // malformed or disconnected chain
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

const char* statusToString(Status s);

}  // namespace batchkin::core
