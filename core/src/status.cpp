#include "batchkin/core/common/status.hpp"

namespace batchkin::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::Precondition: return "Precondition";
    case Status::ShapeMismatch: return "ShapeMismatch";
    case Status::NonFinite: return "NonFinite";
    case Status::Construction: return "Construction";
  }
  return "Unknown";
}

}  // namespace batchkin::core
