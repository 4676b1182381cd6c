// Implementation of realization error helpers.

#include "figured_bass/realize_error.h"

namespace figbass {

const char* realizeErrorKindToString(RealizeErrorKind kind) {
  switch (kind) {
    case RealizeErrorKind::None:                   return "None";
    case RealizeErrorKind::InputError:             return "InputError";
    case RealizeErrorKind::SlotInfeasible:         return "SlotInfeasible";
    case RealizeErrorKind::ChainInfeasible:        return "ChainInfeasible";
    case RealizeErrorKind::QueryOnUnbuiltChain:    return "QueryOnUnbuiltChain";
    case RealizeErrorKind::RealizationCapExceeded: return "RealizationCapExceeded";
    case RealizeErrorKind::CountOverflow:          return "CountOverflow";
  }
  return "None";
}

std::string RealizeError::toString() const {
  std::string result = realizeErrorKindToString(kind);
  if (slot_index >= 0) result += " (slot " + std::to_string(slot_index) + ")";
  if (!message.empty()) result += ": " + message;
  return result;
}

RealizeError makeRealizeError(RealizeErrorKind kind, int slot_index, const std::string& message) {
  RealizeError error;
  error.kind = kind;
  error.slot_index = slot_index;
  error.message = message;
  return error;
}

}  // namespace figbass
