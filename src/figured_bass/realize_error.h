// Error taxonomy for realization requests.

#ifndef FIGBASS_FIGURED_BASS_REALIZE_ERROR_H
#define FIGBASS_FIGURED_BASS_REALIZE_ERROR_H

#include <cstdint>
#include <string>

namespace figbass {

/// Kind of failure reported by the chain builder and its queries.
enum class RealizeErrorKind : uint8_t {
  None,
  InputError,              ///< Malformed figure, pitch, voice list or bass line.
  SlotInfeasible,          ///< One slot admits zero realizations.
  ChainInfeasible,         ///< Pruning emptied the first slot.
  QueryOnUnbuiltChain,     ///< Query or build step before its prerequisite.
  RealizationCapExceeded,  ///< A slot exceeded Rules::max_realizations_per_slot.
  CountOverflow            ///< Progression count does not fit 64 bits.
};

/// @brief Convert RealizeErrorKind to a string such as "SlotInfeasible".
const char* realizeErrorKindToString(RealizeErrorKind kind);

/// @brief A reported failure with the slot it concerns.
struct RealizeError {
  RealizeErrorKind kind = RealizeErrorKind::None;
  int slot_index = -1;  ///< Slot the error concerns, -1 if none.
  std::string message;

  /// @brief True if this holds an error.
  bool isError() const { return kind != RealizeErrorKind::None; }

  /// @brief "Kind (slot N): message".
  std::string toString() const;
};

/// @brief Build an error value.
RealizeError makeRealizeError(RealizeErrorKind kind, int slot_index, const std::string& message);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_REALIZE_ERROR_H
