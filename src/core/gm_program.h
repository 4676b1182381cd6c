// General MIDI program numbers for rendered realizations.

#ifndef FIGBASS_CORE_GM_PROGRAM_H
#define FIGBASS_CORE_GM_PROGRAM_H

#include <cstdint>

namespace figbass {

/// General MIDI program numbers (0-indexed as per MIDI specification).
namespace GmProgram {

constexpr uint8_t kHarpsichord = 6;    // Keyboard continuo
constexpr uint8_t kChoirAahs = 52;     // Chorale voices

}  // namespace GmProgram

}  // namespace figbass

#endif  // FIGBASS_CORE_GM_PROGRAM_H
