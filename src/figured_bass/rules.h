// Rule configuration for figured-bass realization.

#ifndef FIGBASS_FIGURED_BASS_RULES_H
#define FIGBASS_FIGURED_BASS_RULES_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace figbass {

class JsonWriter;

/// @brief Maximum melodic interval for one voice between consecutive slots.
struct PartMovementLimit {
  std::string label;
  int max_semitones = 12;
};

/// @brief Options governing which realizations and movements are legal.
///
/// A chain copies its Rules at build time, so every slot and movement check
/// of one request sees the same snapshot.
struct Rules {
  // --- Single realization rules ---
  bool forbid_incomplete_possibilities = true;
  std::vector<int> omittable_figures;  ///< Figure numbers exempt from completeness.
  std::optional<int> upper_parts_max_semitone_separation = 12;
  bool forbid_voice_crossing = true;
  bool forbid_unisons = false;
  bool forbid_doubled_raised_tones = true;

  // --- Consecutive realization rules ---
  bool forbid_parallel_fifths = true;
  bool forbid_parallel_octaves = true;
  bool forbid_hidden_fifths = true;
  bool forbid_hidden_octaves = true;
  bool forbid_voice_overlap = true;
  std::vector<PartMovementLimit> part_movement_limits;

  // --- Special resolutions ---
  bool resolve_dominant_seventh_properly = true;
  bool resolve_diminished_seventh_properly = true;
  bool resolve_augmented_sixth_properly = true;
  bool doubled_root_in_dim7 = false;
  bool dim7_doubling_from_context = true;
  bool apply_consecutive_rules_to_resolution = false;
  bool restrict_doublings_in_italian_a6_resolution = true;

  // --- Resource bound ---
  size_t max_realizations_per_slot = 100000;

  /// @brief Movement limit for a voice label, or -1 if unrestricted.
  int maxLeapFor(const std::string& label) const;

  /// @brief True if the figure number may be left out of a realization.
  bool isOmittable(int figure_number) const;
};

/// @brief Read rules from a flat JSON object, starting from the defaults.
///
/// Keys are the Rules field names; "omittable_figures" is a comma list
/// string ("5" or "5,3"); "max_leap_<label>" sets a part movement limit;
/// "upper_parts_max_semitone_separation" accepts null to disable.
///
/// @param json JSON text.
/// @param out Parsed rules, written only on success.
/// @param error If non-null, receives a message naming the bad key.
/// @return False on malformed JSON, unknown keys or wrong value types.
bool rulesFromJson(const std::string& json, Rules& out, std::string* error = nullptr);

/// @brief Write the rules as a JSON object value.
void writeRulesJson(JsonWriter& writer, const Rules& rules);

/// @brief Serialize the rules as compact JSON (round-trips through rulesFromJson).
std::string rulesToJson(const Rules& rules);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_RULES_H
