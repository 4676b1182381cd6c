// Implementation of rule configuration loading and serialization.

#include "figured_bass/rules.h"

#include <cstdlib>
#include <map>

#include "core/json_helpers.h"
#include "core/json_parser.h"

namespace figbass {

namespace {

constexpr const char* kMaxLeapPrefix = "max_leap_";

/// Boolean options addressable by JSON key.
struct BoolOption {
  const char* key;
  bool Rules::*field;
};

const BoolOption kBoolOptions[] = {
    {"forbid_incomplete_possibilities", &Rules::forbid_incomplete_possibilities},
    {"forbid_voice_crossing", &Rules::forbid_voice_crossing},
    {"forbid_unisons", &Rules::forbid_unisons},
    {"forbid_doubled_raised_tones", &Rules::forbid_doubled_raised_tones},
    {"forbid_parallel_fifths", &Rules::forbid_parallel_fifths},
    {"forbid_parallel_octaves", &Rules::forbid_parallel_octaves},
    {"forbid_hidden_fifths", &Rules::forbid_hidden_fifths},
    {"forbid_hidden_octaves", &Rules::forbid_hidden_octaves},
    {"forbid_voice_overlap", &Rules::forbid_voice_overlap},
    {"resolve_dominant_seventh_properly", &Rules::resolve_dominant_seventh_properly},
    {"resolve_diminished_seventh_properly", &Rules::resolve_diminished_seventh_properly},
    {"resolve_augmented_sixth_properly", &Rules::resolve_augmented_sixth_properly},
    {"doubled_root_in_dim7", &Rules::doubled_root_in_dim7},
    {"dim7_doubling_from_context", &Rules::dim7_doubling_from_context},
    {"apply_consecutive_rules_to_resolution", &Rules::apply_consecutive_rules_to_resolution},
    {"restrict_doublings_in_italian_a6_resolution",
     &Rules::restrict_doublings_in_italian_a6_resolution},
};

/// @brief Parse "5,3" into figure numbers.
bool parseNumberList(const std::string& text, std::vector<int>& out) {
  out.clear();
  if (text.empty()) return true;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) comma = text.size();
    std::string token = text.substr(start, comma - start);
    char* end = nullptr;
    long value = std::strtol(token.c_str(), &end, 10);
    if (token.empty() || *end != '\0' || value < 1 || value > 13) return false;
    out.push_back(static_cast<int>(value));
    start = comma + 1;
  }
  return true;
}

bool fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

}  // namespace

int Rules::maxLeapFor(const std::string& label) const {
  for (const auto& limit : part_movement_limits) {
    if (limit.label == label) return limit.max_semitones;
  }
  return -1;
}

bool Rules::isOmittable(int figure_number) const {
  for (int number : omittable_figures) {
    if (number == figure_number) return true;
  }
  return false;
}

bool rulesFromJson(const std::string& json, Rules& out, std::string* error) {
  std::map<std::string, JsonValue> values;
  std::string parse_error;
  if (!parseJsonObject(json.c_str(), json.size(), values, &parse_error)) {
    return fail(error, "rules JSON: " + parse_error);
  }

  Rules rules;
  for (const auto& [key, value] : values) {
    bool handled = false;
    for (const auto& option : kBoolOptions) {
      if (key != option.key) continue;
      if (value.type != JsonValue::Bool) return fail(error, "rules JSON: '" + key + "' must be a boolean");
      rules.*(option.field) = value.bool_val;
      handled = true;
    }
    if (handled) continue;

    if (key == "upper_parts_max_semitone_separation") {
      if (value.type == JsonValue::Null) {
        rules.upper_parts_max_semitone_separation.reset();
      } else if (value.isInteger() && value.asInt() >= 0) {
        rules.upper_parts_max_semitone_separation = value.asInt();
      } else {
        return fail(error, "rules JSON: '" + key + "' must be a non-negative integer or null");
      }
    } else if (key == "max_realizations_per_slot") {
      if (!value.isInteger() || value.number_val < 1) {
        return fail(error, "rules JSON: '" + key + "' must be a positive integer");
      }
      rules.max_realizations_per_slot = static_cast<size_t>(value.number_val);
    } else if (key == "omittable_figures") {
      if (value.type != JsonValue::String || !parseNumberList(value.string_val, rules.omittable_figures)) {
        return fail(error, "rules JSON: '" + key + "' must be a string such as \"5\" or \"5,3\"");
      }
    } else if (key.compare(0, std::char_traits<char>::length(kMaxLeapPrefix), kMaxLeapPrefix) == 0 &&
               key.size() > std::char_traits<char>::length(kMaxLeapPrefix)) {
      if (!value.isInteger() || value.asInt() < 0) {
        return fail(error, "rules JSON: '" + key + "' must be a non-negative integer");
      }
      PartMovementLimit limit;
      limit.label = key.substr(std::char_traits<char>::length(kMaxLeapPrefix));
      limit.max_semitones = value.asInt();
      rules.part_movement_limits.push_back(limit);
    } else {
      return fail(error, "rules JSON: unknown key '" + key + "'");
    }
  }

  out = rules;
  return true;
}

void writeRulesJson(JsonWriter& writer, const Rules& rules) {
  writer.beginObject();
  for (const auto& option : kBoolOptions) {
    writer.key(option.key);
    writer.value(rules.*(option.field));
  }
  writer.key("upper_parts_max_semitone_separation");
  if (rules.upper_parts_max_semitone_separation) {
    writer.value(*rules.upper_parts_max_semitone_separation);
  } else {
    writer.valueNull();
  }
  writer.key("max_realizations_per_slot");
  writer.value(static_cast<uint64_t>(rules.max_realizations_per_slot));

  std::string omittable;
  for (size_t idx = 0; idx < rules.omittable_figures.size(); ++idx) {
    if (idx > 0) omittable += ",";
    omittable += std::to_string(rules.omittable_figures[idx]);
  }
  writer.key("omittable_figures");
  writer.value(omittable);

  for (const auto& limit : rules.part_movement_limits) {
    writer.key(kMaxLeapPrefix + limit.label);
    writer.value(limit.max_semitones);
  }
  writer.endObject();
}

std::string rulesToJson(const Rules& rules) {
  JsonWriter writer;
  writeRulesJson(writer, rules);
  return writer.toString();
}

}  // namespace figbass
