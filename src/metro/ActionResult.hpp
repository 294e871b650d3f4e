#pragma once

#include "metro/Types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace metro {

// Outcome of a validation step. `reason` is empty when valid.
struct ValidationResult {
  bool valid = false;
  std::string reason;

  static ValidationResult Ok() { return ValidationResult{true, std::string()}; }
  static ValidationResult Fail(std::string why) { return ValidationResult{false, std::move(why)}; }
};

// Ids of whatever an action created or touched.
struct ActionData {
  std::optional<StationId> stationId;
  std::optional<LineId> lineId;
  std::optional<TrainId> trainId;
};

// Outcome of a state-changing operation. Rule violations are reported here,
// never thrown.
struct ActionResult {
  bool success = false;
  std::string error;
  ActionData data;

  static ActionResult Ok(ActionData d = {})
  {
    ActionResult r;
    r.success = true;
    r.data = d;
    return r;
  }

  static ActionResult Fail(std::string why)
  {
    ActionResult r;
    r.success = false;
    r.error = std::move(why);
    return r;
  }
};

} // namespace metro
