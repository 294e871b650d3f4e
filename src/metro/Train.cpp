#include "metro/Train.hpp"

namespace metro {

const char* ToString(TrainState s)
{
  switch (s) {
  case TrainState::Moving: return "MOVING";
  case TrainState::Stopped: return "STOPPED";
  }
  return "MOVING";
}

bool ParseTrainState(const std::string& s, TrainState& out)
{
  if (s == "MOVING" || s == "moving") {
    out = TrainState::Moving;
    return true;
  }
  if (s == "STOPPED" || s == "stopped") {
    out = TrainState::Stopped;
    return true;
  }
  return false;
}

} // namespace metro
