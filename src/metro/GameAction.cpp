#include "metro/GameAction.hpp"

#include <algorithm>
#include <cctype>

namespace metro {

namespace {

struct KindName {
  ActionKind kind;
  const char* name;
};

const KindName kKindNames[] = {
    {ActionKind::PlaceStation, "PLACE_STATION"},
    {ActionKind::RemoveStation, "REMOVE_STATION"},
    {ActionKind::StartLine, "START_LINE"},
    {ActionKind::AddStationToLine, "ADD_STATION_TO_LINE"},
    {ActionKind::CompleteLine, "COMPLETE_LINE"},
    {ActionKind::CancelLine, "CANCEL_LINE"},
    {ActionKind::AddTrain, "ADD_TRAIN"},
    {ActionKind::RemoveTrain, "REMOVE_TRAIN"},
    {ActionKind::Pause, "PAUSE"},
    {ActionKind::Resume, "RESUME"},
    {ActionKind::SetSpeed, "SET_SPEED"},
};

static_assert(std::variant_size_v<GameAction> == sizeof(kKindNames) / sizeof(kKindNames[0]),
              "every GameAction alternative needs an ActionKind name");

} // namespace

ActionKind ActionKindOf(const GameAction& action)
{
  // Variant alternatives are declared in ActionKind order.
  return static_cast<ActionKind>(action.index());
}

const char* ToString(ActionKind kind)
{
  for (const KindName& kn : kKindNames) {
    if (kn.kind == kind) return kn.name;
  }
  return "UNKNOWN";
}

bool ParseActionKind(const std::string& s, ActionKind& out)
{
  std::string k = s;
  std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  for (const KindName& kn : kKindNames) {
    if (k == kn.name) {
      out = kn.kind;
      return true;
    }
  }
  return false;
}

} // namespace metro
