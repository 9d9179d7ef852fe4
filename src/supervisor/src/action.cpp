#include "../include/action.hpp"

#include <algorithm>
#include <cctype>

Action parseAction(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "start") return Action::Start;
  if (lowered == "stop") return Action::Stop;
  if (lowered == "restart") return Action::Restart;

  throw InvalidActionError("Unknown action: '" + name +
                           "' (expected start, stop or restart)");
}

std::string actionToString(Action action) {
  switch (action) {
    case Action::Start:
      return "start";
    case Action::Stop:
      return "stop";
    case Action::Restart:
      return "restart";
  }
  return "unknown";
}
