#pragma once

#include <cstdint>
#include <string_view>

namespace snapmig::model {

enum class MigrationState : std::uint8_t {
  kIdle = 0,
  kRunning = 1,
  kCompleted = 2,
  kFailed = 3,
};

constexpr bool IsTerminal(MigrationState state) {
  return state == MigrationState::kCompleted || state == MigrationState::kFailed;
}

/*
  Idle -> Running -> Completed | Failed

  A terminal state only ends the run it belongs to; a fresh run may be
  started from it.
*/
constexpr bool CanTransition(MigrationState from, MigrationState to) {
  switch (to) {
    case MigrationState::kRunning:
      return from == MigrationState::kIdle || IsTerminal(from);
    case MigrationState::kCompleted:
    case MigrationState::kFailed:
      return from == MigrationState::kRunning;
    case MigrationState::kIdle:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(MigrationState state) {
  switch (state) {
    case MigrationState::kIdle:
      return "idle";
    case MigrationState::kRunning:
      return "running";
    case MigrationState::kCompleted:
      return "completed";
    case MigrationState::kFailed:
      return "failed";
  }
  return "unknown";
}

}  // namespace snapmig::model
