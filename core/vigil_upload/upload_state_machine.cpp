// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_state_machine.hpp"

#include <algorithm>
#include <utility>

#define VIGIL_LOG_COMPONENT "upload_state"
#include "integrity_log.hpp"

namespace vigil {
namespace upload {

using logging::kv;

std::string state_to_string(UploadState state) {
  switch (state) {
    case UploadState::RECEIVED:
      return "received";
    case UploadState::FILENAME_VALIDATED:
      return "filename_validated";
    case UploadState::QUARANTINED:
      return "quarantined";
    case UploadState::VALIDATED:
      return "validated";
    case UploadState::PROMOTED:
      return "promoted";
    case UploadState::REJECTED:
      return "rejected";
  }
  return "unknown";
}

UploadStateMachine::UploadStateMachine()
    : current_state_(UploadState::RECEIVED)
    , history_{UploadState::RECEIVED} {
  build_transition_map();
}

void UploadStateMachine::build_transition_map() {
  valid_transitions_[UploadState::RECEIVED] = {
    UploadState::FILENAME_VALIDATED, UploadState::REJECTED
  };
  valid_transitions_[UploadState::FILENAME_VALIDATED] = {
    UploadState::QUARANTINED, UploadState::REJECTED
  };
  valid_transitions_[UploadState::QUARANTINED] = {UploadState::VALIDATED, UploadState::REJECTED};
  valid_transitions_[UploadState::VALIDATED] = {UploadState::PROMOTED, UploadState::REJECTED};

  // Terminal
  valid_transitions_[UploadState::PROMOTED] = {};
  valid_transitions_[UploadState::REJECTED] = {};
}

UploadState UploadStateMachine::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_state_;
}

bool UploadStateMachine::is_terminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_state_ == UploadState::PROMOTED || current_state_ == UploadState::REJECTED;
}

bool UploadStateMachine::is_valid_transition(UploadState from, UploadState to) const {
  auto it = valid_transitions_.find(from);
  if (it == valid_transitions_.end()) {
    return false;
  }

  const auto& valid_targets = it->second;
  return std::find(valid_targets.begin(), valid_targets.end(), to) != valid_targets.end();
}

bool UploadStateMachine::transition_to(UploadState to, std::string& error_msg) {
  UploadState from;
  std::vector<UploadTransitionCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = current_state_;
    if (!is_valid_transition(from, to)) {
      error_msg = "Cannot transition from " + state_to_string(from) + " to " + state_to_string(to);
      return false;
    }

    current_state_ = to;
    history_.push_back(to);
    callbacks = callbacks_;
  }

  VIGIL_LOG_DEBUG(
    "Upload state" << kv("from", state_to_string(from)) << kv("to", state_to_string(to))
  );

  // Run unlocked so callbacks may query the machine
  for (const auto& callback : callbacks) {
    callback(from, to);
  }

  error_msg.clear();
  return true;
}

bool UploadStateMachine::reject() {
  std::string error;
  return transition_to(UploadState::REJECTED, error);
}

std::vector<UploadState> UploadStateMachine::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_;
}

void UploadStateMachine::register_transition_callback(UploadTransitionCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

}  // namespace upload
}  // namespace vigil
