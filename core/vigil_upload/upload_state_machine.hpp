// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_UPLOAD_STATE_MACHINE_HPP
#define VIGIL_UPLOAD_STATE_MACHINE_HPP

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {
namespace upload {

/**
 * UploadState tracks one upload through the handler pipeline.
 *
 * State transitions:
 * - RECEIVED -> FILENAME_VALIDATED: filename passed every guard rule
 * - FILENAME_VALIDATED -> QUARANTINED: bytes written to the quarantine file
 * - QUARANTINED -> VALIDATED: size and checksum checks passed
 * - VALIDATED -> PROMOTED: atomic rename to the destination (terminal)
 * - any non-terminal -> REJECTED: failure or cancellation (terminal)
 */
enum class UploadState {
  RECEIVED,
  FILENAME_VALIDATED,
  QUARANTINED,
  VALIDATED,
  PROMOTED,
  REJECTED
};

std::string state_to_string(UploadState state);

/**
 * Called after each successful transition with (from_state, to_state).
 */
using UploadTransitionCallback = std::function<void(UploadState, UploadState)>;

/**
 * UploadStateMachine enforces the transition table for a single upload.
 *
 * Thread-safe. Callbacks run under the internal lock and must not call
 * back into the machine.
 */
class UploadStateMachine {
public:
  UploadStateMachine();

  // Non-copyable
  UploadStateMachine(const UploadStateMachine&) = delete;
  UploadStateMachine& operator=(const UploadStateMachine&) = delete;

  UploadState get_state() const;

  bool is_terminal() const;

  /**
   * Attempt a state transition.
   *
   * @param to The target state
   * @param error_msg Output error message if transition fails
   * @return true if transition was successful
   */
  bool transition_to(UploadState to, std::string& error_msg);

  /**
   * Move to REJECTED from any non-terminal state.
   * Returns false if the upload already finished.
   */
  bool reject();

  bool is_valid_transition(UploadState from, UploadState to) const;

  /**
   * Every state entered so far, starting with RECEIVED.
   */
  std::vector<UploadState> history() const;

  void register_transition_callback(UploadTransitionCallback callback);

private:
  void build_transition_map();

  mutable std::mutex mutex_;
  UploadState current_state_;
  std::vector<UploadState> history_;
  std::vector<UploadTransitionCallback> callbacks_;
  std::map<UploadState, std::vector<UploadState>> valid_transitions_;
};

}  // namespace upload
}  // namespace vigil

#endif  // VIGIL_UPLOAD_STATE_MACHINE_HPP
