#pragma once

// Single-slot mailbox between the input source and the tick loop. Any number
// of posts between two ticks collapse into one activation; extras are dropped,
// not carried into a later tick.
struct ActivationMailbox {
  bool pending = false;
  int dropped = 0; // posts swallowed by coalescing, for diagnostics
};

inline void PostActivation(ActivationMailbox &box) {
  if (box.pending) {
    ++box.dropped;
    return;
  }
  box.pending = true;
}

// Returns the pending activation (if any) and empties the slot.
inline bool TakeActivation(ActivationMailbox &box) {
  const bool pending = box.pending;
  box.pending = false;
  return pending;
}
