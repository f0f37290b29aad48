#pragma once

#include <ham/Mirror/Clock.hpp>
#include <ham/Mirror/DeviceMirror.hpp>
#include <ham/Mirror/StateSnapshot.hpp>

namespace ham {

/// Merges inbound agent snapshots into a DeviceMirror.
///
/// Merge rules:
///  - state, volume and muted always overwrite;
///  - when the new state is not Off, the track identity is replaced as a
///    unit if (and only if) the snapshot carries a non-empty title, and
///    duration/position are applied whenever present;
///  - when the new state is Off, track identity and position are frozen;
///  - lastUpdated is stamped last.
class StateReconciler {
public:
    explicit StateReconciler(Clock clock = systemNow);

    /// Decode and apply a raw state payload. Malformed payloads are logged
    /// and dropped without touching the mirror. Returns true if applied.
    bool applyPayload(DeviceMirror& mirror, const QByteArray& payload) const;

    /// Apply an already decoded snapshot. Returns false (mirror untouched)
    /// if the snapshot is invalid.
    bool applySnapshot(DeviceMirror& mirror, const StateSnapshot& snapshot) const;

private:
    Clock clock_;
};

} // namespace ham
