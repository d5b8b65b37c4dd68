#pragma once

namespace reactdom {

// One expiration unit. Updates stamped within the same unit at the same
// priority share an expiration time and coalesce.
inline constexpr double expirationUnitSizeMs = 1.0;

// createElement reports a warning as soon as it sees an invalid type; the
// render step throws regardless.
inline constexpr bool warnAboutInvalidElementTypes = true;

// ReactBatch::onComplete callbacks fire when the idle loop finishes rendering
// a batch ahead of its commit.
inline constexpr bool enableBatchCompletionCallbacks = true;

} // namespace reactdom
