#pragma once

#include "duct/Output.hpp"

namespace duct {

// Resolved result of a subtree: its status, and whether a failure of that status
// is fatal to the parent.
struct Outcome {
  ExitStatus status_;
  bool       checked_ = true;

  [[nodiscard]] constexpr bool is_checked_error() const noexcept {
    return checked_ && !status_.success();
  }

  constexpr bool operator==(Outcome const&) const noexcept = default;
};

// then: a checked failure on the left ends the sequence, otherwise the right
// side's outcome stands.
[[nodiscard]] constexpr bool then_continues(Outcome const& left) noexcept {
  return !left.is_checked_error();
}

[[nodiscard]] constexpr Outcome resolve_then(Outcome const& left, Outcome const& right) noexcept {
  return then_continues(left) ? right : left;
}

// pipe: a checked failure beats an unchecked one on either side, right beats
// left between equals, and a failure beats a success.
[[nodiscard]] constexpr Outcome resolve_pipe(Outcome const& left, Outcome const& right) noexcept {
  if (right.is_checked_error()) {
    return right;
  }
  if (left.is_checked_error()) {
    return left;
  }
  if (!right.status_.success()) {
    return right;
  }
  return left;
}

[[nodiscard]] constexpr Outcome resolve_unchecked(Outcome inner) noexcept {
  inner.checked_ = false;
  return inner;
}

} // namespace duct
