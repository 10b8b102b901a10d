#pragma once

#include <memory>

#include "duct/Error.hpp"
#include "duct/Output.hpp"

namespace duct {

namespace detail {
class Execution;
} // namespace detail

// A started expression. Dropping a Handle without waiting closes the parent's
// descriptors and leaves the children to finish and be reaped in the background.
class Handle {
  std::unique_ptr<detail::Execution> execution_;

public:
  explicit Handle(std::unique_ptr<detail::Execution> execution) noexcept;
  ~Handle();

  Handle(Handle const&)            = delete;
  Handle& operator=(Handle const&) = delete;
  Handle(Handle&&) noexcept;
  Handle& operator=(Handle&&) noexcept;

  // Waits for every process and forwarding thread, then applies the status
  // rules. Returns StatusFailure (with the Output) for a checked failure.
  [[nodiscard]] Result<Output> wait();
};

} // namespace duct
