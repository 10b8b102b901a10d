#include "duct/Handle.hpp"
#include "duct/Engine.hpp"

#include <cerrno>
#include <utility>

namespace duct {

Handle::Handle(std::unique_ptr<detail::Execution> execution) noexcept
    : execution_(std::move(execution)) {}

Handle::~Handle() = default;

Handle::Handle(Handle&&) noexcept            = default;
Handle& Handle::operator=(Handle&&) noexcept = default;

Result<Output> Handle::wait() {
  if (!execution_) {
    return std::unexpected(Error::io("wait on an empty handle", EINVAL));
  }
  return execution_->wait();
}

} // namespace duct
