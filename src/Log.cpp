#include "duct/Log.hpp"
#include "duct/Constants.hpp"

#include <atomic>
#include <cstdlib>
#include <mutex>
#include <string>
#include <string_view>

namespace duct::log {

namespace {

std::atomic<bool> verbose_flag{false};
std::once_flag    verbose_init;

void init_from_environment() {
  std::string const name{VERBOSE_ENV_VAR};
  if (char const* value = std::getenv(name.c_str())) {
    std::string_view sv{value};
    verbose_flag.store(!sv.empty() && sv != "0");
  }
}

} // namespace

bool verbose() noexcept {
  std::call_once(verbose_init, init_from_environment);
  return verbose_flag.load(std::memory_order_relaxed);
}

void set_verbose(bool enabled) noexcept {
  std::call_once(verbose_init, init_from_environment);
  verbose_flag.store(enabled);
}

} // namespace duct::log
