#include <vigil/support/Log.hh>

#include <atomic>
#include <mutex>

namespace vigil {

// NOLINTNEXTLINE
std::mutex Log::s_log_lock;
// NOLINTNEXTLINE
std::atomic<bool> Log::s_colours_enabled{true};

void Log::set_colours_enabled(bool colours_enabled) {
    s_colours_enabled.store(colours_enabled, std::memory_order_relaxed);
}

} // namespace vigil
