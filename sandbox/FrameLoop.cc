#include "FrameLoop.hh"

#include <vigil/support/Assert.hh>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>

void FrameLoop::request_stop() noexcept {
    m_running.store(false, std::memory_order_relaxed);
}

void FrameLoop::step() {
    const auto start = std::chrono::steady_clock::now();
    for (std::uint32_t i = 0; i < 10000; i++) {
        m_accumulator += std::sin(static_cast<double>(m_frame_number * 10000 + i));
    }
    m_spawned_count += 3;
    m_destroyed_count += 2;
    if (m_frame_number == m_fail_frame) {
        // Simulated double release of pooled objects.
        m_destroyed_count += m_spawned_count;
    }

    const std::chrono::duration<float, std::milli> frame_time = std::chrono::steady_clock::now() - start;
    VIGIL_ASSERT(Warning, frame_time.count() <= m_frame_budget_ms, "frame {} took {:.2f}ms", m_frame_number,
                 frame_time.count());
    VIGIL_ASSERT(Error, m_destroyed_count <= m_spawned_count, "frame {} destroyed {} of {} spawned objects",
                 m_frame_number, m_destroyed_count, m_spawned_count);
}

void FrameLoop::run() {
    while (m_running.load(std::memory_order_relaxed) && m_frame_number < m_frame_count) {
        m_frame_number++;
        step();
    }
}
