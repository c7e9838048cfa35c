#pragma once

#include <vigil/support/Assert.hh>

#include <atomic>
#include <cstdint>

// Frames are numbered from 1, both in fail_frame and in diagnostics.
class FrameLoop final : public vigil::StopHook {
    const std::uint32_t m_frame_count;
    const std::uint32_t m_fail_frame;
    const float m_frame_budget_ms;
    std::atomic<bool> m_running{true};
    std::uint32_t m_frame_number{0};
    std::uint64_t m_spawned_count{0};
    std::uint64_t m_destroyed_count{0};
    double m_accumulator{0.0};

    void step();

public:
    FrameLoop(std::uint32_t frame_count, std::uint32_t fail_frame, float frame_budget_ms)
        : m_frame_count(frame_count), m_fail_frame(fail_frame), m_frame_budget_ms(frame_budget_ms) {}

    void request_stop() noexcept override;
    void run();

    // Number of the last frame started, 0 before the first.
    std::uint32_t frame_number() const { return m_frame_number; }
};
