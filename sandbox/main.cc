#include "Config.hh"
#include "FrameLoop.hh"

#include <vigil/support/Assert.hh>
#include <vigil/support/Log.hh>

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <exception>

using vigil::Log;

int main(int argc, char **argv) {
    Log::set_colours_enabled(isatty(STDOUT_FILENO) == 1);
    vigil::log_assert_config(vigil::k_assert_threshold, vigil::k_assert_quit);

    std::uint32_t frame_count = 0;
    std::uint32_t fail_frame = 0;
    float frame_budget_ms = 0.0F;
    try {
        Config config(argc > 1 ? argv[1] : "sandbox.cfg");
        config.parse();
        frame_count = config.get<std::uint32_t>("frame_count");
        fail_frame = config.get<std::uint32_t>("fail_frame");
        frame_budget_ms = config.get<float>("frame_budget_ms");
    } catch (const std::exception &error) {
        Log::error("sandbox", "Invalid config: {}", error.what());
        return EXIT_FAILURE;
    }

    FrameLoop loop(frame_count, fail_frame, frame_budget_ms);
    vigil::set_assert_stop_hook(&loop);
    try {
        loop.run();
    } catch (const vigil::AssertionFailure &failure) {
        vigil::set_assert_stop_hook(nullptr);
        Log::error("sandbox", "Stopped during frame {}", loop.frame_number());
        Log::error("sandbox", "{}", failure.located_message());
        return EXIT_FAILURE;
    }
    vigil::set_assert_stop_hook(nullptr);
    Log::info("sandbox", "Ran {} frames", loop.frame_number());
    return EXIT_SUCCESS;
}
