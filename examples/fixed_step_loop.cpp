#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <steptime.hpp>

using namespace steptime;

// Toy simulation: a body falling under constant acceleration, integrated at a
// fixed 60 Hz step while frames arrive at an uneven rate
struct World {
    int64_t position_mm = 0;
    int64_t velocity_mm_s = 0;

    void update(TimeSpan step) {
        constexpr int64_t gravity_mm_s2 = -9'810;
        velocity_mm_s += gravity_mm_s2 * step.nanoseconds() / TimeSpan::NANOS_PER_SECOND;
        position_mm += velocity_mm_s * step.nanoseconds() / TimeSpan::NANOS_PER_SECOND;
    }
};

static void configure_logging() {
    const char* env = std::getenv("STEPTIME_LOG_LEVEL");
    if (env == nullptr) {
        return;
    }
    auto level = parse_log_level(env);
    if (!level) {
        std::cerr << "Ignoring STEPTIME_LOG_LEVEL='" << env
                  << "' (expected quiet, error, warning, info or debug)\n";
        return;
    }
    set_log_level(*level);
}

int main() {
    configure_logging();

    std::cout << "steptime fixed-step loop\n";
    std::cout << "========================\n\n";

    auto source = std::make_shared<SteadyClockSource>();
    std::cout << "Clock source: " << source->frequency() << "\n";

    Clock clock(source);
    auto timer = FixedTimer::from_rate(*Frequency::from_hz(60), 8);
    if (!timer) {
        std::cerr << "Timer setup failed: " << time_error_string(timer.error()) << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "Fixed step:   " << timer->step() << "\n\n";

    World world;

    // Frame pacing varies between 5 and 40 ms; frame 12 stalls for 300 ms to
    // trigger the catch-up cap
    for (int frame = 0; frame < 20; ++frame) {
        const int sleep_ms = frame == 12 ? 300 : 5 + (frame * 7) % 36;
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));

        auto tick = clock.step();
        if (!tick) {
            std::cerr << "Clock step failed: " << time_error_string(tick.error()) << "\n";
            return EXIT_FAILURE;
        }

        auto batch = timer->advance(tick->step);
        if (!batch) {
            std::cerr << "Timer advance failed: " << time_error_string(batch.error()) << "\n";
            return EXIT_FAILURE;
        }
        for (const FixedStep& step : *batch) {
            world.update(step.step);
        }

        const Fraction alpha = timer->interpolation();
        std::cout << "frame " << frame << "  real " << tick->now << "  dt " << tick->step
                  << "  steps " << batch->count();
        if (batch->dropped() > 0) {
            std::cout << " (dropped " << batch->dropped() << ")";
        }
        std::cout << "  sim " << timer->sim_time() << "  alpha " << alpha.num << "/"
                  << alpha.den << "  y " << world.position_mm << " mm\n";
    }

    std::cout << "\nTotal steps:   " << timer->total_steps() << "\n";
    std::cout << "Dropped steps: " << timer->dropped_steps() << "\n";
    std::cout << "Sim time:      " << to_string_full(timer->sim_time().since_epoch()) << "\n";
    return EXIT_SUCCESS;
}
