#include <seekline/utils/timer.h>
#include <spdlog/spdlog.h>

namespace seekline {

Timer::Timer(bool autostart, bool verbose) : verbose_(verbose) {
    if (autostart) start();
}

Timer::~Timer() {
    if (!verbose_) return;
    stop();
    spdlog::info("Elapsed time: {:.3f} ms", elapsed());
}

void Timer::start() {
    start_time_ = end_time_ = Clock::now();
    running_ = true;
}

void Timer::stop() {
    if (!running_) return;
    end_time_ = Clock::now();
    running_ = false;
}

double Timer::elapsed() const {
    auto until = running_ ? Clock::now() : end_time_;
    return std::chrono::duration<double, std::milli>(until - start_time_)
        .count();
}

}  // namespace seekline
