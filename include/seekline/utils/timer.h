#ifndef SEEKLINE_UTILS_TIMER_H
#define SEEKLINE_UTILS_TIMER_H

#include <chrono>

namespace seekline {

/**
 * Wall clock stopwatch reporting milliseconds. A verbose timer logs its
 * elapsed time when it goes out of scope.
 */
class Timer {
   public:
    explicit Timer(bool autostart = false, bool verbose = false);
    ~Timer();
    void start();
    void stop();

    /**
     * Milliseconds between start() and stop(), or until now while running
     */
    double elapsed() const;

   private:
    using Clock = std::chrono::steady_clock;

    bool verbose_;
    bool running_ = false;
    Clock::time_point start_time_;
    Clock::time_point end_time_;
};

}  // namespace seekline

#endif  // SEEKLINE_UTILS_TIMER_H
