#include "clock.h"

#include <chrono>
#include <thread>

using namespace std;

const int64_t SystemClock::SLEEP_INTERVAL_US;

SystemClock::SystemClock(WaitStrategy strategy) : strategy(strategy) {}

int64_t SystemClock::now_millis() {
  return chrono::duration_cast<chrono::milliseconds>(
             chrono::system_clock::now().time_since_epoch())
      .count();
}

void SystemClock::relax() {
  if (strategy == WaitStrategy::kSleep) {
    this_thread::sleep_for(chrono::microseconds(SLEEP_INTERVAL_US));
  }
}
