#ifndef SNOWFLAKE_CLOCK_H
#define SNOWFLAKE_CLOCK_H

#include <cstdint>

// How the generator waits for the next millisecond once the sequence is
// exhausted.
enum class WaitStrategy {
  kSpin,   // re-read the clock in a tight loop
  kSleep,  // sleep briefly between clock reads
};

/**
 * Time source used by the generator.
 *
 * now_millis() returns Unix time in milliseconds. relax() is called on every
 * iteration of the loop that waits for the clock to reach the next millisecond.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  virtual int64_t now_millis() = 0;
  virtual void relax() {}
};

/**
 * Wall clock backed by std::chrono::system_clock.
 *
 * kSpin keeps relax() empty: lowest wake-up latency, but it burns a core for up
 * to a millisecond. kSleep sleeps SLEEP_INTERVAL_US between reads, trading a
 * small latency floor for idle CPU.
 */
class SystemClock : public Clock {
 private:
  WaitStrategy strategy;

 public:
  static const int64_t SLEEP_INTERVAL_US = 100;

  explicit SystemClock(WaitStrategy strategy = WaitStrategy::kSpin);

  int64_t now_millis() override;
  void relax() override;

  WaitStrategy wait_strategy() const { return strategy; }
};

#endif  // SNOWFLAKE_CLOCK_H
