#ifndef circuit_breaker_h
#define circuit_breaker_h

#include <chrono>
#include <boost/thread/mutex.hpp>

enum circuit_state {
  CIRCUIT_CLOSED,
  CIRCUIT_OPEN,
  CIRCUIT_HALF_OPEN
};

/* Stops calling the API after repeated transient failures, and lets a
   single probe through once `open_time` has passed. */
class circuit_breaker {
public:
  circuit_breaker(unsigned failure_threshold = 5,
                  std::chrono::milliseconds open_time = std::chrono::seconds(30));

  bool can_execute();

  void record_success();

  void record_failure();

  circuit_state state() const;

private:
  typedef std::chrono::steady_clock clock;

  mutable boost::mutex mtx;
  circuit_state current;
  unsigned failures;
  unsigned failure_threshold;
  std::chrono::milliseconds open_time;
  clock::time_point opened_at;
};

#endif //circuit_breaker_h
