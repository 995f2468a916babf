#include <boost/lexical_cast.hpp>
#include "circuit_breaker.hpp"
#include "logger.hpp"

circuit_breaker::circuit_breaker(unsigned failure_threshold,
                                 std::chrono::milliseconds open_time)
  : current(CIRCUIT_CLOSED), failures(0), failure_threshold(failure_threshold),
    open_time(open_time) {
}

bool circuit_breaker::can_execute() {
  boost::mutex::scoped_lock lock(mtx);
  switch (current) {
  case CIRCUIT_CLOSED:
  case CIRCUIT_HALF_OPEN:
    return true;
  case CIRCUIT_OPEN:
    if (clock::now() - opened_at >= open_time) {
      logger::log(LOG_DEBUG, "circuit breaker half-open");
      current = CIRCUIT_HALF_OPEN;
      return true;
    }
    return false;
  }
  return false;
}

void circuit_breaker::record_success() {
  boost::mutex::scoped_lock lock(mtx);
  failures = 0;
  if (current != CIRCUIT_CLOSED) {
    logger::log(LOG_INFO, "circuit breaker closed");
    current = CIRCUIT_CLOSED;
  }
}

void circuit_breaker::record_failure() {
  boost::mutex::scoped_lock lock(mtx);
  failures++;
  if (failures >= failure_threshold && current != CIRCUIT_OPEN) {
    logger::log(LOG_WARN, "circuit breaker opened after "
                + boost::lexical_cast<std::string>(failures)
                + " consecutive failures");
    current = CIRCUIT_OPEN;
    opened_at = clock::now();
  }
}

circuit_state circuit_breaker::state() const {
  boost::mutex::scoped_lock lock(mtx);
  return current;
}
