#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace mc {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Derived classes implement runLoop(), which executes in the service thread
 * after start() or in the caller thread with run(). Derived classes that own
 * state used by runLoop() must call stop() from their own destructor.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_RUNNING = 1;
  static constexpr int32_t E_START = 2;

  explicit Service(const std::string &name);

  ~Service() override;

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  bool isStopSet() const { return isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop. Should return soon after isStopSet() becomes true.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts, in the calling thread.
   * An error aborts start().
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the stop flag is set but before the thread is joined.
   * Override to wake a runLoop() blocked on something other than the flag.
   */
  virtual void onStopRequested() {}

  /**
   * Called after the thread has stopped, in the calling thread.
   */
  virtual void onStop() {}

private:
  // Shared by start() and run(): state check, onStart(), clear the flag
  Roe<void> prepare();

  std::atomic<bool> isStopSet_{ true };
  std::thread thread_;
};

} // namespace mc
