#pragma once

#include <cstddef>
#include <functional>

namespace finq::executor {

using Work = std::function<void()>;

/*
  Substrate that runs posted work out of band.

  Implementations decide the concurrency policy. None of them cancel:
  Shutdown() lets accepted work finish.
*/
class Executor {
 public:
  virtual ~Executor() = default;

  // Throws util::InvalidState once Shutdown() has been called.
  virtual void Post(Work work) = 0;

  // Stops accepting work, waits for accepted work, joins threads.
  virtual void Shutdown() = 0;

  // Accepted work that has not finished yet (queued + running).
  virtual std::size_t InFlight() const = 0;
};

} // namespace finq::executor
