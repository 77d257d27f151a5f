#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace cirrus::util {

/*
  Runs fn on its own thread and waits at most `ceiling` for the answer.

  On timeout the caller gets DependencyUnavailable and the call is left to
  finish in the background, so fn must own everything it touches. Exceptions
  thrown by fn reach the caller unchanged.
*/
template <typename Fn>
auto CallWithDeadline(std::chrono::milliseconds ceiling, const std::string& what, Fn fn) -> decltype(fn()) {
  using Result = decltype(fn());

  auto task   = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  auto future = task->get_future();
  std::thread([task] { (*task)(); }).detach();

  if (future.wait_for(ceiling) != std::future_status::ready) {
    throw DependencyUnavailable(what + ": no answer within " + std::to_string(ceiling.count()) + "ms");
  }
  return future.get();
}

} // namespace cirrus::util
