#pragma once

// arf/deadline.hpp — Bounded waits on work that may overrun.
//
// run_detached() starts fn on its own detached thread and hands back a future
// for its result (or exception). The caller waits with wait_for/wait_until
// and simply stops caring on timeout: the future's destructor never blocks,
// unlike one returned by std::async.
//
// fn must own everything it touches (capture shared_ptrs and values, never
// references into the caller's frame), because it may outlive the caller.

#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

namespace arf {

template <typename Fn>
std::future<std::invoke_result_t<Fn>> run_detached(Fn fn) {
  using T = std::invoke_result_t<Fn>;
  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> future = promise->get_future();
  std::thread([fn = std::move(fn), promise]() mutable {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();
  return future;
}

}  // namespace arf
