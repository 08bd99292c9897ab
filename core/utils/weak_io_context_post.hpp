/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tuple>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "utils/weak_io_context.hpp"

namespace attesta {
  void post(const WeakIoContext &weak, auto f) {
    if (auto io = weak.lock()) {
      boost::asio::post(*io, std::move(f));
    }
  }

  inline bool runningInThisThread(const WeakIoContext &weak) {
    auto io = weak.lock();
    return io and io->get_executor().running_in_this_thread();
  }
}  // namespace attesta

/// Re-posts the current member call `func` onto `ctx` unless already running
/// there. The object must derive from `std::enable_shared_from_this`.
#define REINVOKE(ctx, func, ...)                                               \
  do {                                                                         \
    if (not runningInThisThread(ctx)) {                                        \
      return post(ctx,                                                         \
                  [weak = weak_from_this(),                                    \
                   args = std::make_tuple(__VA_ARGS__)]() mutable {            \
                    if (auto self = weak.lock()) {                             \
                      std::apply(                                              \
                          [&](auto &&...args) mutable {                        \
                            self->func(std::forward<decltype(args)>(args)...); \
                          },                                                   \
                          std::move(args));                                    \
                    }                                                          \
                  });                                                          \
    }                                                                          \
  } while (false)
