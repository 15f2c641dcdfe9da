/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_PROFILER_REGION_HPP
#define PERFSCOPE_PROFILER_REGION_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>

#include "profiler/profile_session.hpp"

namespace perfscope::profiler {

  /**
   * Times its own lifetime and records one sample into the session when
   * destroyed, whatever the way the enclosing scope is left. Regions opened
   * on the same thread while this one is alive are its children: their time
   * is subtracted from this region's exclusive time. A region destroyed
   * before its children hands them over to its own parent. A region must be
   * destroyed on the thread that created it.
   */
  class Region final {
   public:
    Region(ProfileSession &session,
           std::string label,
           std::optional<uint64_t> bytes = std::nullopt);

    Region(Region const &) = delete;
    Region &operator=(Region const &) = delete;

    Region(Region &&) = delete;
    Region &operator=(Region &&) = delete;

    ~Region();

    void setBytes(uint64_t bytes);

    void addBytes(uint64_t bytes);

    std::string const &label() const;

   private:
    ProfileSession &session_;
    std::string label_;
    std::optional<uint64_t> bytes_;
    Region *parent_;
    bool recursive_{false};
    std::chrono::nanoseconds children_{0};
    ProfileSession::Clock::time_point start_;
  };

  /**
   * Run func with args inside a Region
   * @return whatever func returns; exceptions propagate after the sample is
   * recorded
   */
  template <typename Func,
            typename... Args,
            typename = std::enable_if_t<std::is_invocable_v<Func, Args...>>>
  decltype(auto) profileCall(ProfileSession &session,
                             std::string label,
                             Func &&func,
                             Args &&... args) {
    Region region(session, std::move(label));
    return std::invoke(std::forward<Func>(func), std::forward<Args>(args)...);
  }

  template <typename Func,
            typename... Args,
            typename = std::enable_if_t<std::is_invocable_v<Func, Args...>>>
  decltype(auto) profileCall(ProfileSession &session,
                             std::string label,
                             uint64_t bytes,
                             Func &&func,
                             Args &&... args) {
    Region region(session, std::move(label), bytes);
    return std::invoke(std::forward<Func>(func), std::forward<Args>(args)...);
  }

}  // namespace perfscope::profiler

#endif  // PERFSCOPE_PROFILER_REGION_HPP
