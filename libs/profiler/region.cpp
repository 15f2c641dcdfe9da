/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "profiler/region.hpp"

namespace {
  // innermost open region of the current thread
  thread_local perfscope::profiler::Region *current_region = nullptr;
}  // namespace

namespace perfscope::profiler {

  Region::Region(ProfileSession &session,
                 std::string label,
                 std::optional<uint64_t> bytes)
      : session_(session),
        label_(std::move(label)),
        bytes_(bytes),
        parent_(current_region) {
    for (auto *region = parent_; region != nullptr; region = region->parent_) {
      if (&region->session_ == &session_ and region->label_ == label_) {
        recursive_ = true;
        break;
      }
    }
    current_region = this;
    start_ = ProfileSession::Clock::now();
  }

  Region::~Region() {
    auto const elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        ProfileSession::Clock::now() - start_);

    if (current_region == this) {
      current_region = parent_;
    } else {
      // destroyed before its children: relink the child to this parent
      for (auto *region = current_region; region != nullptr;
           region = region->parent_) {
        if (region->parent_ == this) {
          region->parent_ = parent_;
          break;
        }
      }
    }
    if (parent_ != nullptr and &parent_->session_ == &session_) {
      parent_->children_ += elapsed;
    }

    session_.record(Sample{std::move(label_),
                           elapsed,
                           elapsed - children_,
                           bytes_,
                           recursive_});
  }

  void Region::setBytes(uint64_t bytes) {
    bytes_ = bytes;
  }

  void Region::addBytes(uint64_t bytes) {
    bytes_ = bytes_.value_or(0) + bytes;
  }

  std::string const &Region::label() const {
    return label_;
  }

}  // namespace perfscope::profiler
