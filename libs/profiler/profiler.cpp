/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "profiler/profiler.hpp"

namespace perfscope::profiler {

  ProfileSession &globalSession() {
    static ProfileSession session;
    return session;
  }

  void profileBegin() {
    globalSession().begin();
  }

  void profileEndAndPrint() {
    globalSession().endAndPrint();
  }

}  // namespace perfscope::profiler
