/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/utils/NotifyOnce.h"

namespace meganode {

bool NotifyOnce::send() {
  if (state_->sent_.exchange(true)) {
    return false;
  }
  state_->promise_.setValue();
  return true;
}

}  // namespace meganode
