/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include <gtest/gtest.h>

#include "rtc_base/logging.h"
#include "rtc_base/ssl_adapter.h"
#include "rtc_base/thread.h"

#include "option.h"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  TandemSetLoggingLevel(LS_WARNING);
  rtc::InitializeSSL();
  int result = 0;
  {
    // BlockingCall() from the test body needs a current rtc::Thread.
    rtc::AutoThread main_thread;
    result = RUN_ALL_TESTS();
  }
  rtc::CleanupSSL();
  return result;
}
