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

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "option.h"
#include "tandem.h"

static volatile sig_atomic_t g_shutdown = 0;
static volatile sig_atomic_t g_shutdown_count = 0;

// Signal handler for Ctrl+C
void signalHandler(int signal) {
  if (signal == SIGINT) {
    g_shutdown_count = g_shutdown_count + 1;
    g_shutdown = 1;
    // A second Ctrl+C does not wait for a stuck teardown
    if (g_shutdown_count >= 2) {
      _exit(1);
    }
  }
}

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  Options opts = parseOptions(args);

  if (opts.help) {
    fprintf(stderr, "%s\n", opts.help_string.c_str());
    return 1;
  }

  LoggingSeverity severity = LS_INFO;
  ParseLoggingSeverity(opts.log_level, severity);
  TandemSetLoggingLevel(severity);
  std::cerr << getUsage(opts);

  signal(SIGINT, signalHandler);

  TandemApplication::rtcInitialize();

  int result = 0;
  {
    TandemApplication app(opts);
    if (!app.Initialize()) {
      fprintf(stderr, "Failed to initialize %s\n", opts.mode.c_str());
      result = 1;
    } else if (!app.Start()) {
      fprintf(stderr, "Failed to start %s\n", opts.mode.c_str());
      result = 1;
    } else {
      fprintf(stderr, "%s running, Ctrl+C to quit\n", opts.mode.c_str());
      while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      fprintf(stderr, "\nCtrl+C received, shutting down...\n");
    }
    app.Shutdown();
  }

  TandemApplication::rtcCleanup();
  return result;
}
