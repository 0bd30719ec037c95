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

#pragma once

#include <string>
#include <vector>

#ifndef TANDEM_EXPORT_H
#define TANDEM_EXPORT_H

#if defined(_MSC_VER)
    #define TANDEM_EXPORT __declspec(dllexport)
    #define TANDEM_IMPORT __declspec(dllimport)
#elif defined(__GNUC__)
    #define TANDEM_EXPORT __attribute__((visibility("default")))
    #define TANDEM_IMPORT __attribute__((visibility("default")))
#else
    #define TANDEM_EXPORT
    #define TANDEM_IMPORT
#endif

#ifdef TANDEM_BUILDING_DLL
    #define TANDEM_API TANDEM_EXPORT
#else
    #define TANDEM_API TANDEM_IMPORT
#endif

enum LoggingSeverity {
  LS_VERBOSE,
  LS_INFO,
  LS_WARNING,
  LS_ERROR,
  LS_NONE,
};

#endif // TANDEM_EXPORT_H

// Per-category verbose switches. Each one gates the LS_VERBOSE chatter of a
// single subsystem; warnings and errors are always logged.
struct DebugOptions {
    bool network = false;   // signaling socket and discovery traffic
    bool frames = false;    // capture and remote frame arrival
    bool ice = false;       // local/remote candidates, ICE state
    bool stats = false;     // full stats report dump
};

// Command line options
struct Options {
    std::string mode = "initiator";     // initiator (camera) | responder (viewer)
    std::string discovery = "auto";     // announce | scan | auto (from mode)
    std::string service_type = "webrtc-signal";
    std::string display_name;           // Bonjour instance name
    std::string address;                // ip:port to connect to, or :port to listen on
    bool bonjour = true;
    bool encryption = true;
    bool stats = false;
    bool help = false;
    std::string help_string;
    std::string config_path = "";       // Path to JSON config file
    std::vector<std::string> stun_servers = {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
        "stun:stun2.l.google.com:19302",
    };
    std::string required_media = "m=video";
    int ice_restart_cooldown_ms = 2000;
    int health_check_interval_ms = 5000;
    int stall_threshold_ms = 6000;
    int capture_restart_delay_ms = 1000;
    int remote_freeze_threshold_ms = 3000;
    int stats_interval_ms = 2000;
    std::string camera;                 // device name or unique id, empty = first
    int width = 1280;
    int height = 720;
    int fps = 30;
    std::string log_level = "info";     // verbose | info | warning | error | none
    DebugOptions debug;
};

// Function to parse command line string to above options
TANDEM_API Options parseOptions(const char* argString);
TANDEM_API Options parseOptions(const std::vector<std::string>& args);

TANDEM_API bool ParseIpAndPort(const std::string& ip_port, std::string& ip, int& port);

TANDEM_API std::vector<std::string> stringSplit(std::string input, std::string delimiter);

// Function to get the effective options as a printable string
TANDEM_API std::string getUsage(const Options opts);

TANDEM_API bool ParseLoggingSeverity(const std::string& name, LoggingSeverity& out);

TANDEM_API void TandemSetLoggingLevel(LoggingSeverity level);
