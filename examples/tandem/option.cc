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

#include <unistd.h>    // For gethostname
#include <cerrno>      // For errno used with strtol
#include <climits>
#include <cstdio>
#include <cstdlib>

#include <json/json.h> // Use jsoncpp header
#include <algorithm>
#include <memory>
#include <sstream>
#include <unordered_set>

#include "rtc_base/logging.h"

#include "option.h"

namespace {

// Utility to remove surrounding single or double quotes from a string.
std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2) {
        if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

// Strict base-10 conversion; rejects trailing garbage and out of range values.
bool parseInteger(const std::string& text, long min_value, long max_value, int& out) {
    const char* start_ptr = text.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    long value = strtol(start_ptr, &end_ptr, 10);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0') {
        return false;
    }
    if (value < min_value || value > max_value) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

// Assigns a millisecond setting, keeping the current value when `text` is
// not a valid duration.
void setDuration(const std::string& name, const std::string& text, bool allow_zero, int& field) {
    int value = 0;
    if (!parseInteger(text, allow_zero ? 0 : 1, INT_MAX, value)) {
        RTC_LOG(LS_WARNING) << "Invalid value for " << name << ": '" << text
                            << "', keeping " << field;
        return;
    }
    field = value;
}

void setDuration(const std::string& name, const Json::Value& value, bool allow_zero, int& field) {
    if (!value.isInt()) {
        RTC_LOG(LS_WARNING) << "Config " << name << " is not an integer, keeping " << field;
        return;
    }
    setDuration(name, std::to_string(value.asInt()), allow_zero, field);
}

std::string normalizeMode(const std::string& mode) {
    // The caller/callee spellings are accepted for older configs.
    if (mode == "caller") return "initiator";
    if (mode == "callee") return "responder";
    return mode;
}

void applyDebugList(const std::string& list, DebugOptions& debug) {
    for (const auto& name : stringSplit(list, ",")) {
        if (name == "network") {
            debug.network = true;
        } else if (name == "frames") {
            debug.frames = true;
        } else if (name == "ice") {
            debug.ice = true;
        } else if (name == "stats") {
            debug.stats = true;
        } else if (name == "all") {
            debug = DebugOptions{true, true, true, true};
        } else if (!name.empty()) {
            RTC_LOG(LS_WARNING) << "Unknown debug category: " << name;
        }
    }
}

bool parseResolution(const std::string& text, int& width, int& height) {
    std::vector<std::string> parts = stringSplit(text, "x");
    int w = 0;
    int h = 0;
    if (parts.size() != 2 || !parseInteger(parts[0], 16, 7680, w) ||
        !parseInteger(parts[1], 16, 4320, h)) {
        RTC_LOG(LS_WARNING) << "Invalid resolution: " << text;
        return false;
    }
    width = w;
    height = h;
    return true;
}

std::string defaultDisplayName() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        return std::string("tandem-") + host;
    }
    return "tandem";
}

void loadConfigFile(Options& opts) {
    FILE* fp = fopen(opts.config_path.c_str(), "rb");
    if (!fp) {
        RTC_LOG(LS_WARNING) << "Could not open config file: " << opts.config_path;
        return;
    }
    std::string contents;
    fseek(fp, 0, SEEK_END);
    long size = ftell(fp);
    rewind(fp);
    if (size > 0) {
        contents.resize(static_cast<size_t>(size));
        size_t bytes_read = fread(&contents[0], 1, contents.size(), fp);
        contents.resize(bytes_read);
    }
    fclose(fp);

    Json::Value config_json;
    Json::CharReaderBuilder reader_builder;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    if (!reader->parse(contents.data(), contents.data() + contents.size(),
                       &config_json, &errs) || !config_json.isObject()) {
        RTC_LOG(LS_ERROR) << "Failed to parse config file " << opts.config_path << ": " << errs;
        return;
    }

    // Strings
    if (config_json.isMember("mode") && config_json["mode"].isString()) {
        RTC_LOG(LS_INFO) << "Config mode: " << config_json["mode"].asString();
        opts.mode = normalizeMode(config_json["mode"].asString());
    }
    if (config_json.isMember("discovery") && config_json["discovery"].isString()) {
        opts.discovery = config_json["discovery"].asString();
    }
    if (config_json.isMember("service_type") && config_json["service_type"].isString()) {
        opts.service_type = config_json["service_type"].asString();
    }
    if (config_json.isMember("display_name") && config_json["display_name"].isString()) {
        opts.display_name = config_json["display_name"].asString();
    }
    if (config_json.isMember("address") && config_json["address"].isString()) {
        RTC_LOG(LS_INFO) << "Config address: " << config_json["address"].asString();
        opts.address = config_json["address"].asString();
    }
    if (config_json.isMember("required_media") && config_json["required_media"].isString()) {
        opts.required_media = config_json["required_media"].asString();
    }
    if (config_json.isMember("camera") && config_json["camera"].isString()) {
        RTC_LOG(LS_INFO) << "Config camera: " << config_json["camera"].asString();
        opts.camera = config_json["camera"].asString();
    }
    if (config_json.isMember("log_level") && config_json["log_level"].isString()) {
        opts.log_level = config_json["log_level"].asString();
    }
    if (config_json.isMember("stun_servers")) {
        const Json::Value& s = config_json["stun_servers"];
        if (s.isString()) {
            opts.stun_servers = stringSplit(s.asString(), ",");
        } else if (s.isArray()) {
            opts.stun_servers.clear();
            for (Json::ArrayIndex i = 0; i < s.size(); ++i) {
                if (!s[i].isString()) {
                    RTC_LOG(LS_WARNING) << "stun_servers element " << i << " is not a string, skipping";
                    continue;
                }
                opts.stun_servers.push_back(s[i].asString());
            }
        } else {
            RTC_LOG(LS_WARNING) << "`stun_servers` is neither string nor array, ignored";
        }
    }

    // Booleans
    if (config_json.isMember("encryption") && config_json["encryption"].isBool()) {
        RTC_LOG(LS_INFO) << "Config encryption: " << config_json["encryption"].asBool();
        opts.encryption = config_json["encryption"].asBool();
    }
    if (config_json.isMember("bonjour") && config_json["bonjour"].isBool()) {
        opts.bonjour = config_json["bonjour"].asBool();
    }
    if (config_json.isMember("stats") && config_json["stats"].isBool()) {
        opts.stats = config_json["stats"].asBool();
    }

    // Durations and capture format
    if (config_json.isMember("ice_restart_cooldown_ms")) {
        setDuration("ice_restart_cooldown_ms", config_json["ice_restart_cooldown_ms"], false,
                    opts.ice_restart_cooldown_ms);
    }
    if (config_json.isMember("health_check_interval_ms")) {
        setDuration("health_check_interval_ms", config_json["health_check_interval_ms"], false,
                    opts.health_check_interval_ms);
    }
    if (config_json.isMember("stall_threshold_ms")) {
        setDuration("stall_threshold_ms", config_json["stall_threshold_ms"], false,
                    opts.stall_threshold_ms);
    }
    if (config_json.isMember("capture_restart_delay_ms")) {
        setDuration("capture_restart_delay_ms", config_json["capture_restart_delay_ms"], true,
                    opts.capture_restart_delay_ms);
    }
    if (config_json.isMember("remote_freeze_threshold_ms")) {
        setDuration("remote_freeze_threshold_ms", config_json["remote_freeze_threshold_ms"], false,
                    opts.remote_freeze_threshold_ms);
    }
    if (config_json.isMember("stats_interval_ms")) {
        setDuration("stats_interval_ms", config_json["stats_interval_ms"], false,
                    opts.stats_interval_ms);
    }
    if (config_json.isMember("width") && config_json["width"].isInt()) {
        opts.width = config_json["width"].asInt();
    }
    if (config_json.isMember("height") && config_json["height"].isInt()) {
        opts.height = config_json["height"].asInt();
    }
    if (config_json.isMember("fps") && config_json["fps"].isInt()) {
        opts.fps = config_json["fps"].asInt();
    }

    if (config_json.isMember("debug")) {
        const Json::Value& d = config_json["debug"];
        if (d.isObject()) {
            if (d["network"].isBool()) opts.debug.network = d["network"].asBool();
            if (d["frames"].isBool()) opts.debug.frames = d["frames"].asBool();
            if (d["ice"].isBool()) opts.debug.ice = d["ice"].asBool();
            if (d["stats"].isBool()) opts.debug.stats = d["stats"].asBool();
        } else if (d.isString()) {
            applyDebugList(d.asString(), opts.debug);
        } else {
            RTC_LOG(LS_WARNING) << "`debug` is neither object nor string, ignored";
        }
    }

    RTC_LOG(LS_INFO) << "Loaded options from config file: " << opts.config_path;
}

} // namespace

// Function to parse IP address and port from a string in the format "IP:PORT"
bool TANDEM_API ParseIpAndPort(const std::string& ip_port, std::string& ip, int& port) {
  size_t colon_pos = ip_port.rfind(':');
  if (colon_pos == std::string::npos) {
    RTC_LOG(LS_ERROR) << "Invalid IP:PORT format: " << ip_port;
    return false;
  }

  ip = ip_port.substr(0, colon_pos);
  std::string port_str = ip_port.substr(colon_pos + 1);

  int port_val = 0;
  if (!parseInteger(port_str, 0, 65535, port_val)) {
    RTC_LOG(LS_ERROR) << "Invalid port: " << port_str;
    return false;
  }

  port = port_val;
  return true;
}

// Basic split that honours quotes for the space delimiter, used for the
// cmd-line string variant.
std::vector<std::string> stringSplit(std::string input, std::string delimiter)
{
    if (delimiter != " ") {
        std::vector<std::string> tokens;
        size_t pos = 0;
        while ((pos = input.find(delimiter)) != std::string::npos) {
            tokens.push_back(input.substr(0, pos));
            input.erase(0, pos + delimiter.size());
        }
        tokens.push_back(input);
        return tokens;
    }

    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '"') {
            in_quotes = !in_quotes;
            continue;
        }
        if (c == ' ' && !in_quotes) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

TANDEM_API Options parseOptions(const char* argString) {
  std::vector<std::string> args = stringSplit(argString, " ");
  return parseOptions(args);
}

Options parseOptions(const std::vector<std::string>& args) {
  Options opts;
  opts.help_string =
      "Usage:\n"
      "tandem [options] [address]\n\n"
      "Options:\n"
      "  --config <path>                    Load options from JSON config file.\n"
      "                                     Command-line options override config file.\n"
      "  --mode=<initiator|responder>       Camera sender or viewer (default: initiator)\n"
      "  --discovery=<announce|scan|auto>   Discovery role (default: from mode)\n"
      "  --service_type=<name>              Bonjour service type (default: webrtc-signal)\n"
      "  --display_name=<name>              Advertised instance name\n"
      "  --bonjour, --no-bonjour            Enable/disable Bonjour discovery (default: enabled)\n"
      "  --encryption, --no-encryption      Enable/disable TLS on the signaling link (default: enabled)\n"
      "  --stun=<uri,uri,...>               STUN servers\n"
      "  --required_media=<marker>          Offers lacking this SDP line are ignored (default: m=video)\n"
      "  --ice_restart_cooldown_ms=<ms>     Delay before an ICE restart offer (default: 2000)\n"
      "  --health_check_interval_ms=<ms>    Capture watchdog period (default: 5000)\n"
      "  --stall_threshold_ms=<ms>          Frame gap treated as a stall (default: 6000)\n"
      "  --capture_restart_delay_ms=<ms>    Pause between capture stop and start (default: 1000)\n"
      "  --remote_freeze_threshold_ms=<ms>  Remote frame gap reported as frozen (default: 3000)\n"
      "  --stats, --no-stats                Periodic statistics report (default: disabled)\n"
      "  --stats_interval_ms=<ms>           Statistics period (default: 2000)\n"
      "  --camera=<device>                  Camera name or unique id (default: first device)\n"
      "  --resolution=<width>x<height>      Capture size (default: 1280x720)\n"
      "  --fps=<n>                          Capture rate (default: 30)\n"
      "  --log_level=<verbose|info|warning|error|none>\n"
      "  --debug=<network,frames,ice,stats|all>  Verbose log categories\n"
      "  --help                             Show this help message\n\n"
      "Examples:\n"
      "  tandem --mode=initiator\n"
      "  tandem --mode=responder\n"
      "  tandem --mode=initiator --no-bonjour :3478\n"
      "  tandem --mode=responder --no-bonjour 192.168.1.20:3478\n"
      "  tandem --config settings.json --debug=ice\n";

  const std::unordered_set<std::string> known_options = {
    "--config", "--mode", "--discovery", "--service_type", "--display_name",
    "--bonjour", "--no-bonjour", "--encryption", "--no-encryption", "--stun",
    "--required_media", "--ice_restart_cooldown_ms", "--health_check_interval_ms",
    "--stall_threshold_ms", "--capture_restart_delay_ms",
    "--remote_freeze_threshold_ms", "--stats", "--no-stats", "--stats_interval_ms",
    "--camera", "--resolution", "--fps", "--log_level", "--debug", "--help"
  };

  // --- First pass: check for --config ---
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--config" && i + 1 < args.size()) {
      opts.config_path = args[i + 1];
      break;
    } else if (arg.find("--config=") == 0) {
      opts.config_path = arg.substr(9);
      break;
    } else if (arg == "--help") {
      opts.help = true;
      return opts;
    }
  }

  if (!opts.config_path.empty()) {
    loadConfigFile(opts);
  }

  // Helper function to check if string is an address: "ip:port" or ":port"
  auto isAddress = [](const std::string& str) {
    size_t colon_pos = str.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == str.length() - 1) {
      return false;
    }
    int port = 0;
    return parseInteger(str.substr(colon_pos + 1), 0, 65535, port);
  };

  // --- Second pass: parse command-line arguments (overriding config) ---
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "--config" && i + 1 < args.size()) {
      i++;
      continue;
    } else if (arg.find("--config=") == 0) {
      continue;
    }

    // Handle parameters with values
    if (arg.find("--mode=") == 0) {
      opts.mode = normalizeMode(arg.substr(7));
    } else if (arg.find("--discovery=") == 0) {
      opts.discovery = arg.substr(12);
    } else if (arg.find("--service_type=") == 0) {
      opts.service_type = arg.substr(15);
    } else if (arg.find("--display_name=") == 0) {
      opts.display_name = stripQuotes(arg.substr(15));
    } else if (arg.find("--stun=") == 0) {
      opts.stun_servers = stringSplit(stripQuotes(arg.substr(7)), ",");
    } else if (arg.find("--required_media=") == 0) {
      opts.required_media = stripQuotes(arg.substr(17));
    } else if (arg.find("--ice_restart_cooldown_ms=") == 0) {
      setDuration("ice_restart_cooldown_ms", arg.substr(26), false, opts.ice_restart_cooldown_ms);
    } else if (arg.find("--health_check_interval_ms=") == 0) {
      setDuration("health_check_interval_ms", arg.substr(27), false, opts.health_check_interval_ms);
    } else if (arg.find("--stall_threshold_ms=") == 0) {
      setDuration("stall_threshold_ms", arg.substr(21), false, opts.stall_threshold_ms);
    } else if (arg.find("--capture_restart_delay_ms=") == 0) {
      setDuration("capture_restart_delay_ms", arg.substr(27), true, opts.capture_restart_delay_ms);
    } else if (arg.find("--remote_freeze_threshold_ms=") == 0) {
      setDuration("remote_freeze_threshold_ms", arg.substr(29), false, opts.remote_freeze_threshold_ms);
    } else if (arg.find("--stats_interval_ms=") == 0) {
      setDuration("stats_interval_ms", arg.substr(20), false, opts.stats_interval_ms);
    } else if (arg.find("--camera=") == 0) {
      opts.camera = stripQuotes(arg.substr(9));
    } else if (arg.find("--resolution=") == 0) {
      parseResolution(arg.substr(13), opts.width, opts.height);
    } else if (arg.find("--fps=") == 0) {
      int fps = 0;
      if (parseInteger(arg.substr(6), 1, 120, fps)) {
        opts.fps = fps;
      } else {
        RTC_LOG(LS_WARNING) << "Invalid fps: " << arg.substr(6);
      }
    } else if (arg.find("--log_level=") == 0) {
      opts.log_level = arg.substr(12);
    } else if (arg.find("--debug=") == 0) {
      applyDebugList(arg.substr(8), opts.debug);
    }
    // Handle flags
    else if (arg == "--encryption") {
      opts.encryption = true;
    } else if (arg == "--no-encryption") {
      RTC_LOG(LS_INFO) << "Args set encryption off";
      opts.encryption = false;
    } else if (arg == "--bonjour") {
      opts.bonjour = true;
    } else if (arg == "--no-bonjour") {
      opts.bonjour = false;
    } else if (arg == "--stats") {
      opts.stats = true;
    } else if (arg == "--no-stats") {
      opts.stats = false;
    }
    // Handle address in any position (must not be another known flag/option)
    else if (arg.rfind("--", 0) != 0 && isAddress(arg)) {
      opts.address = arg;
    } else if (arg.rfind("--", 0) == 0) {
      std::string opt_name = arg.substr(0, arg.find('=') != std::string::npos ? arg.find('=') : arg.length());
      if (known_options.find(opt_name) == known_options.end()) {
        RTC_LOG(LS_WARNING) << "Unknown option: " << arg;
      }
    } else {
      RTC_LOG(LS_WARNING) << "Ignoring argument: " << arg;
    }
  }

  // Environment variables are the lowest priority.
  if (opts.address.empty()) {
    if (const char* env_address = std::getenv("TANDEM_ADDRESS")) {
      opts.address = env_address;
    }
  }
  if (opts.display_name.empty()) {
    if (const char* env_name = std::getenv("TANDEM_NAME")) {
      opts.display_name = env_name;
    }
  }
  if (opts.camera.empty()) {
    if (const char* env_camera = std::getenv("TANDEM_CAMERA")) {
      opts.camera = env_camera;
    }
  }
  if (opts.display_name.empty()) {
    opts.display_name = defaultDisplayName();
  }

  if (opts.mode != "initiator" && opts.mode != "responder") {
    RTC_LOG(LS_WARNING) << "Unknown mode '" << opts.mode << "', using initiator";
    opts.mode = "initiator";
  }
  if (opts.discovery != "announce" && opts.discovery != "scan" && opts.discovery != "auto") {
    RTC_LOG(LS_WARNING) << "Unknown discovery role '" << opts.discovery << "', using auto";
    opts.discovery = "auto";
  }
  LoggingSeverity severity;
  if (!ParseLoggingSeverity(opts.log_level, severity)) {
    RTC_LOG(LS_WARNING) << "Unknown log level '" << opts.log_level << "', using info";
    opts.log_level = "info";
  }

  RTC_LOG(LS_INFO) << "Mode used " << opts.mode;
  return opts;
}

std::string getUsage(const Options opts) {
  std::stringstream usage;

  usage << "\n--- Current Settings ---\n";
  usage << "Mode: " << opts.mode << "\n";
  usage << "Discovery: " << opts.discovery
        << (opts.bonjour ? " (bonjour " : " (manual ") << opts.service_type << ")\n";
  usage << "Display Name: " << opts.display_name << "\n";
  usage << "Address: " << (!opts.address.empty() ? opts.address : "(not set)") << "\n";
  usage << "Encryption: " << (opts.encryption ? "enabled" : "disabled") << "\n";
  usage << "STUN Servers:";
  for (const auto& server : opts.stun_servers) {
    usage << " " << server;
  }
  usage << "\n";
  usage << "Required Media: " << opts.required_media << "\n";
  usage << "ICE Restart Cooldown: " << opts.ice_restart_cooldown_ms << " ms\n";
  usage << "Health Check: every " << opts.health_check_interval_ms << " ms, stall after "
        << opts.stall_threshold_ms << " ms, restart delay "
        << opts.capture_restart_delay_ms << " ms\n";
  usage << "Remote Freeze Threshold: " << opts.remote_freeze_threshold_ms << " ms\n";
  usage << "Stats: " << (opts.stats ? "every " + std::to_string(opts.stats_interval_ms) + " ms" : "disabled") << "\n";
  usage << "Camera: " << (!opts.camera.empty() ? opts.camera : "(first device)") << " "
        << opts.width << "x" << opts.height << "@" << opts.fps << "\n";
  usage << "Log Level: " << opts.log_level << "\n";
  if (!opts.config_path.empty()) {
    usage << "Config File Used: " << opts.config_path << "\n";
  }
  usage << "------------------------\n";

  return usage.str();
}

// LOGGING

bool ParseLoggingSeverity(const std::string& name, LoggingSeverity& out) {
  if (name == "verbose") {
    out = LS_VERBOSE;
  } else if (name == "info") {
    out = LS_INFO;
  } else if (name == "warning") {
    out = LS_WARNING;
  } else if (name == "error") {
    out = LS_ERROR;
  } else if (name == "none") {
    out = LS_NONE;
  } else {
    return false;
  }
  return true;
}

void TandemSetLoggingLevel(LoggingSeverity level) {
  rtc::LogMessage::LogToDebug(static_cast<rtc::LoggingSeverity>(level));
  rtc::LogMessage::LogTimestamps(true);
  rtc::LogMessage::LogThreads(true);
}
