// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace peerwatch {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The PeerWatch developers";

// Agent string carried in discovery beacons
// Format: /PeerWatch:0.3.0/
inline std::string GetUserAgent() {
  return "/PeerWatch:" + GetVersionString() + "/";
}

inline std::string GetFullVersionString() {
  return "PeerWatch version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";
} // namespace colors

// Startup banner with the local peer id
inline std::string GetStartupBanner(const std::string &peer_id) {
  std::string banner;
  banner += "\n";
  banner += colors::CYAN;
  banner += "+---------------------------------------------------------------+\n";
  banner += "|  PeerWatch - gossip membership node                           |\n";
  banner += "+---------------------------------------------------------------+\n";

  std::string version_str = GetVersionString();
  banner += "|  Version: " + version_str;
  if (version_str.length() < 52) {
    banner += std::string(52 - version_str.length(), ' ');
  }
  banner += "|\n";

  // Peer ids are 52 characters; anything longer just overflows the box
  banner += "|  Peer:    " + peer_id;
  if (peer_id.length() < 52) {
    banner += std::string(52 - peer_id.length(), ' ');
  }
  banner += "|\n";

  banner += "+---------------------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace peerwatch
