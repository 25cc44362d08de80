#include "client_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace ksm::core {

namespace {

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') return false;
  char* end_ptr = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || v > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

bool ParseBool(const std::string& text, bool& out) {
  const std::string t = ToLower(text);
  if (t == "1" || t == "true" || t == "on" || t == "yes") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "off" || t == "no") {
    out = false;
    return true;
  }
  return false;
}

std::string Invalid(const std::string& key, std::size_t line_no) {
  return "invalid " + key + " at line " + std::to_string(line_no);
}

}  // namespace

bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error) {
  out_cfg = ClientConfig{};
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "client_config not found: " + path;
    return false;
  }
  std::string section;
  bool saw_ksm_section = false;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::string t = StripInlineComment(Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = ToLower(Trim(t.substr(1, t.size() - 2)));
      if (section == "ksm") {
        saw_ksm_section = true;
      }
      continue;
    }
    const auto pos = t.find('=');
    if (pos == std::string::npos) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    if (section != "ksm") continue;
    const std::string key = Trim(t.substr(0, pos));
    const std::string val = StripInlineComment(Trim(t.substr(pos + 1)));
    bool ok = true;
    if (key == "hostname") {
      out_cfg.hostname = val;
    } else if (key == "config_file") {
      ok = !val.empty();
      if (ok) out_cfg.config_file = val;
    } else if (key == "log_level") {
      ok = platform::log::ParseLevel(val, out_cfg.log_level);
    } else if (key == "verify_ssl") {
      ok = ParseBool(val, out_cfg.verify_ssl);
    } else if (key == "ca_bundle") {
      out_cfg.ca_bundle = val;
    } else if (key == "timeout_ms") {
      ok = ParseUint32(val, out_cfg.timeout_ms) && out_cfg.timeout_ms != 0;
    } else if (key == "cache_enabled") {
      ok = ParseBool(val, out_cfg.cache_enabled);
    } else if (key == "cache_path") {
      out_cfg.cache_path = val;
    } else if (key == "server_public_key_id") {
      ok = ParseUint32(val, out_cfg.server_public_key_id);
    }
    if (!ok) {
      error = Invalid(key, line_no);
      return false;
    }
  }
  if (!saw_ksm_section) {
    error = "ksm section missing";
    return false;
  }
  if (out_cfg.cache_enabled && out_cfg.cache_path.empty()) {
    error = "cache_enabled=1 but cache_path empty";
    return false;
  }
  return true;
}

}  // namespace ksm::core
