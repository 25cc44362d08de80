#include "platform_log.h"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace ksm::platform::log {

namespace {

constexpr char kMask[] = "***";

struct Sink {
  std::mutex mu;
  LogCallback cb{nullptr};
  void* user{nullptr};
};

Sink& GlobalSink() {
  static Sink sink;
  return sink;
}

std::atomic<std::uint8_t> g_min_level{static_cast<std::uint8_t>(Level::kInfo)};

const char* LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

std::string Lower(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool IsNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
         c == '-';
}

bool EndsValue(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0 || c == ',' ||
         c == ';' || c == '&';
}

void WriteLine(Level level, std::string_view tag, std::string_view message,
               const std::vector<Field>& fields) {
  std::string line = "[ksm] ";
  line += LevelName(level);
  if (!tag.empty()) {
    line += ' ';
    line += tag;
  }
  line += ": ";
  line += message;
  for (const Field& f : fields) {
    if (f.key.empty()) {
      continue;
    }
    line += ' ';
    line += f.key;
    line += '=';
    line += f.value;
  }
  line += '\n';
  std::FILE* stream = level >= Level::kWarn ? stderr : stdout;
  std::fputs(line.c_str(), stream);
  std::fflush(stream);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  Sink& sink = GlobalSink();
  std::lock_guard<std::mutex> lock(sink.mu);
  sink.cb = cb;
  sink.user = user_data;
}

void SetMinLevel(Level level) {
  g_min_level.store(static_cast<std::uint8_t>(level));
}

Level MinLevel() {
  return static_cast<Level>(g_min_level.load());
}

bool ParseLevel(std::string_view text, Level& out) {
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"trace", Level::kDebug}, {"debug", Level::kDebug},
      {"info", Level::kInfo},   {"warn", Level::kWarn},
      {"warning", Level::kWarn}, {"error", Level::kError},
  };
  const std::string lowered = Lower(text);
  for (const auto& entry : kNames) {
    if (lowered == entry.name) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  if (level < MinLevel()) {
    return;
  }
  const std::string safe_message = RedactMessage(message);
  std::vector<std::string> values;
  values.reserve(fields.size());
  for (const Field& f : fields) {
    values.push_back(RedactValue(f.key, f.value));
  }
  std::vector<Field> safe_fields;
  safe_fields.reserve(fields.size());
  std::size_t i = 0;
  for (const Field& f : fields) {
    safe_fields.push_back(Field{f.key, values[i++]});
  }

  Sink& sink = GlobalSink();
  std::lock_guard<std::mutex> lock(sink.mu);
  if (sink.cb != nullptr) {
    const std::string tag_copy(tag);
    sink.cb(level, tag_copy.c_str(), safe_message.c_str(), safe_fields.data(),
            safe_fields.size(), sink.user);
    return;
  }
  WriteLine(level, tag, safe_message, safe_fields);
}

// Key material names (clientKey, privateKey, appKey) and credentials are
// masked. Server key ids are not secret.
bool IsSensitiveKey(std::string_view key) {
  const std::string name = Lower(key);
  if (name.empty() || name.find("keyid") != std::string::npos ||
      name.find("key_id") != std::string::npos) {
    return false;
  }
  static const char* const kMarkers[] = {"key", "token", "secret", "password",
                                         "signature"};
  for (const char* marker : kMarkers) {
    if (name.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  return IsSensitiveKey(key) ? std::string(kMask) : std::string(value);
}

std::string RedactMessage(std::string_view message) {
  std::string out;
  out.reserve(message.size());
  std::size_t pos = 0;
  while (pos < message.size()) {
    const std::size_t eq = message.find('=', pos);
    if (eq == std::string_view::npos) {
      out.append(message.substr(pos));
      break;
    }
    std::size_t name_begin = eq;
    while (name_begin > pos && IsNameChar(message[name_begin - 1])) {
      --name_begin;
    }
    out.append(message.substr(pos, eq + 1 - pos));
    std::size_t value_end = eq + 1;
    while (value_end < message.size() && !EndsValue(message[value_end])) {
      ++value_end;
    }
    const std::string_view name = message.substr(name_begin, eq - name_begin);
    if (value_end > eq + 1 && IsSensitiveKey(name)) {
      out.append(kMask);
    } else {
      out.append(message.substr(eq + 1, value_end - eq - 1));
    }
    pos = value_end;
  }
  return out;
}

}  // namespace ksm::platform::log
