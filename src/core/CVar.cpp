#include "orrery/core/CVar.h"

#include "orrery/core/Log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace orrery::core {

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }

  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      const char n = s[++i];
      out.push_back(n == 'n' ? '\n' : (n == 't' ? '\t' : n));
      continue;
    }
    out.push_back(s[i]);
  }
  return out;
}

static std::string quoteIfNeeded(std::string_view s) {
  const bool needs = s.empty() || std::any_of(s.begin(), s.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '#' || c == '=' || c == '"' || c == '\\';
  });
  if (!needs) return std::string(s);

  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default:   out.push_back(c); break;
    }
  }
  out.push_back('"');
  return out;
}

// Parse `text` as a value of `type`. Returns nullopt when it does not fit.
static std::optional<CVarValue> parseValue(CVarType type, std::string_view text) {
  const std::string_view t = trimView(text);
  switch (type) {
    case CVarType::Bool: {
      const std::string k = lowerAscii(t);
      if (k == "1" || k == "true" || k == "on" || k == "yes") return CVarValue{true};
      if (k == "0" || k == "false" || k == "off" || k == "no") return CVarValue{false};
      return std::nullopt;
    }
    case CVarType::Int: {
      std::int64_t v = 0;
      const auto res = std::from_chars(t.data(), t.data() + t.size(), v, 10);
      if (t.empty() || res.ec != std::errc{} || res.ptr != t.data() + t.size()) return std::nullopt;
      return CVarValue{v};
    }
    case CVarType::Float: {
      const std::string tmp(t);
      char* end = nullptr;
      const double v = std::strtod(tmp.c_str(), &end);
      if (tmp.empty() || *end != '\0') return std::nullopt;
      return CVarValue{v};
    }
    case CVarType::String:
      return CVarValue{unquote(t)};
  }
  return std::nullopt;
}

static bool typeMatches(CVarType type, const CVarValue& v) {
  switch (type) {
    case CVarType::Bool:   return std::holds_alternative<bool>(v);
    case CVarType::Int:    return std::holds_alternative<std::int64_t>(v);
    case CVarType::Float:  return std::holds_alternative<double>(v);
    case CVarType::String: return std::holds_alternative<std::string>(v);
  }
  return false;
}

bool CVarRegistry::exists(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return vars_.find(name) != vars_.end();
}

CVar* CVarRegistry::defineImpl(std::string_view name, CVarType type, CVarValue def,
                               std::uint32_t flags, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it == vars_.end()) {
    CVar v;
    v.name = std::string(name);
    v.type = type;
    v.value = def;
    std::string key = v.name;
    it = vars_.emplace(std::move(key), std::move(v)).first;
  } else if (it->second.type != type) {
    return nullptr;
  }

  CVar& var = it->second;
  var.flags = flags;
  var.defaultValue = std::move(def);
  if (!help.empty()) var.help = std::string(help);

  const auto pit = pending_.find(name);
  if (pit != pending_.end()) {
    if (auto parsed = parseValue(type, pit->second)) {
      var.value = std::move(*parsed);
    } else {
      log(LogLevel::Warn, "cvar " + var.name + ": ignoring pending value '" + pit->second + "'");
    }
    pending_.erase(pit);
  }
  return &var;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue,
                               std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Bool, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue,
                              std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Int, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue,
                                std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Float, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue,
                                 std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::String, CVarValue{std::move(defaultValue)}, flags, help);
}

bool CVarRegistry::setValueImpl(std::string_view name, CVarValue v, std::string* outError) {
  std::vector<CVarListener> listeners;
  CVar snapshot;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    CVar& var = it->second;
    if ((var.flags & CVar_ReadOnly) != 0u) {
      if (outError) *outError = "CVar is read-only: " + var.name;
      return false;
    }
    if (!typeMatches(var.type, v)) {
      if (outError) *outError = "Type mismatch for cvar: " + var.name;
      return false;
    }

    var.value = std::move(v);
    listeners = var.listeners;
    snapshot = var;
  }

  // Listeners run on a copy, outside the lock, so they may query the registry.
  for (const auto& cb : listeners) {
    if (cb) cb(snapshot);
  }
  return true;
}

bool CVarRegistry::setBool(std::string_view name, bool v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return setValueImpl(name, CVarValue{std::move(v)}, outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  CVarType type = CVarType::String;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    type = it->second.type;
  }

  auto parsed = parseValue(type, value);
  if (!parsed) {
    if (outError) *outError = std::string("Invalid ") + typeName(type) + " for " + std::string(name) + ": " + std::string(value);
    return false;
  }
  return setValueImpl(name, std::move(*parsed), outError);
}

bool CVarRegistry::assign(std::string_view assignment, std::string* outError) {
  const auto eq = assignment.find('=');
  if (eq == std::string_view::npos) {
    if (outError) *outError = "Expected name=value, got: " + std::string(assignment);
    return false;
  }
  const std::string_view name = trimView(assignment.substr(0, eq));
  return setFromString(name, assignment.substr(eq + 1), outError);
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  CVarValue def;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    def = it->second.defaultValue;
  }
  return setValueImpl(name, std::move(def), outError);
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<bool>(it->second.value)) return fallback;
  return std::get<bool>(it->second.value);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<std::int64_t>(it->second.value)) return fallback;
  return std::get<std::int64_t>(it->second.value);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<double>(it->second.value)) return fallback;
  return std::get<double>(it->second.value);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<std::string>(it->second.value)) return std::string(fallback);
  return std::get<std::string>(it->second.value);
}

std::vector<const CVar*> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = lowerAscii(filter);
  std::vector<const CVar*> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    if (!needle.empty() && lowerAscii(kv.first).find(needle) == std::string::npos) continue;
    out.push_back(&kv.second);
  }
  return out;
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Bool: return "bool";
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVar& v) {
  if (const auto* b = std::get_if<bool>(&v.value)) return *b ? "true" : "false";
  if (const auto* i = std::get_if<std::int64_t>(&v.value)) return std::to_string(*i);
  if (const auto* d = std::get_if<double>(&v.value)) {
    std::ostringstream oss;
    oss.precision(17);
    oss << *d;
    return oss.str();
  }
  return std::get<std::string>(v.value);
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open cvar file: " + path;
    return false;
  }

  std::ostringstream errs;
  bool hadErrors = false;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;

    std::string_view sv = trimView(line);
    if (sv.empty() || sv.front() == '#') continue;

    // Trailing comment, unless it sits inside a quoted string.
    if (sv.find('"') == std::string_view::npos) {
      const auto hash = sv.find('#');
      if (hash != std::string_view::npos) sv = trimView(sv.substr(0, hash));
    }

    const auto eq = sv.find('=');
    if (eq == std::string_view::npos) {
      hadErrors = true;
      errs << path << ":" << lineNo << ": expected name = value\n";
      continue;
    }

    const std::string_view name = trimView(sv.substr(0, eq));
    const std::string_view val = trimView(sv.substr(eq + 1));
    if (name.empty()) continue;

    if (!exists(name)) {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_[std::string(name)] = std::string(val);
      continue;
    }

    std::string err;
    if (!setFromString(name, val, &err)) {
      hadErrors = true;
      errs << path << ":" << lineNo << ": " << err << "\n";
    }
  }

  if (hadErrors && outError) *outError = errs.str();
  return !hadErrors;
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write cvar file: " + path;
    return false;
  }

  out << "# orrery cvars\n\n";

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    const CVar& v = kv.second;
    if ((v.flags & CVar_Archive) == 0u) continue;

    out << v.name << " = ";
    if (v.type == CVarType::String) {
      out << quoteIfNeeded(std::get<std::string>(v.value));
    } else {
      out << valueToString(v);
    }
    out << "\n";
  }

  for (const auto& kv : pending_) {
    out << kv.first << " = " << kv.second << "\n";
  }

  return static_cast<bool>(out);
}

bool CVarRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(name) != pending_.end();
}

std::optional<std::string> CVarRegistry::pendingValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

CVarRegistry& cvars() {
  static CVarRegistry g;
  return g;
}

void installDefaultCVars(CVarRegistry& registry) {
  if (registry.exists("log.level")) return;

  registry.defineString("log.level", lowerAscii(trimView(toString(getLogLevel()))), CVar_Archive,
                        "Global log level: trace|debug|info|warn|error|off");

  // Apply a value that was pending from a config file loaded earlier.
  LogLevel lvl = LogLevel::Info;
  if (parseLogLevel(registry.getString("log.level"), lvl)) setLogLevel(lvl);

  registry.addListener("log.level", [](const CVar& cv) {
    LogLevel next = LogLevel::Info;
    if (!parseLogLevel(std::get<std::string>(cv.value), next)) {
      ORRERY_LOG_WARN("cvar log.level: expected trace|debug|info|warn|error|off");
      return;
    }
    setLogLevel(next);
  });
}

} // namespace orrery::core
