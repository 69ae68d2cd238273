#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orrery::core {

// Small dependency-free argument parser for the command line tools.
//
//  --flag                 flag
//  --key value            value (repeatable; last() returns the newest)
//  --key=value            value
//  --key v1 v2 v3         multi-value, once setArity("key", 3) was called
//  --                     everything after it is positional
//
// Tokens that look like numbers ("-1", "-0.5") are never treated as switches,
// so negative coordinates can be passed as values.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void setArity(std::string_view key, int valueCount) {
    if (valueCount > 0) arity_[std::string(key)] = valueCount;
  }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a == "--") {
        for (int j = i + 1; j < argc; ++j) {
          if (argv[j]) positional_.emplace_back(argv[j]);
        }
        break;
      }

      if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        const auto ar = arity_.find(key);
        const int need = (ar != arity_.end()) ? ar->second : 1;

        int took = 0;
        while (took < need && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          kv_[key].emplace_back(argv[++i]);
          ++took;
        }
        if (took == 0) flags_.push_back(key);
        continue;
      }

      if (a.size() >= 2 && a[0] == '-' && !looksLikeNumber(a)) {
        // Grouped short flags: -vh
        for (std::size_t j = 1; j < a.size(); ++j) {
          if (std::isalnum(static_cast<unsigned char>(a[j]))) flags_.emplace_back(1, a[j]);
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& positional() const { return positional_; }

  // Typed helpers: true if the key was provided and parsed completely.
  bool getU64(std::string_view key, unsigned long long& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const auto val = std::strtoull(v->c_str(), &end, 10);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getI64(std::string_view key, long long& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const auto val = std::strtoll(v->c_str(), &end, 10);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getInt(std::string_view key, int& out) const {
    long long v = 0;
    if (!getI64(key, v)) return false;
    out = static_cast<int>(v);
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const auto val = std::strtod(v->c_str(), &end);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

private:
  static bool looksLikeNumber(std::string_view s) {
    if (s.empty()) return false;
    char* end = nullptr;
    const std::string tmp(s);
    std::strtod(tmp.c_str(), &end);
    return end != tmp.c_str() && *end == '\0';
  }

  static bool isSwitch(const char* s) {
    if (!s || s[0] != '-' || s[1] == '\0') return false;
    return !looksLikeNumber(s);
  }

  std::string program_;
  std::unordered_map<std::string, int> arity_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace orrery::core
