#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orrery::core {

// Console variables ("CVars"): named, typed, runtime-tweakable settings.
//
// Config file format (one assignment per line):
//   # comment
//   mission.contact.decay = 0.02
//   log.level = "debug"
//
// Assignments to names that are not defined yet are kept as "pending" and
// applied when the variable is defined.

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

enum CVarFlags : std::uint32_t {
  CVar_None     = 0u,
  CVar_Archive  = 1u << 0, // written by saveFile()
  CVar_ReadOnly = 1u << 1
};

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;
using CVarListener = std::function<void(const struct CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  std::uint32_t flags{CVar_None};

  CVarValue value{};
  CVarValue defaultValue{};

  // Called after every successful set/reset.
  std::vector<CVarListener> listeners;
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  bool exists(std::string_view name) const;

  // Idempotent. Returns nullptr if the name exists with a different type.
  CVar* defineBool(std::string_view name, bool defaultValue,
                   std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue,
                  std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineFloat(std::string_view name, double defaultValue,
                    std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineString(std::string_view name, std::string defaultValue,
                     std::uint32_t flags = CVar_Archive, std::string_view help = {});

  bool         getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double       getFloat(std::string_view name, double fallback = 0.0) const;
  std::string  getString(std::string_view name, std::string_view fallback = {}) const;

  bool setBool(std::string_view name, bool v, std::string* outError = nullptr);
  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Parse `value` according to the variable's type.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  // Parse "name=value" (as passed on the command line).
  bool assign(std::string_view assignment, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Name-sorted. Only names containing `filter` (case-insensitive) if non-empty.
  std::vector<const CVar*> list(std::string_view filter = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  CVar* defineImpl(std::string_view name, CVarType type, CVarValue def,
                   std::uint32_t flags, std::string_view help);
  bool setValueImpl(std::string_view name, CVarValue v, std::string* outError);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

// Process-wide registry used by the tools.
CVarRegistry& cvars();

// Registers core variables (log.level) on `registry`. Safe to call repeatedly.
void installDefaultCVars(CVarRegistry& registry = cvars());

} // namespace orrery::core
