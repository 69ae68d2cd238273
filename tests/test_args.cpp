#include "orrery/core/Args.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static std::vector<char*> makeArgv(std::initializer_list<const char*> items) {
  std::vector<char*> argv;
  argv.reserve(items.size());
  for (const char* s : items) {
    argv.push_back(const_cast<char*>(s));
  }
  return argv;
}

int test_args() {
  int fails = 0;

  using orrery::core::Args;

  // Galactic positions are routinely negative: "--pos -1 -2.5 3" must not turn into switches.
  {
    auto argv = makeArgv({"orrery_sandbox",
                          "--pos", "-1", "-2.5", "3",
                          "--radius", "-50.5"});
    Args args;
    args.setArity("pos", 3);
    args.parse((int)argv.size(), argv.data());

    const auto pos = args.values("pos");
    if (pos.size() != 3 || pos[0] != "-1" || pos[1] != "-2.5" || pos[2] != "3") {
      std::cerr << "[test_args] expected --pos -1 -2.5 3, got size=" << pos.size() << "\n";
      ++fails;
    }

    double radius = 0.0;
    if (!args.getDouble("radius", radius) || std::abs(radius - (-50.5)) > 1e-9) {
      std::cerr << "[test_args] expected --radius -50.5 to parse\n";
      ++fails;
    }
  }

  // Sector coordinates with arity 3 and a trailing flag.
  {
    auto argv = makeArgv({"orrery_sandbox", "--sector", "0", "-3", "12", "--board"});
    Args args;
    args.setArity("sector", 3);
    args.parse((int)argv.size(), argv.data());

    const auto sec = args.values("sector");
    if (sec.size() != 3 || sec[1] != "-3" || sec[2] != "12") {
      std::cerr << "[test_args] expected --sector 0 -3 12\n";
      ++fails;
    }
    if (!args.hasFlag("board")) {
      std::cerr << "[test_args] expected --board to be a flag\n";
      ++fails;
    }
  }

  // --key=value and repeated keys: last() returns the newest, values() keeps all.
  {
    auto argv = makeArgv({"orrery_sandbox", "--seed=7", "--set", "log.level=debug", "--set", "galaxy.factions=6"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    unsigned long long seed = 0;
    if (!args.getU64("seed", seed) || seed != 7) {
      std::cerr << "[test_args] expected --seed=7 to parse\n";
      ++fails;
    }

    const auto sets = args.values("set");
    if (sets.size() != 2 || sets[0] != "log.level=debug") {
      std::cerr << "[test_args] expected two --set values\n";
      ++fails;
    }
    const auto last = args.last("set");
    if (!last || *last != "galaxy.factions=6") {
      std::cerr << "[test_args] expected last --set to be galaxy.factions=6\n";
      ++fails;
    }
  }

  // Typed getters reject trailing garbage.
  {
    auto argv = makeArgv({"orrery_sandbox", "--index", "3x", "--time", "12.5s"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    int index = -1;
    double t = -1.0;
    if (args.getInt("index", index) || index != -1) {
      std::cerr << "[test_args] expected --index 3x to be rejected\n";
      ++fails;
    }
    if (args.getDouble("time", t)) {
      std::cerr << "[test_args] expected --time 12.5s to be rejected\n";
      ++fails;
    }
  }

  // The end-of-options marker should force everything after it to be positional.
  {
    auto argv = makeArgv({"orrery_sandbox", "--flag", "--", "--notAFlag", "-x", "pos"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("flag")) {
      std::cerr << "[test_args] expected --flag to be recognized\n";
      ++fails;
    }
    if (args.hasFlag("notAFlag") || args.hasFlag("x")) {
      std::cerr << "[test_args] expected tokens after -- to NOT be parsed as flags\n";
      ++fails;
    }
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "--notAFlag" || pos[1] != "-x" || pos[2] != "pos") {
      std::cerr << "[test_args] expected 3 positional args after --, got size=" << pos.size() << "\n";
      ++fails;
    }
  }

  // A lone '-' is a value (stdin/stdout placeholder), not a switch.
  {
    auto argv = makeArgv({"orrery_sandbox", "--save", "-"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (args.hasFlag("save")) {
      std::cerr << "[test_args] expected --save - to be parsed as a key/value, not a flag\n";
      ++fails;
    }

    const auto v = args.last("save");
    if (!v || *v != "-") {
      std::cerr << "[test_args] expected --save to have value '-'\n";
      ++fails;
    }
  }

  // Negative numbers that appear as positional args should stay positional (not become short flags).
  {
    auto argv = makeArgv({"orrery_sandbox", "-1", "-0.25", "-.5"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "-1" || pos[1] != "-0.25" || pos[2] != "-.5") {
      std::cerr << "[test_args] expected negative positional args to remain positional\n";
      ++fails;
    }
  }

  // Short flag parsing should still work.
  {
    auto argv = makeArgv({"orrery_sandbox", "-hv"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    if (!args.hasFlag("h") || !args.hasFlag("v")) {
      std::cerr << "[test_args] expected -hv to set flags h and v\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_args] pass\n";
  return fails;
}
