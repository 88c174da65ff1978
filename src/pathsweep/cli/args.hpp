#pragma once
#include <string>
#include <stdexcept>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the subcommand.
      Example:   prog SUBCMD --in=a.gif --out=b.gif
    - Keys are case-sensitive.

  Notes:
    - A missing key returns the default value.
    - A malformed number throws std::invalid_argument naming the key.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

/* Get int value for "--key=value". Returns 'def' if missing. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + key + ": not an integer: '" + v + "'");
    }
    if (used != v.size()) throw std::invalid_argument("--" + key + ": not an integer: '" + v + "'");
    return out;
}

/* Get double value for "--key=value". Returns 'def' if missing. */
inline double argValueDouble(int argc, char** argv, const std::string& key, double def) {
    std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + key + ": not a number: '" + v + "'");
    }
    if (used != v.size()) throw std::invalid_argument("--" + key + ": not a number: '" + v + "'");
    return out;
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}
