#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace fomin {

/**
 * @brief Flat `key: value` configuration file.
 * @details Blank lines and lines starting with '#' are skipped; values may be quoted.
 *          Missing files produce an empty configuration, so every getter falls back.
 */
class SimpleConfig {
public:
  static SimpleConfig load(const std::string &path) {
    SimpleConfig cfg;
    std::ifstream in(path);
    if (!in) {
      return cfg;
    }
    cfg.loaded_ = true;

    std::string line;
    while (std::getline(in, line)) {
      cfg.parseLine(line);
    }
    return cfg;
  }

  /// @brief Build a configuration from in-memory text (same syntax as files).
  static SimpleConfig parse(const std::string &text) {
    SimpleConfig cfg;
    cfg.loaded_ = true;
    std::size_t start = 0;
    while (start <= text.size()) {
      std::size_t end = text.find('\n', start);
      if (end == std::string::npos) end = text.size();
      cfg.parseLine(text.substr(start, end - start));
      start = end + 1;
    }
    return cfg;
  }

  bool loaded() const { return loaded_; }

  bool has(const std::string &key) const { return values_.count(key) != 0; }

  void set(const std::string &key, const std::string &value) { values_[key] = value; }

  int getInt(const std::string &key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    try {
      return std::stoi(it->second);
    } catch (const std::logic_error &) {
      return fallback;
    }
  }

  double getDouble(const std::string &key, double fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    try {
      return std::stod(it->second);
    } catch (const std::logic_error &) {
      return fallback;
    }
  }

  /// @brief Accepts true/false, yes/no, on/off and 1/0 (case-insensitive).
  bool getBool(const std::string &key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return fallback;
  }

  std::string getString(const std::string &key, const std::string &fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    return it->second;
  }

private:
  void parseLine(const std::string &line) {
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      return;
    }
    std::size_t sep = trimmed.find(':');
    if (sep == std::string::npos) {
      return;
    }
    std::string key = trim(trimmed.substr(0, sep));
    std::string value = trim(trimmed.substr(sep + 1));
    if (value.size() >= 2) {
      char first = value.front();
      char last = value.back();
      if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        value = value.substr(1, value.size() - 2);
      }
    }
    if (!key.empty()) {
      values_[key] = value;
    }
  }

  static std::string trim(const std::string &input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) {
      ++start;
    }
    if (start == input.size()) {
      return "";
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
      --end;
    }
    return input.substr(start, end - start);
  }

  bool loaded_ = false;
  std::unordered_map<std::string, std::string> values_;
};

} // namespace fomin
