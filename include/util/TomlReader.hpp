#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace procsight::util {

// Flat subset of TOML: [section] headers and key = value pairs. Values are
// strings, bare numbers or booleans; a trailing "# ..." outside quotes is a
// comment. Keys before the first header live in the "" section.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    malformed_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    Section* current = &section_for("");
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']' || sv.size() < 3) { malformed_.push_back(lineno); continue; }
        current = &section_for(std::string(trim(sv.substr(1, sv.size() - 2))));
        continue;
      }
      auto eq = sv.find('=');
      auto key = eq == std::string_view::npos ? std::string_view{} : trim(sv.substr(0, eq));
      if (key.empty()) { malformed_.push_back(lineno); continue; }
      current->put(std::string(key), unquote(trim(sv.substr(eq + 1))));
    }
    return true;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return raw(section, key).has_value();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    auto v = raw(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    return get_number<int>(section, key, def);
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    return get_number<double>(section, key, def);
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    auto v = raw(section, key);
    if (!v) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

  // Section names in file order; "" only when it holds keys.
  [[nodiscard]] std::vector<std::string> sections() const {
    std::vector<std::string> out;
    for (const auto& s : sections_)
      if (!s.name.empty() || !s.entries.empty()) out.push_back(s.name);
    return out;
  }

  [[nodiscard]] std::vector<std::string> keys(std::string_view section) const {
    std::vector<std::string> out;
    if (const auto* s = find(section))
      for (const auto& e : s->entries) out.push_back(e.first);
    return out;
  }

  // 1-based numbers of lines that were neither a header nor key = value.
  [[nodiscard]] const std::vector<size_t>& malformed_lines() const { return malformed_; }

private:
  struct Section {
    std::string name;
    std::vector<std::pair<std::string, std::string>> entries;

    void put(std::string key, std::string val) {
      for (auto& e : entries)
        if (e.first == key) { e.second = std::move(val); return; }
      entries.emplace_back(std::move(key), std::move(val));
    }
  };

  std::vector<Section> sections_;
  std::vector<size_t> malformed_;

  Section& section_for(std::string name) {
    for (auto& s : sections_)
      if (s.name == name) return s;
    sections_.push_back(Section{std::move(name), {}});
    return sections_.back();
  }

  [[nodiscard]] const Section* find(std::string_view name) const {
    for (const auto& s : sections_)
      if (s.name == name) return &s;
    return nullptr;
  }

  [[nodiscard]] std::optional<std::string> raw(std::string_view section, std::string_view key) const {
    if (const auto* s = find(section))
      for (const auto& e : s->entries)
        if (e.first == key) return e.second;
    return std::nullopt;
  }

  template <class T>
  [[nodiscard]] T get_number(std::string_view section, std::string_view key, T def) const {
    auto v = raw(section, key);
    if (!v || v->empty()) return def;
    T out = def;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) return def;
    return out;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string unquote(std::string_view sv) {
    if (sv.size() >= 2 && sv.front() == '"' && sv.back() == '"') sv = sv.substr(1, sv.size() - 2);
    return std::string(sv);
  }
};

} // namespace procsight::util
