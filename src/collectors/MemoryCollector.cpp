#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <optional>
#include <system_error>

namespace procsight::collectors {

namespace {

struct Fields {
  uint64_t total{}, free{}, available{}, buffers{}, cached{};
  bool have_available{false};
};

// "Key:   1234 kB" -> 1234
std::optional<uint64_t> value_kb(std::string_view rest) {
  size_t i = rest.find_first_not_of(" \t");
  if (i == std::string_view::npos) return std::nullopt;
  uint64_t v = 0;
  auto r = std::from_chars(rest.data() + i, rest.data() + rest.size(), v);
  if (r.ec != std::errc{}) return std::nullopt;
  return v;
}

} // namespace

bool MemoryCollector::parse_meminfo(std::string_view text, MemoryInfo& out) {
  Fields f;
  while (!text.empty()) {
    auto nl = text.find('\n');
    auto line = text.substr(0, nl);
    text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
    auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    auto key = line.substr(0, colon);
    auto v = value_kb(line.substr(colon + 1));
    if (!v) continue;
    if (key == "MemTotal") f.total = *v;
    else if (key == "MemFree") f.free = *v;
    else if (key == "MemAvailable") { f.available = *v; f.have_available = true; }
    else if (key == "Buffers") f.buffers = *v;
    else if (key == "Cached") f.cached = *v;
  }
  if (f.total == 0) return false;

  out.total_kb = f.total;
  out.available_kb = f.have_available ? f.available : f.free + f.buffers + f.cached;
  if (out.available_kb > f.total) out.available_kb = f.total;
  out.used_kb = f.total - out.available_kb;
  out.used_pct = 100.0 * static_cast<double>(out.used_kb) / static_cast<double>(out.total_kb);
  return true;
}

bool MemoryCollector::sample(MemoryInfo& out) const {
  auto txt = procsight::util::read_file_string("/proc/meminfo");
  return txt && parse_meminfo(*txt, out);
}

} // namespace procsight::collectors
