#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include <cstdlib>
#include <string>
#include <string_view>

namespace procsight::collectors {

static void parse_cpu_line(const std::string_view& line, procsight::model::CpuTimes& out) {
  size_t pos = line.find(' ');
  if (pos == std::string::npos) return;
  std::string_view rest = line.substr(pos + 1);
  // read 8 numbers
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      vals[i++] = std::strtoull(std::string(rest.substr(start, end - start)).c_str(), nullptr, 10);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

bool CpuCollector::sample(double& usage_pct) {
  auto txt_opt = procsight::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  auto eol = txt.find('\n');
  std::string_view first(txt.data(), eol == std::string::npos ? txt.size() : eol);
  if (!first.starts_with("cpu ")) return false;
  procsight::model::CpuTimes agg{};
  parse_cpu_line(first, agg);

  usage_pct = 0.0;
  if (has_last_ && agg.total() > last_total_.total()) {
    auto td = agg.total() - last_total_.total();
    auto wd = agg.work() > last_total_.work() ? agg.work() - last_total_.work() : 0;
    usage_pct = 100.0 * static_cast<double>(wd) / static_cast<double>(td);
  }
  last_total_ = agg; has_last_ = true;
  return true;
}

} // namespace procsight::collectors
