#include "collectors/ProcessCollector.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <charconv>
#include <sstream>
#include <unistd.h>

namespace procsight::collectors {

ProcessCollector::ProcessCollector(size_t max_procs) : max_procs_(max_procs) {}

static uint64_t read_cpu_total() {
  auto txt = procsight::util::read_file_string("/proc/stat"); if (!txt) return 0;
  std::istringstream ss(*txt); std::string line; if (!std::getline(ss, line)) return 0;
  // parse after 'cpu '
  size_t pos = line.find(' '); if (pos == std::string::npos) return 0;
  std::string_view rest(line.c_str() + pos + 1);
  uint64_t vals[8]{}; int i=0; size_t start=0;
  while (i<8 && start<rest.size()) {
    while (start<rest.size() && (rest[start]==' '||rest[start]=='\t')) ++start;
    size_t end=start; while (end<rest.size() && rest[end]>='0'&&rest[end]<='9') ++end;
    if (end>start) { std::from_chars(rest.data()+start, rest.data()+end, vals[i++]); }
    start=end+1;
  }
  uint64_t total=0; for (int j=0;j<8;++j) total+=vals[j]; return total;
}

static int64_t wall_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::system_clock::now().time_since_epoch()).count();
}

bool ProcessCollector::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may contain spaces and parens; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp==std::string::npos||rp==std::string::npos||rp<lp||rp+2>content.size()) return false;
  out.comm = content.substr(lp+1, rp-lp-1);
  std::istringstream ss(content.substr(rp+2));
  std::string tmp;
  int32_t ppid = 0;
  if (!(ss >> out.state >> ppid)) return false;
  // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
  for (int i=0;i<9;i++) ss >> tmp;
  if (!(ss >> out.utime >> out.stime)) return false;
  ss >> tmp >> tmp; // cutime, cstime
  int32_t nice = 0;
  if (!(ss >> out.priority >> nice >> out.threads)) return false;
  ss >> tmp >> tmp >> tmp; // itrealvalue, starttime, vsize
  if (!(ss >> out.rss_pages)) return false;
  return true;
}

bool ProcessCollector::parse_io(const std::string& content, uint64_t& read_bytes, uint64_t& write_bytes) {
  bool got_r = false, got_w = false;
  std::istringstream ss(content); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("read_bytes:", 0) == 0) { read_bytes = std::strtoull(line.c_str() + 11, nullptr, 10); got_r = true; }
    else if (line.rfind("write_bytes:", 0) == 0) { write_bytes = std::strtoull(line.c_str() + 12, nullptr, 10); got_w = true; }
  }
  return got_r && got_w;
}

bool ProcessCollector::sample(procsight::model::ProcessTable& out) {
  const auto now = std::chrono::steady_clock::now();
  const double elapsed_s = have_last_ ? std::chrono::duration<double>(now - last_run_).count() : 0.0;
  const int64_t stamp = wall_ms();
  const uint64_t cpu_total = read_cpu_total();
  if (cpu_total == 0) return false;
  if (ncpu_ == 0) ncpu_ = procsight::util::cpu_count();
  const uint64_t dt = (have_last_ && cpu_total > last_cpu_total_) ? cpu_total - last_cpu_total_ : 0;
  const double page_mib = static_cast<double>(::getpagesize()) / (1024.0 * 1024.0);

  out.processes.clear();
  std::unordered_map<int32_t, Prev> seen;
  for (auto& name : procsight::util::list_dir("/proc")) {
    if (name.empty() || name[0]<'0' || name[0]>'9') continue; // numeric
    const int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    const std::string base = "/proc/" + name;
    auto stat_txt = procsight::util::read_file_string(base + "/stat");
    StatFields st;
    // exited between listing and reading
    if (!stat_txt || !parse_stat_line(*stat_txt, st)) continue;

    Prev cur{st.utime + st.stime, 0, 0};
    bool have_io = false;
    if (auto io_txt = procsight::util::read_file_string(base + "/io"))
      have_io = parse_io(*io_txt, cur.read_bytes, cur.write_bytes);

    procsight::model::Sample s;
    s.pid = pid;
    s.name = st.comm;
    s.timestamp_ms = stamp;
    s.threads = st.threads > 0 ? st.threads : 1;
    s.priority = st.priority;
    s.memory = st.rss_pages > 0 ? static_cast<double>(st.rss_pages) * page_mib : 0.0;
    auto it = last_per_proc_.find(pid);
    if (it != last_per_proc_.end()) {
      const Prev& p = it->second;
      if (dt > 0 && cur.total_time > p.total_time)
        s.cpu = 100.0 * static_cast<double>(cur.total_time - p.total_time) / static_cast<double>(dt) * static_cast<double>(ncpu_);
      if (have_io && elapsed_s > 0.0) {
        if (cur.read_bytes > p.read_bytes) s.io_read = static_cast<double>(cur.read_bytes - p.read_bytes) / elapsed_s;
        if (cur.write_bytes > p.write_bytes) s.io_write = static_cast<double>(cur.write_bytes - p.write_bytes) / elapsed_s;
      }
    }
    seen.emplace(pid, cur);
    out.processes.push_back(std::move(s));
  }
  out.total_processes = out.processes.size();

  // Efficient top-K selection (K = max_procs_): partition then sort top K
  auto busier = [](const auto& a, const auto& b){ return a.cpu > b.cpu; };
  if (out.processes.size() > max_procs_) {
    auto nth = out.processes.begin() + static_cast<std::ptrdiff_t>(max_procs_);
    std::nth_element(out.processes.begin(), nth, out.processes.end(), busier);
    out.processes.resize(max_procs_);
  }
  std::sort(out.processes.begin(), out.processes.end(), busier);

  last_per_proc_ = std::move(seen);
  last_cpu_total_ = cpu_total;
  last_run_ = now;
  have_last_ = true;
  return true;
}

} // namespace procsight::collectors
