#include "app/MetricsServer.hpp"
#include <charconv>

namespace procsight::app {

namespace {

// "GET /metrics HTTP/1.1" -> "/metrics"; empty unless the method is GET
std::string_view request_target(std::string_view line) {
  if (!line.starts_with("GET ")) return {};
  line.remove_prefix(4);
  auto sp = line.find(' ');
  auto target = line.substr(0, sp);
  auto q = target.find('?');
  return target.substr(0, q);
}

} // namespace

HttpResponse route_request(std::string_view request_line, const SnapshotBuffers& buffers) {
  HttpResponse resp;
  auto target = request_target(request_line);

  if (target == "/metrics") {
    resp.content_type = "text/plain; version=0.0.4; charset=utf-8";
    resp.body = snapshot_to_prometheus(buffers.read());
  } else if (target == "/healthz") {
    resp.body = "ok seq=";
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), buffers.seq());
    resp.body.append(buf, ptr);
    resp.body += '\n';
  } else if (target == "/") {
    resp.body = "procsight: use /metrics\n";
  } else {
    resp.status = 404;
    resp.reason = "Not Found";
    resp.body = "404 Not Found\n";
  }
  return resp;
}

std::string response_headers(const HttpResponse& resp) {
  std::string h = "HTTP/1.1 ";
  char buf[24];
  auto [sptr, sec] = std::to_chars(buf, buf + sizeof(buf), resp.status);
  h.append(buf, sptr);
  h += ' ';
  h += resp.reason;
  h += "\r\nContent-Type: ";
  h += resp.content_type;
  h += "\r\nConnection: close\r\nContent-Length: ";
  auto [lptr, lec] = std::to_chars(buf, buf + sizeof(buf), resp.body.size());
  h.append(buf, lptr);
  h += "\r\n\r\n";
  return h;
}

} // namespace procsight::app
