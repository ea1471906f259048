#include "chaosmagnet/network.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <string.h>  // explicit_bzero

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "chaosmagnet/hash.hpp"
#include "chaosmagnet/jsonlite.hpp"
#include "chaosmagnet/version.hpp"

namespace chaosmagnet {

namespace {

constexpr std::size_t kMaxRequestBytes = 64 * 1024;
constexpr std::chrono::milliseconds kAcceptPoll{200};
constexpr const char* kPeerIngestPath = "/ingest";

struct timeval to_timeval(std::chrono::milliseconds d) {
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(d.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((d.count() % 1000) * 1000);
  return tv;
}

bool set_io_timeouts(int fd, std::chrono::milliseconds timeout) {
  const struct timeval tv = to_timeval(timeout);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool send_all(int fd, const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

// Non-blocking connect bounded by timeout, then back to blocking mode with
// SO_RCVTIMEO/SO_SNDTIMEO set.
UniqueFd connect_with_timeout(const std::string& host, std::uint16_t port,
                              std::chrono::milliseconds timeout, std::string* error) {
  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  const int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  if (rc != 0) {
    *error = std::string("resolve ") + host + ": " + ::gai_strerror(rc);
    return UniqueFd();
  }
  std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

  for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    UniqueFd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol));
    if (!fd.valid()) {
      *error = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        *error = "connect " + host + ":" + port_str + ": " + std::strerror(errno);
        continue;
      }
      struct pollfd pfd{};
      pfd.fd = fd.get();
      pfd.events = POLLOUT;
      const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
      if (ready <= 0) {
        *error = "connect " + host + ":" + port_str + ": timed out";
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
        *error = "connect " + host + ":" + port_str + ": " + std::strerror(so_error != 0 ? so_error : errno);
        continue;
      }
    }
    const int flags = ::fcntl(fd.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd.get(), F_SETFL, flags & ~O_NONBLOCK) != 0 || !set_io_timeouts(fd.get(), timeout)) {
      *error = std::string("socket options: ") + std::strerror(errno);
      continue;
    }
    return fd;
  }
  return UniqueFd();
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Content-Length from a raw header block; 0 when absent or malformed.
std::size_t content_length(const std::string& headers) {
  const std::string lowered = lower(headers);
  const std::string key = "\r\ncontent-length:";
  const auto pos = lowered.find(key);
  if (pos == std::string::npos) return 0;
  std::size_t i = pos + key.size();
  while (i < lowered.size() && lowered[i] == ' ') ++i;
  std::size_t value = 0;
  bool any = false;
  while (i < lowered.size() && std::isdigit(static_cast<unsigned char>(lowered[i]))) {
    value = value * 10 + static_cast<std::size_t>(lowered[i] - '0');
    if (value > kMaxRequestBytes) return kMaxRequestBytes + 1;
    any = true;
    ++i;
  }
  return any ? value : 0;
}

void respond(int fd, int status, const char* reason) {
  const std::string resp = "HTTP/1.1 " + std::to_string(status) + " " + reason +
                           "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
  // Best effort: the peer may already be gone.
  if (!send_all(fd, resp)) return;
}

std::string peer_name(const struct sockaddr_storage& addr) {
  char host[INET6_ADDRSTRLEN] = {0};
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const struct sockaddr_in*>(&addr);
    if (::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host)) == nullptr) return "unknown";
    return std::string(host) + ":" + std::to_string(ntohs(in->sin_port));
  }
  if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(&addr);
    if (::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host)) == nullptr) return "unknown";
    return "[" + std::string(host) + "]:" + std::to_string(ntohs(in6->sin6_port));
  }
  return "unknown";
}

bool bind_listener(std::uint16_t port, UniqueFd* out, std::uint16_t* bound, std::string* error) {
  UniqueFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
  if (!fd.valid()) {
    *error = std::string("socket: ") + std::strerror(errno);
    return false;
  }
  int opt = 1;
  if (::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
    *error = std::string("SO_REUSEADDR: ") + std::strerror(errno);
    return false;
  }
  struct sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_ANY);
  address.sin_port = htons(port);
  if (::bind(fd.get(), reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) != 0) {
    *error = "bind port " + std::to_string(port) + ": " + std::strerror(errno);
    return false;
  }
  if (::listen(fd.get(), 16) != 0) {
    *error = std::string("listen: ") + std::strerror(errno);
    return false;
  }
  socklen_t len = sizeof(address);
  if (::getsockname(fd.get(), reinterpret_cast<struct sockaddr*>(&address), &len) != 0) {
    *error = std::string("getsockname: ") + std::strerror(errno);
    return false;
  }
  *bound = ntohs(address.sin_port);
  *out = std::move(fd);
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Frames
// ---------------------------------------------------------------------------

std::string frame_to_json(const NetworkFrame& f) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["sender_id"] = Value{f.sender_id};
  o["sequence"] = Value{f.sequence};
  o["timestamp"] = Value{f.timestamp_unix_ms};
  o["whitened_payload"] = Value{f.whitened_payload_hex};
  o["metrics_digest"] = Value{f.metrics_digest};
  o["frame_version"] = Value{static_cast<std::uint64_t>(f.frame_version)};
  return jsonlite::to_json(Value{std::move(o)});
}

bool frame_from_json(const std::string& text, NetworkFrame* out, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(text, &err);
  if (err) {
    *error = err->code + ": " + err->message;
    return false;
  }
  for (const char* key : {"sender_id", "whitened_payload", "metrics_digest"}) {
    const auto it = o.find(key);
    if (it == o.end() || !std::holds_alternative<std::string>(it->second.v)) {
      *error = std::string("missing or non-string field: ") + key;
      return false;
    }
  }
  for (const char* key : {"sequence", "timestamp", "frame_version"}) {
    const auto it = o.find(key);
    if (it == o.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) {
      *error = std::string("missing or non-integer field: ") + key;
      return false;
    }
  }
  NetworkFrame f;
  f.sender_id = jsonlite::get_string(o, "sender_id");
  f.sequence = jsonlite::get_u64(o, "sequence");
  f.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp");
  f.whitened_payload_hex = jsonlite::get_string(o, "whitened_payload");
  f.metrics_digest = jsonlite::get_string(o, "metrics_digest");
  f.frame_version = static_cast<std::uint32_t>(jsonlite::get_u64(o, "frame_version"));

  if (f.frame_version == 0 || f.frame_version > version::FRAME_FORMAT_VERSION) {
    *error = "unsupported frame_version " + std::to_string(f.frame_version);
    return false;
  }
  if (!from_hex(f.whitened_payload_hex, nullptr)) {
    *error = "whitened_payload is not hex";
    return false;
  }
  *out = std::move(f);
  return true;
}

NetworkFrame build_frame(const std::string& sender_id, std::uint64_t sequence, const EngineSnapshot& snapshot) {
  std::string material(reinterpret_cast<const char*>(snapshot.pool.bytes.data()), snapshot.pool.bytes.size());
  for (int i = 0; i < 8; ++i) material.push_back(static_cast<char>((sequence >> (8 * i)) & 0xFF));
  std::string whitened = derive_key_bytes(kFrameWhiteningContext, material, kPoolSize);

  jsonlite::Object metrics;
  for (const auto& s : snapshot.sources) {
    jsonlite::Object entry;
    entry["health"] = jsonlite::Value{to_string(s.last_health_result)};
    entry["metrics"] = metrics_to_value(s.metrics);
    metrics[s.source_id] = jsonlite::Value{std::move(entry)};
  }

  NetworkFrame f;
  f.sender_id = sender_id;
  f.sequence = sequence;
  f.timestamp_unix_ms = unix_time_ms();
  f.whitened_payload_hex = to_hex(whitened);
  f.metrics_digest = metrics_digest_hash(jsonlite::to_json(jsonlite::Value{std::move(metrics)}));
  f.frame_version = version::FRAME_FORMAT_VERSION;
  explicit_bzero(material.data(), material.size());
  explicit_bzero(whitened.data(), whitened.size());
  return f;
}

// ---------------------------------------------------------------------------
// HTTP
// ---------------------------------------------------------------------------

HttpResult http_post_json(const std::string& host, std::uint16_t port, const std::string& path,
                          const std::string& body, std::chrono::milliseconds timeout) {
  HttpResult result;
  UniqueFd fd = connect_with_timeout(host, port, timeout, &result.error);
  if (!fd.valid()) return result;

  std::string request = "POST " + (path.empty() ? std::string("/") : path) + " HTTP/1.1\r\n";
  request += "Host: " + host + ":" + std::to_string(port) + "\r\n";
  request += "Content-Type: application/json\r\n";
  request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  request += "Connection: close\r\n\r\n";
  request += body;
  if (!send_all(fd.get(), request)) {
    result.error = std::string("send: ") + std::strerror(errno);
    return result;
  }

  // Only the status line matters.
  std::string response;
  char buf[512];
  while (response.find("\r\n") == std::string::npos && response.size() < 4096) {
    const ssize_t n = ::recv(fd.get(), buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    response.append(buf, static_cast<std::size_t>(n));
  }
  const auto eol = response.find("\r\n");
  if (eol == std::string::npos || response.compare(0, 5, "HTTP/") != 0) {
    result.error = "no HTTP status line from " + host + ":" + std::to_string(port);
    return result;
  }
  const auto sp = response.find(' ');
  if (sp == std::string::npos || sp + 4 > eol) {
    result.error = "malformed status line";
    return result;
  }
  result.status = std::atoi(response.substr(sp + 1, 3).c_str());
  result.ok = result.status >= 200 && result.status < 300;
  if (!result.ok) result.error = "HTTP " + std::to_string(result.status);
  return result;
}

namespace {

struct RetryPolicy {
  std::uint32_t max_attempts{1};
  std::uint32_t backoff_base_ms{0};
  std::chrono::milliseconds timeout{0};
};

struct Delivery {
  bool delivered{false};
  bool interrupted{false};
  std::uint32_t attempts{0};
  std::string last_error;
};

// Posts body until it is accepted or max_attempts is reached, sleeping
// backoff_base_ms * 2^n before retry n+1. wait returns false when the owner
// is stopping; the frame is then abandoned without counting as dropped.
Delivery post_with_backoff(const std::string& host, std::uint16_t port, const std::string& path,
                           const std::string& body, const RetryPolicy& policy,
                           const std::function<bool(std::chrono::milliseconds)>& wait,
                           const std::function<void(std::uint32_t, std::uint64_t, const std::string&)>& on_retry) {
  Delivery d;
  for (std::uint32_t attempt = 0; attempt < policy.max_attempts; ++attempt) {
    if (attempt > 0) {
      const std::uint64_t backoff = static_cast<std::uint64_t>(policy.backoff_base_ms)
                                    << std::min<std::uint32_t>(attempt - 1, 16);
      on_retry(attempt + 1, backoff, d.last_error);
      if (!wait(std::chrono::milliseconds(backoff))) {
        d.interrupted = true;
        return d;
      }
    }
    ++d.attempts;
    const HttpResult r = http_post_json(host, port, path, body, policy.timeout);
    if (r.ok) {
      d.delivered = true;
      return d;
    }
    d.last_error = r.error;
  }
  return d;
}

}  // namespace

// ---------------------------------------------------------------------------
// UplinkClient
// ---------------------------------------------------------------------------

UplinkClient::UplinkClient(std::string sender_id, SnapshotProvider provider, EventLog& events, EngineStats& stats)
    : sender_id_(std::move(sender_id)), provider_(std::move(provider)), events_(events), stats_(stats) {}

UplinkClient::~UplinkClient() { stop(); }

void UplinkClient::stop_worker() {
  std::thread joining;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
    joining = std::move(thread_);
  }
  cv_.notify_all();
  if (joining.joinable()) joining.join();
}

void UplinkClient::configure(const UplinkConfig& cfg) {
  stop_worker();
  std::lock_guard<std::mutex> lk(mu_);
  stopping_ = false;
  triggered_ = false;
  cfg_ = cfg;
  if (cfg_.enabled) thread_ = std::thread([this] { loop(); });
}

void UplinkClient::trigger() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!cfg_.enabled) return;
    triggered_ = true;
  }
  cv_.notify_all();
}

void UplinkClient::stop() {
  stop_worker();
  std::lock_guard<std::mutex> lk(mu_);
  cfg_.enabled = false;
}

UplinkConfig UplinkClient::config() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cfg_;
}

bool UplinkClient::enabled() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cfg_.enabled;
}

bool UplinkClient::wait_interruptible(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, d, [this] { return stopping_; });
  return !stopping_;
}

void UplinkClient::loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stopping_) {
    cv_.wait_for(lock, std::chrono::milliseconds(cfg_.interval_ms), [this] { return stopping_ || triggered_; });
    if (stopping_) return;
    triggered_ = false;
    const UplinkConfig cfg = cfg_;
    const std::uint64_t seq = ++sequence_;
    lock.unlock();

    const NetworkFrame frame = build_frame(sender_id_, seq, provider_());
    send_with_retry(frame, cfg);

    lock.lock();
  }
}

bool UplinkClient::send_with_retry(const NetworkFrame& frame, const UplinkConfig& cfg) {
  const std::string body = frame_to_json(frame);
  const std::string target = uplink_target(cfg);
  const RetryPolicy policy{cfg.max_attempts, cfg.backoff_base_ms, std::chrono::milliseconds(cfg.timeout_ms)};

  const Delivery d = post_with_backoff(
      cfg.host, cfg.port, cfg.path, body, policy,
      [this](std::chrono::milliseconds w) { return wait_interruptible(w); },
      [&](std::uint32_t attempt, std::uint64_t backoff, const std::string& error) {
        events_.emit(EventKind::uplink_retry, target, false,
                     "attempt " + std::to_string(attempt) + " in " + std::to_string(backoff) + "ms: " + error);
      });
  stats_.uplink_failed_attempts.fetch_add(d.attempts - (d.delivered ? 1 : 0), std::memory_order_relaxed);
  if (d.delivered) {
    stats_.uplink_sent.fetch_add(1, std::memory_order_relaxed);
    events_.emit(EventKind::uplink_sent, target, true, "seq " + std::to_string(frame.sequence));
    return true;
  }
  if (d.interrupted) return false;
  stats_.uplink_dropped.fetch_add(1, std::memory_order_relaxed);
  events_.emit(EventKind::uplink_dropped, target, false,
               "dropped seq " + std::to_string(frame.sequence) + " after " + std::to_string(d.attempts) +
                   " attempts: " + d.last_error);
  return false;
}

// ---------------------------------------------------------------------------
// P2pNode
// ---------------------------------------------------------------------------

P2pNode::P2pNode(std::string sender_id, SnapshotProvider provider, EventLog& events, EngineStats& stats)
    : sender_id_(std::move(sender_id)), provider_(std::move(provider)), events_(events), stats_(stats) {}

P2pNode::~P2pNode() { stop(); }

void P2pNode::stop_threads(std::unique_lock<std::mutex>& lock) {
  stopping_ = true;
  listening_.store(false, std::memory_order_release);
  std::thread listener = std::move(listener_);
  std::thread sender = std::move(sender_);
  lock.unlock();
  cv_.notify_all();
  if (listener.joinable()) listener.join();
  if (sender.joinable()) sender.join();
  lock.lock();
  stopping_ = false;
  listen_fd_.reset();
  bound_port_.store(0, std::memory_order_release);
}

ErrorCode P2pNode::configure(const P2pConfig& cfg) {
  std::unique_lock<std::mutex> lock(mu_);
  const bool rebind = !cfg.enabled || !cfg_.enabled || !listening_.load(std::memory_order_acquire) ||
                      cfg.listen_port != cfg_.listen_port;
  if (!rebind) {
    cfg_ = cfg;
    lock.unlock();
    cv_.notify_all();
    return ErrorCode::none;
  }

  stop_threads(lock);
  cfg_ = cfg;
  if (!cfg.enabled) return ErrorCode::none;

  UniqueFd fd;
  std::uint16_t bound = 0;
  std::string error;
  if (!bind_listener(cfg.listen_port, &fd, &bound, &error)) {
    cfg_.enabled = false;
    events_.emit(EventKind::p2p_listen_failed, "", false, error);
    return ErrorCode::network_failed;
  }
  listen_fd_ = std::move(fd);
  bound_port_.store(bound, std::memory_order_release);
  listening_.store(true, std::memory_order_release);
  const int raw_fd = listen_fd_.get();
  listener_ = std::thread([this, raw_fd] { listen_loop(raw_fd); });
  sender_ = std::thread([this] { send_loop(); });
  events_.emit(EventKind::p2p_listening, "", true, "listening on port " + std::to_string(bound));
  return ErrorCode::none;
}

void P2pNode::stop() {
  std::unique_lock<std::mutex> lock(mu_);
  stop_threads(lock);
  cfg_.enabled = false;
}

P2pConfig P2pNode::config() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cfg_;
}

bool P2pNode::enabled() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cfg_.enabled;
}

std::vector<NetworkFrame> P2pNode::recent_frames() const {
  std::lock_guard<std::mutex> lk(frames_mu_);
  return std::vector<NetworkFrame>(recent_.begin(), recent_.end());
}

void P2pNode::listen_loop(int fd) {
  while (listening_.load(std::memory_order_acquire)) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd, &readfds);
    struct timeval tv = to_timeval(kAcceptPoll);
    const int ready = ::select(fd + 1, &readfds, nullptr, nullptr, &tv);
    if (ready <= 0) continue;

    struct sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    UniqueFd client(::accept4(fd, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_CLOEXEC));
    if (!client.valid()) continue;
    handle_connection(client.get(), peer_name(addr));
  }
}

void P2pNode::handle_connection(int client_fd, const std::string& peer) {
  std::uint32_t timeout_ms;
  {
    std::lock_guard<std::mutex> lk(mu_);
    timeout_ms = cfg_.timeout_ms;
  }
  if (!set_io_timeouts(client_fd, std::chrono::milliseconds(timeout_ms))) return;

  std::string request;
  std::size_t header_end = std::string::npos;
  std::size_t body_len = 0;
  char buf[2048];
  while (request.size() <= kMaxRequestBytes) {
    if (header_end != std::string::npos && request.size() >= header_end + 4 + body_len) break;
    const ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    request.append(buf, static_cast<std::size_t>(n));
    if (header_end == std::string::npos) {
      header_end = request.find("\r\n\r\n");
      if (header_end != std::string::npos) body_len = content_length(request.substr(0, header_end + 2));
    }
  }

  if (header_end == std::string::npos || request.compare(0, 5, "POST ") != 0) {
    respond(client_fd, 400, "Bad Request");
    events_.emit(EventKind::p2p_received, peer, false, "malformed request");
    return;
  }
  if (body_len > kMaxRequestBytes || request.size() < header_end + 4 + body_len) {
    respond(client_fd, 413, "Payload Too Large");
    events_.emit(EventKind::p2p_received, peer, false, "incomplete or oversized body");
    return;
  }

  NetworkFrame frame;
  std::string error;
  if (!frame_from_json(request.substr(header_end + 4, body_len), &frame, &error)) {
    respond(client_fd, 400, "Bad Request");
    events_.emit(EventKind::p2p_received, peer, false, error);
    return;
  }
  respond(client_fd, 200, "OK");

  received_.fetch_add(1, std::memory_order_acq_rel);
  stats_.p2p_received.fetch_add(1, std::memory_order_relaxed);
  events_.emit(EventKind::p2p_received, frame.sender_id, true,
               "seq " + std::to_string(frame.sequence) + " from " + peer);
  std::lock_guard<std::mutex> lk(frames_mu_);
  recent_.push_back(std::move(frame));
  while (recent_.size() > kRecentFrames) recent_.pop_front();
}

bool P2pNode::wait_interruptible(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, d, [this] { return stopping_; });
  return !stopping_;
}

void P2pNode::send_loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stopping_) {
    cv_.wait_for(lock, std::chrono::milliseconds(cfg_.interval_ms), [this] { return stopping_; });
    if (stopping_) return;
    const P2pConfig cfg = cfg_;
    if (cfg.peers.empty()) continue;
    const std::uint64_t seq = ++sequence_;
    lock.unlock();

    const std::string body = frame_to_json(build_frame(sender_id_, seq, provider_()));
    const RetryPolicy policy{cfg.max_attempts, cfg.backoff_base_ms, std::chrono::milliseconds(cfg.timeout_ms)};
    bool interrupted = false;
    for (const auto& peer : cfg.peers) {
      const std::string name = peer_to_string(peer);
      const Delivery d = post_with_backoff(
          peer.host, peer.port, kPeerIngestPath, body, policy,
          [this](std::chrono::milliseconds w) { return wait_interruptible(w); },
          [&](std::uint32_t attempt, std::uint64_t backoff, const std::string& error) {
            events_.emit(EventKind::p2p_retry, name, false,
                         "attempt " + std::to_string(attempt) + " in " + std::to_string(backoff) + "ms: " + error);
          });
      stats_.p2p_failed_attempts.fetch_add(d.attempts - (d.delivered ? 1 : 0), std::memory_order_relaxed);
      if (d.delivered) {
        stats_.p2p_sent.fetch_add(1, std::memory_order_relaxed);
        events_.emit(EventKind::p2p_sent, name, true, "seq " + std::to_string(seq));
      } else if (d.interrupted) {
        interrupted = true;
        break;
      } else {
        stats_.p2p_dropped.fetch_add(1, std::memory_order_relaxed);
        events_.emit(EventKind::p2p_dropped, name, false,
                     "dropped seq " + std::to_string(seq) + " after " + std::to_string(d.attempts) +
                         " attempts: " + d.last_error);
      }
    }
    if (interrupted) return;

    lock.lock();
  }
}

}  // namespace chaosmagnet
