#include "chaosmagnet/node.hpp"

#include <cstdlib>
#include <unistd.h>  // getpid, gethostname

#include "chaosmagnet/jsonlite.hpp"
#include "chaosmagnet/version.hpp"

namespace chaosmagnet {

namespace {

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
  return "unknown-host";
}

}  // namespace

NodeIdentity init_node_identity(const std::string& node_id) {
  NodeIdentity n;
  n.hostname = get_hostname();
  n.pid = static_cast<std::int64_t>(::getpid());
  n.engine_semver = version::current_manifest().engine_semver;

  n.node_id = node_id.empty()
      ? ([&n] {
           const char* e = std::getenv("CHAOSMAGNET_NODE_ID");
           return (e && e[0]) ? std::string(e) : n.hostname;
         }())
      : node_id;
  return n;
}

std::string node_identity_to_json(const NodeIdentity& n) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["node_id"]       = Value{n.node_id};
  o["hostname"]      = Value{n.hostname};
  o["pid"]           = Value{static_cast<std::uint64_t>(n.pid)};
  o["engine_semver"] = Value{n.engine_semver};
  return jsonlite::to_json(Value{std::move(o)});
}

}  // namespace chaosmagnet
