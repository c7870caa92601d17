#include "warden/sandbox/sandbox.hpp"

#include "warden/common/fs.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace warden::sandbox {

namespace {

constexpr std::size_t kMaxVerbatimTenant = 64;
constexpr std::size_t kDigestChars = 32;

bool is_verbatim_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_' || ch == '-';
}

bool is_verbatim_tenant(const std::string &tenant_id) {
  if (tenant_id.empty() || tenant_id.size() > kMaxVerbatimTenant) {
    return false;
  }
  return std::all_of(tenant_id.begin(), tenant_id.end(), is_verbatim_char);
}

std::string digest_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  for (const unsigned char byte : digest) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return out.str().substr(0, kDigestChars);
}

} // namespace

std::string sandbox_name_for_tenant(const std::string &prefix, const std::string &tenant_id) {
  if (is_verbatim_tenant(tenant_id)) {
    return prefix + tenant_id;
  }
  // Verbatim ids never contain '.', so hashed names cannot collide with them.
  return prefix + "h." + digest_hex(tenant_id);
}

std::optional<std::string> tenant_from_sandbox_name(const std::string &prefix,
                                                    const std::string &name) {
  if (!common::starts_with(name, prefix)) {
    return std::nullopt;
  }
  const std::string rest = name.substr(prefix.size());
  if (!is_verbatim_tenant(rest)) {
    return std::nullopt;
  }
  return rest;
}

std::vector<std::string> build_docker_create_args(const config::SandboxConfig &config,
                                                  const std::string &name) {
  std::vector<std::string> args = {"create", "--name", name};
  args.push_back("--label");
  args.push_back("warden.sandbox=1");
  args.push_back("--label");
  args.push_back("warden.name=" + name);

  if (!common::trim(config.network).empty()) {
    args.push_back("--network");
    args.push_back(config.network);
  }
  args.push_back("--security-opt");
  args.push_back("no-new-privileges");
  args.push_back("--env");
  args.push_back("LANG=C.UTF-8");

  if (config.pids_limit.has_value() && *config.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(*config.pids_limit));
  }
  if (config.memory_limit.has_value() && !config.memory_limit->empty()) {
    args.push_back("--memory");
    args.push_back(*config.memory_limit);
  }
  if (config.cpu_limit.has_value() && *config.cpu_limit > 0) {
    args.push_back("--cpus");
    std::ostringstream cpu;
    cpu << std::fixed << std::setprecision(2) << *config.cpu_limit;
    args.push_back(cpu.str());
  }

  args.push_back(config.image);
  args.push_back("sleep");
  args.push_back("infinity");
  return args;
}

std::string build_background_command(const ProcessSpec &spec) {
  return "nohup " + spec.command + " >/dev/null 2>&1 & echo $!";
}

} // namespace warden::sandbox
