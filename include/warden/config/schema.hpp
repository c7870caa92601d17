#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

using std::chrono::milliseconds;

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8787;
  bool allow_public_bind = false;
  std::size_t max_body_bytes = 256 * 1024;
};

struct SandboxConfig {
  std::string image = "warden-agent:latest";
  std::string name_prefix = "tenant-";
  std::string network = "bridge";
  std::optional<std::string> memory_limit;
  std::optional<double> cpu_limit;
  std::optional<std::uint32_t> pids_limit;
  milliseconds docker_timeout{60'000};
};

struct AgentConfig {
  std::uint16_t port = 8080;
  std::string entrypoint = "node /app/packages/agent/dist/index.js";
  std::string workdir = "/app/packages/agent";
  std::string log_path = "/tmp/agent.log";
  std::string skills_path = "/app/skills";
  std::string config_dir = "/app/config";
  std::uint32_t health_attempts = 30;
  milliseconds health_interval{200};
  milliseconds request_timeout{120'000};
};

struct LifecycleConfig {
  milliseconds idle_threshold{30 * 60 * 1000};
  milliseconds flush_interval{10'000};
  milliseconds config_ttl{60'000};
  std::vector<milliseconds> websocket_backoff = {milliseconds(1000), milliseconds(3000),
                                                 milliseconds(8000)};
};

struct LogsConfig {
  std::size_t buffer_cap = 100;
  std::uint32_t retention_days = 7;
  std::string blob_root = "~/.warden/blobs";
  std::size_t max_lines_per_pull = 1000;
};

struct ControlPlaneConfig {
  std::string url;
  std::string internal_key;
  milliseconds timeout{10'000};
};

struct CredentialsConfig {
  std::optional<std::string> anthropic_api_key;
  std::optional<std::string> aws_access_key_id;
  std::optional<std::string> aws_secret_access_key;
  std::optional<std::string> aws_session_token;
  std::string aws_region = "us-east-1";
};

struct StateConfig {
  std::string db_path = "~/.warden/state.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  GatewayConfig gateway;
  SandboxConfig sandbox;
  AgentConfig agent;
  LifecycleConfig lifecycle;
  LogsConfig logs;
  ControlPlaneConfig control_plane;
  CredentialsConfig credentials;
  StateConfig state;
  ObservabilityConfig observability;
};

} // namespace warden::config
