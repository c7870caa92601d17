#pragma once

#include "warden/common/clock.hpp"
#include "warden/common/result.hpp"
#include "warden/storage/state_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden::tenant {

struct SessionRecord {
  std::string id;
  std::string last_message;
  /// Raw JSON of the agent reply.
  std::string last_response = "null";
  common::TimePoint updated_at;
};

[[nodiscard]] std::string render_session(const SessionRecord &record);

/// Chat sessions kept in the controller's scope as session:<user>:<id>.
class SessionStore {
public:
  SessionStore(std::shared_ptr<storage::IStateStore> store, std::string scope);

  [[nodiscard]] common::Status save(const std::string &user_id, const SessionRecord &record);
  [[nodiscard]] common::Result<std::vector<SessionRecord>> list(const std::string &user_id);
  [[nodiscard]] common::Result<std::optional<SessionRecord>> get(const std::string &user_id,
                                                                 const std::string &session_id);

private:
  std::shared_ptr<storage::IStateStore> store_;
  std::string scope_;
};

} // namespace warden::tenant
