#include "warden/tenant/session_store.hpp"

#include "warden/common/json_util.hpp"

#include <charconv>

namespace warden::tenant {

namespace {

std::string session_key(const std::string &user_id, const std::string &session_id) {
  return "session:" + user_id + ":" + session_id;
}

std::optional<SessionRecord> parse_session(const std::string &json) {
  const auto members = common::json_object_members(json);
  SessionRecord record;
  record.id = common::json_value_as_string(common::json_member(members, "id"));
  if (record.id.empty()) {
    return std::nullopt;
  }
  record.last_message = common::json_value_as_string(common::json_member(members, "lastMessage"));
  const std::string response = common::json_member(members, "lastResponse");
  record.last_response = response.empty() ? "null" : response;

  const std::string updated = common::json_member(members, "updatedAt");
  std::int64_t ms = 0;
  (void)std::from_chars(updated.data(), updated.data() + updated.size(), ms);
  record.updated_at = common::from_unix_ms(ms);
  return record;
}

} // namespace

std::string render_session(const SessionRecord &record) {
  return "{\"id\":" + common::json_string(record.id) +
         ",\"lastMessage\":" + common::json_string(record.last_message) +
         ",\"lastResponse\":" + (record.last_response.empty() ? "null" : record.last_response) +
         ",\"updatedAt\":" + std::to_string(common::to_unix_ms(record.updated_at)) + "}";
}

SessionStore::SessionStore(std::shared_ptr<storage::IStateStore> store, std::string scope)
    : store_(std::move(store)), scope_(std::move(scope)) {}

common::Status SessionStore::save(const std::string &user_id, const SessionRecord &record) {
  return store_->put(scope_, session_key(user_id, record.id), render_session(record));
}

common::Result<std::vector<SessionRecord>> SessionStore::list(const std::string &user_id) {
  auto rows = store_->list(scope_, "session:" + user_id + ":");
  if (!rows.ok()) {
    return common::Result<std::vector<SessionRecord>>::failure(rows.error());
  }
  std::vector<SessionRecord> sessions;
  for (const auto &[key, value] : rows.value()) {
    if (auto record = parse_session(value); record.has_value()) {
      sessions.push_back(std::move(*record));
    }
  }
  return common::Result<std::vector<SessionRecord>>::success(std::move(sessions));
}

common::Result<std::optional<SessionRecord>> SessionStore::get(const std::string &user_id,
                                                               const std::string &session_id) {
  using ResultT = common::Result<std::optional<SessionRecord>>;
  auto raw = store_->get(scope_, session_key(user_id, session_id));
  if (!raw.ok()) {
    return ResultT::failure(raw.error());
  }
  if (!raw.value().has_value()) {
    return ResultT::success(std::nullopt);
  }
  return ResultT::success(parse_session(*raw.value()));
}

} // namespace warden::tenant
