#include "test_framework.hpp"

#include "warden/storage/blob_store.hpp"
#include "warden/storage/state_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

void register_storage_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace st = warden::storage;
  namespace wt = warden::testing;

  tests.push_back({"sqlite_state_store_put_get_overwrite", [] {
                     const wt::TempWorkspace workspace;
                     st::SqliteStateStore store(workspace.path() / "state" / "warden.db");
                     require(store.is_open(), "store should open");

                     const auto missing = store.get("tenant-acme", "lastActivity");
                     require(missing.ok(), missing.error());
                     require(!missing.value().has_value(), "unknown key should be empty");

                     require(store.put("tenant-acme", "lastActivity", "100").ok(), "first put");
                     require(store.put("tenant-acme", "lastActivity", "200").ok(), "second put");
                     const auto value = store.get("tenant-acme", "lastActivity");
                     require(value.ok(), value.error());
                     require(value.value() == std::optional<std::string>("200"),
                             "second put should replace the first");

                     const auto other = store.get("tenant-globex", "lastActivity");
                     require(other.ok() && !other.value().has_value(), "scopes should be isolated");
                   }});

  tests.push_back({"sqlite_state_store_survives_reopen", [] {
                     const wt::TempWorkspace workspace;
                     const auto path = workspace.path() / "warden.db";
                     {
                       st::SqliteStateStore store(path);
                       require(store.put("tenant-acme", "tenantId", "acme").ok(), "put should succeed");
                     }
                     st::SqliteStateStore reopened(path);
                     const auto value = reopened.get("tenant-acme", "tenantId");
                     require(value.ok(), value.error());
                     require(value.value() == std::optional<std::string>("acme"),
                             "value should persist across instances");
                   }});

  tests.push_back({"sqlite_state_store_list_prefix_is_literal", [] {
                     const wt::TempWorkspace workspace;
                     st::SqliteStateStore store(workspace.path() / "warden.db");
                     require(store.put("tenant-acme", "session:user_1:b", "{}").ok(), "put b");
                     require(store.put("tenant-acme", "session:user_1:a", "{}").ok(), "put a");
                     require(store.put("tenant-acme", "session:userX1:c", "{}").ok(), "put c");
                     require(store.put("tenant-acme", "lastActivity", "1").ok(), "put marker");

                     const auto rows = store.list("tenant-acme", "session:user_1:");
                     require(rows.ok(), rows.error());
                     require(rows.value().size() == 2, "underscore should not act as a wildcard");
                     require(rows.value()[0].first == "session:user_1:a", "rows should be ordered");
                   }});

  tests.push_back({"sqlite_state_store_find_key_and_remove", [] {
                     const wt::TempWorkspace workspace;
                     st::SqliteStateStore store(workspace.path() / "warden.db");
                     require(store.put("tenant-b", "alarm", "2000").ok(), "put b");
                     require(store.put("tenant-a", "alarm", "1000").ok(), "put a");
                     require(store.put("tenant-a", "lastActivity", "5").ok(), "put marker");

                     const auto alarms = store.find_key("alarm");
                     require(alarms.ok(), alarms.error());
                     require(alarms.value().size() == 2, "both scopes should be found");
                     require(alarms.value()[0].first == "tenant-a", "scopes should be ordered");

                     const auto removed = store.remove("tenant-a", "alarm");
                     require(removed.ok() && removed.value(), "existing key should be removed");
                     const auto again = store.remove("tenant-a", "alarm");
                     require(again.ok() && !again.value(), "second removal should report false");
                     require(store.find_key("alarm").value().size() == 1, "one alarm should remain");
                   }});

  tests.push_back({"sqlite_state_store_conditional_remove", [] {
                     const wt::TempWorkspace workspace;
                     st::SqliteStateStore store(workspace.path() / "warden.db");
                     require(store.put("tenant-acme", "alarm", "2000").ok(), "put");
                     const auto stale = store.remove_if_equals("tenant-acme", "alarm", "1000");
                     require(stale.ok() && !stale.value(), "a changed value is kept");
                     require(store.get("tenant-acme", "alarm").value() ==
                                 std::optional<std::string>("2000"),
                             "value should be untouched");
                     const auto current = store.remove_if_equals("tenant-acme", "alarm", "2000");
                     require(current.ok() && current.value(), "matching value is removed");
                     require(!store.get("tenant-acme", "alarm").value().has_value(), "entry gone");
                   }});

  tests.push_back({"local_blob_store_put_list_read", [] {
                     const wt::TempWorkspace workspace;
                     st::LocalBlobStore blobs(workspace.path() / "blobs");
                     require(blobs.put("logs/acme/2026-03-10/1-0.ndjson", "{\"msg\":\"a\"}\n",
                                       {{"entryCount", "1"}, {"tenantId", "acme"}})
                                 .ok(),
                             "put should succeed");
                     require(blobs.put("logs/globex/2026-03-10/1-0.ndjson", "{}\n", {}).ok(),
                             "second put should succeed");

                     const auto listed = blobs.list("logs/acme/");
                     require(listed.ok(), listed.error());
                     require(listed.value().size() == 1, "prefix should filter tenants");
                     require(listed.value()[0].key == "logs/acme/2026-03-10/1-0.ndjson", "key mismatch");
                     require(listed.value()[0].size == 12, "size should match content");

                     const auto content = blobs.read("logs/acme/2026-03-10/1-0.ndjson");
                     require(content.ok() && content.value() == "{\"msg\":\"a\"}\n", "content mismatch");
                     const auto metadata = blobs.read_metadata("logs/acme/2026-03-10/1-0.ndjson");
                     require(metadata.ok(), metadata.error());
                     require(metadata.value().at("entryCount") == "1", "metadata mismatch");
                     require(metadata.value().at("tenantId") == "acme", "tenant metadata mismatch");
                   }});

  tests.push_back({"local_blob_store_remove_prunes_empty_dirs", [] {
                     const wt::TempWorkspace workspace;
                     const auto root = workspace.path() / "blobs";
                     st::LocalBlobStore blobs(root);
                     require(blobs.put("logs/acme/2026-01-01/1-0.ndjson", "x\n", {}).ok(), "put");
                     require(blobs.remove("logs/acme/2026-01-01/1-0.ndjson").ok(), "remove");
                     require(blobs.list("logs/").value().empty(), "nothing should be listed");
                     require(!std::filesystem::exists(root / "logs" / "acme" / "2026-01-01"),
                             "empty partitions should be pruned");
                   }});

  tests.push_back({"local_blob_store_rejects_escaping_keys", [] {
                     const wt::TempWorkspace workspace;
                     st::LocalBlobStore blobs(workspace.path() / "blobs");
                     for (const std::string key : {"", "/etc/passwd", "logs/../../x", "logs//x",
                                                   "logs/x.meta"}) {
                       const auto status = blobs.put(key, "x", {});
                       require(!status.ok(), "key should be rejected: " + key);
                       require(status.kind() == warden::common::ErrorKind::Invalid,
                               "kind should be invalid for " + key);
                     }
                   }});

  tests.push_back({"local_blob_store_list_missing_root_is_empty", [] {
                     const wt::TempWorkspace workspace;
                     st::LocalBlobStore blobs(workspace.path() / "never-created");
                     const auto listed = blobs.list("");
                     require(listed.ok(), listed.error());
                     require(listed.value().empty(), "missing root should list nothing");
                   }});
}
