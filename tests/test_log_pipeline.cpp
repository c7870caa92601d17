#include "test_framework.hpp"

#include "warden/tenant/log_pipeline.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <string>

namespace {

namespace tn = warden::tenant;
namespace wt = warden::testing;

struct PipelineFixture {
  std::shared_ptr<wt::MemoryBlobStore> blobs = std::make_shared<wt::MemoryBlobStore>();
  std::shared_ptr<wt::ManualClock> clock = std::make_shared<wt::ManualClock>();
  wt::FakeSandbox sandbox{"tenant-acme"};

  tn::LogPipeline make(const std::size_t cap = 100, const std::uint32_t retention = 7) {
    warden::config::LogsConfig config;
    config.buffer_cap = cap;
    config.retention_days = retention;
    return tn::LogPipeline(config, "/tmp/agent.log", blobs, clock);
  }
};

} // namespace

void register_log_pipeline_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;

  tests.push_back({"log_pull_advances_offset_monotonically", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make();
                     fixture.sandbox.append_log("listening on 8080");
                     fixture.sandbox.append_log("");
                     fixture.sandbox.append_log("request served");
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "first pull");
                     require(pipeline.offset() == 3, "blank lines still advance the offset");
                     require(pipeline.buffered() == 2, "blank lines are not buffered");

                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "empty pull");
                     require(pipeline.offset() == 3, "nothing new means no movement");
                     require(fixture.sandbox.exec_commands.back().find("tail -n +4 ") == 0,
                             "next read should start after the offset: " +
                                 fixture.sandbox.exec_commands.back());

                     fixture.sandbox.append_log("shutting down");
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "third pull");
                     require(pipeline.offset() == 4, "new line should be consumed");
                     require(pipeline.buffered() == 3, "new line should be buffered");
                   }});

  tests.push_back({"log_pull_leaves_partial_line_for_next_time", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make();
                     fixture.sandbox.append_log("complete");
                     fixture.sandbox.unterminated_log_tail = "half a li";
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "pull");
                     require(pipeline.offset() == 1, "partial line should not be consumed");
                     require(pipeline.buffered() == 1, "only the complete line is buffered");
                   }});

  tests.push_back({"log_pull_failure_keeps_offset", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make();
                     fixture.sandbox.append_log("one");
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "pull");
                     fixture.sandbox.fail_exec = true;
                     require(!pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(),
                             "exec failure should surface");
                     require(pipeline.offset() == 1, "offset should not move on failure");
                   }});

  tests.push_back({"full_buffer_flushes_during_pull", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make(3);
                     for (int i = 0; i < 7; ++i) {
                       fixture.sandbox.append_log("line " + std::to_string(i));
                     }
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "pull");
                     require(fixture.blobs->objects.size() == 2, "two full batches expected");
                     require(pipeline.buffered() == 1, "remainder stays buffered");
                     for (const auto &[key, object] : fixture.blobs->objects) {
                       require(object.metadata.at("entryCount") == "3", "batch size mismatch");
                     }
                   }});

  tests.push_back({"flush_writes_ndjson_batch_under_tenant_date", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make();
                     fixture.sandbox.append_log("Warning: slow response");
                     fixture.sandbox.append_log("TypeError: undefined");
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme corp").ok(), "pull");
                     require(pipeline.flush("acme corp").ok(), "flush");
                     require(pipeline.buffered() == 0, "buffer should be empty after flush");

                     require(fixture.blobs->objects.size() == 1, "one batch expected");
                     const auto &[key, object] = *fixture.blobs->objects.begin();
                     require(key == "logs/acme%20corp/2026-03-10/1773144000000-0.ndjson",
                             "key mismatch: " + key);
                     require(object.metadata.at("tenantId") == "acme corp", "tenant metadata mismatch");
                     require(object.metadata.at("entryCount") == "2", "count metadata mismatch");
                     require(object.content.find("\"level\":\"warn\"") != std::string::npos,
                             "warning should be classified");
                     require(object.content.find("\"level\":\"error\"") != std::string::npos,
                             "error should be classified");
                     require(object.content.find("\"ts\":\"2026-03-10T12:00:00") != std::string::npos,
                             "timestamp should be rfc3339");
                     require(object.content.back() == '\n', "batch should be newline delimited");

                     require(pipeline.flush("acme corp").ok(), "empty flush is a no-op");
                     require(fixture.blobs->objects.size() == 1, "empty flush writes nothing");
                   }});

  tests.push_back({"flush_failure_discards_buffer", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make();
                     fixture.sandbox.append_log("lost line");
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "pull");
                     fixture.blobs->fail_puts = true;
                     const auto status = pipeline.flush("acme");
                     require(!status.ok(), "put failure should surface");
                     require(status.kind() == warden::common::ErrorKind::Flush, "kind mismatch");
                     require(pipeline.buffered() == 0, "failed batch is dropped");
                     require(pipeline.offset() == 1, "offset is not rewound");
                   }});

  tests.push_back({"batch_keys_stay_unique_within_one_millisecond", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make(1);
                     fixture.sandbox.append_log("a");
                     fixture.sandbox.append_log("b");
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "pull");
                     require(fixture.blobs->objects.size() == 2, "sequence should separate keys");
                   }});

  tests.push_back({"cleanup_deletes_partitions_past_retention", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make(100, 7);
                     auto &objects = fixture.blobs->objects;
                     objects["logs/acme/2026-02-28/1-0.ndjson"] = {"old\n", {}};
                     objects["logs/acme/2026-03-03/1-0.ndjson"] = {"edge\n", {}};
                     objects["logs/acme/2026-03-08/1-0.ndjson"] = {"recent\n", {}};
                     objects["logs/globex/2026-01-01/1-0.ndjson"] = {"other tenant\n", {}};

                     const auto deleted = pipeline.cleanup_old("acme");
                     require(deleted.ok(), deleted.error());
                     require(deleted.value() == 1, "one partition should be deleted");
                     require(!objects.contains("logs/acme/2026-02-28/1-0.ndjson"),
                             "ten-day-old batch should be gone");
                     require(objects.contains("logs/acme/2026-03-03/1-0.ndjson"),
                             "batch at the cutoff is kept");
                     require(objects.contains("logs/acme/2026-03-08/1-0.ndjson"), "recent batch kept");
                     require(objects.contains("logs/globex/2026-01-01/1-0.ndjson"),
                             "other tenants are untouched");
                   }});

  tests.push_back({"reset_forgets_offset_and_buffer", [] {
                     PipelineFixture fixture;
                     auto pipeline = fixture.make();
                     fixture.sandbox.append_log("x");
                     require(pipeline.pull_and_buffer(fixture.sandbox, "acme").ok(), "pull");
                     pipeline.reset();
                     require(pipeline.offset() == 0 && pipeline.buffered() == 0, "state should clear");
                   }});

  tests.push_back({"log_lines_are_classified_by_keyword", [] {
                     require(tn::classify_log_line("Request FAILED") == tn::LogLevel::Error,
                             "fail should be an error");
                     require(tn::classify_log_line("deprecation warning") == tn::LogLevel::Warn,
                             "warn should be a warning");
                     require(tn::classify_log_line("listening on 8080") == tn::LogLevel::Info,
                             "plain lines are info");
                   }});
}
