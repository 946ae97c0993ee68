// Audit sink tests.
#include "test_support.hpp"

#include "linkfetch/audit_sink.hpp"

#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;

using linkfetch::AuditEvent;
using linkfetch::JsonLinesAuditSink;
using linkfetch::test::TempDir;
using linkfetch::test::TestContext;

AuditEvent event(const std::string& from, const std::string& to, const std::string& detail = {}) {
    AuditEvent e;
    e.job_id = "job-7";
    e.from_state = from;
    e.to_state = to;
    e.timestamp = *linkfetch::parseTimestamp("2024-05-01T10:00:00.500Z");
    e.detail = detail;
    return e;
}

std::vector<std::string> lines(const fs::path& path) {
    std::istringstream in(linkfetch::test::readFile(path));
    std::vector<std::string> out;
    for (std::string line; std::getline(in, line);) {
        out.push_back(line);
    }
    return out;
}

void test_json_line(TestContext& t) {
    const auto line = JsonLinesAuditSink::toJsonLine(event("running", "failed", "HTTP error 404"));
    t.check(line.find('\n') == std::string::npos, "one event is one line");

    const auto parsed = nlohmann::json::parse(line);
    t.check(parsed.at("job_id") == "job-7", "job id");
    t.check(parsed.at("from_state") == "running", "from state");
    t.check(parsed.at("to_state") == "failed", "to state");
    t.check(parsed.at("timestamp") == "2024-05-01T10:00:00.500Z", "timestamp");
    t.check(parsed.at("detail") == "HTTP error 404", "detail");

    const auto plain = nlohmann::json::parse(JsonLinesAuditSink::toJsonLine(event("", "queued")));
    t.check(!plain.contains("detail"), "empty detail is omitted");
}

void test_append_only(TestContext& t) {
    TempDir tmp;
    const fs::path path = tmp.path() / "logs" / "audit.jsonl";
    {
        JsonLinesAuditSink sink(path);
        sink.append(event("", "queued"));
        sink.append(event("queued", "running"));
    }
    {
        JsonLinesAuditSink reopened(path);
        reopened.append(event("success", "removed"));
    }

    const auto written = lines(path);
    t.check(written.size() == 3, "every event should append a line, across sink instances");
    if (written.size() == 3) {
        t.check(nlohmann::json::parse(written[0]).at("to_state") == "queued", "first event first");
        t.check(nlohmann::json::parse(written[2]).at("to_state") == "removed",
                "removal event last");
    }
}

void test_concurrent_appends(TestContext& t) {
    TempDir tmp;
    const fs::path path = tmp.path() / "audit.jsonl";
    JsonLinesAuditSink sink(path);

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&sink] {
            for (int i = 0; i < 50; ++i) {
                sink.append(event("queued", "running"));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    const auto written = lines(path);
    t.check(written.size() == 200, "no appended line should be lost");
    bool all_valid = true;
    for (const auto& line : written) {
        all_valid = all_valid && !nlohmann::json::parse(line, nullptr, false).is_discarded();
    }
    t.check(all_valid, "concurrent appends must not interleave lines");
}

void test_null_sink(TestContext& t) {
    linkfetch::NullAuditSink sink;
    sink.append(event("", "queued"));
    t.check(true, "null sink accepts events");
}

} // namespace

int main() {
    TestContext t;
    test_json_line(t);
    test_append_only(t);
    test_concurrent_appends(t);
    test_null_sink(t);
    return t.finish("linkfetch_audit_sink_tests");
}
