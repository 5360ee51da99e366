#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "observability/Logging.h"
#include "scheduling/InMemoryStore.h"
#include "scheduling/SchedulingService.h"

using namespace observability;

// Runs fn with stdout redirected to `path` and returns what was written.
template <typename Fn>
static bool capture_stdout(const char* path, Fn fn, std::string& out) {
    std::fflush(stdout);
    std::cout.flush();
    int saved = dup(fileno(stdout));
    if (saved == -1) return false;
    if (!std::freopen(path, "w+", stdout)) { close(saved); return false; }
    fn();
    std::cout.flush();
    std::fflush(stdout);
    bool restored = dup2(saved, fileno(stdout)) != -1;
    close(saved);
    if (!restored) return false;
    std::ifstream in(path);
    out.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return true;
}

static size_t count_lines(const std::string& s) {
    size_t n = 0;
    for (char c : s) if (c == '\n') ++n;
    return n;
}

static size_t count_of(const std::string& s, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + 1)) ++n;
    return n;
}

int main() {
    std::string out;

    set_log_level(2);
    if (log_level() != 2) { std::cerr << "log_level not stored\n"; return 1; }
    bool ok = capture_stdout("/tmp/schedule_logging_stage1.txt", [] {
        log_debug("scheduling.debug_hidden");
        log_info("entry.created", {{"tenant", std::string("acme")}, {"conflicts", int64_t(2)}});
        log_warn("scheduling.rejected", {{"code", std::string("invalid_scope")}, {"error", std::string("needs \"scope\"\n")}});
        log_error("scheduling.transaction_failed", {{"ms", 1.5}});
    }, out);
    if (!ok) { std::cerr << "stdout capture failed\n"; return 1; }
    if (count_lines(out) != 3) { std::cerr << "expected 3 lines got " << count_lines(out) << "\n" << out; return 1; }
    if (out.find("debug_hidden") != std::string::npos) { std::cerr << "debug line below threshold printed\n"; return 1; }

    std::istringstream in(out);
    std::string line;
    while (std::getline(in, line)) {
        if (line.front() != '{' || line.back() != '}' || line.find("\"ts\":") == std::string::npos) {
            std::cerr << "line not a json object: " << line << "\n"; return 1;
        }
    }
    if (out.find("\"level\":\"INFO\",\"msg\":\"entry.created\"") == std::string::npos) { std::cerr << "info line wrong\n" << out; return 1; }
    if (out.find("\"tenant\":\"acme\"") == std::string::npos || out.find("\"conflicts\":2") == std::string::npos) {
        std::cerr << "info fields missing\n" << out; return 1;
    }
    if (out.find("\"error\":\"needs \\\"scope\\\"\\n\"") == std::string::npos) { std::cerr << "field not escaped\n" << out; return 1; }
    if (out.find("\"ms\":1.500") == std::string::npos) { std::cerr << "double field format\n" << out; return 1; }

    set_log_level(4);
    ok = capture_stdout("/tmp/schedule_logging_stage2.txt", [] {
        log_info("hidden");
        log_warn("hidden");
        log_error("shown");
    }, out);
    if (!ok || count_lines(out) != 1 || out.find("shown") == std::string::npos) { std::cerr << "ERROR threshold wrong\n" << out; return 1; }

    // a rejected operation keeps the event name as the only "msg" key
    {
        scheduling::InMemoryStore store;
        scheduling::StaticAssigneeDirectory directory;
        scheduling::TenantTimeZones zones(recurrence::TimeZone::utc());
        scheduling::SchedulingService svc(store, directory, zones, nullptr);
        set_log_level(3);
        ok = capture_stdout("/tmp/schedule_logging_stage_reject.txt", [&] {
            try {
                svc.delete_entry("acme", scheduling::EntryRef{"missing", std::nullopt}, std::nullopt);
            } catch (const scheduling::SchedulingError&) {
            }
        }, out);
        if (!ok || count_lines(out) != 1) { std::cerr << "rejection not logged once\n" << out; return 1; }
        if (count_of(out, "\"msg\":") != 1 || out.find("\"msg\":\"scheduling.rejected\"") == std::string::npos
            || out.find("\"error\":\"") == std::string::npos || out.find("\"code\":\"not_found\"") == std::string::npos) {
            std::cerr << "rejection line keys wrong\n" << out; return 1;
        }
    }

    // concurrent writers never interleave within a line
    set_log_level(2);
    const int threads = 4;
    const int iters = 500;
    ok = capture_stdout("/tmp/schedule_logging_stage3.txt", [&] {
        std::vector<std::thread> th;
        for (int t = 0; t < threads; ++t) {
            th.emplace_back([t, iters] {
                for (int i = 0; i < iters; ++i) log_info("worker", {{"t", int64_t(t)}, {"i", int64_t(i)}});
            });
        }
        for (auto& tt : th) tt.join();
    }, out);
    if (!ok || count_lines(out) != size_t(threads * iters)) { std::cerr << "concurrent line count " << count_lines(out) << "\n"; return 1; }
    std::istringstream in3(out);
    while (std::getline(in3, line)) {
        if (line.front() != '{' || line.back() != '}') { std::cerr << "interleaved line: " << line << "\n"; return 1; }
    }

    std::cout << "logging_unit ok\n";
    return 0;
}
