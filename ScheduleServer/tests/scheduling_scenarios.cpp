#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "scheduling/InMemoryStore.h"
#include "scheduling/SchedulingService.h"
#include "test_util.h"

using namespace scheduling;

// Delegates to another store; inserts fail once armed.
class FailingStore : public ScheduleStore {
public:
    explicit FailingStore(ScheduleStore& inner) : inner_(inner) {}
    bool fail_inserts = false;

    std::unique_ptr<StoreTransaction> begin(const std::string& tenant_id) override {
        return std::make_unique<Tx>(inner_.begin(tenant_id), *this);
    }

private:
    class Tx : public StoreTransaction {
    public:
        Tx(std::unique_ptr<StoreTransaction> inner, FailingStore& owner) : inner_(std::move(inner)), owner_(owner) {}
        std::vector<ScheduleEntry> fetch_range(std::time_t from, std::time_t to) override { return inner_->fetch_range(from, to); }
        std::optional<ScheduleEntry> find(const std::string& id) override { return inner_->find(id); }
        std::vector<ScheduleEntry> exceptions_of(const std::string& id) override { return inner_->exceptions_of(id); }
        std::vector<ScheduleEntry> masters_split_from(const std::string& id) override { return inner_->masters_split_from(id); }
        std::optional<ScheduleEntry> earliest() override { return inner_->earliest(); }
        void insert(const ScheduleEntry& e) override {
            if (owner_.fail_inserts) throw StoreError("injected insert failure");
            inner_->insert(e);
        }
        void update(const ScheduleEntry& e) override { inner_->update(e); }
        void remove(const std::string& id) override { inner_->remove(id); }
        std::vector<ScheduleConflict> record_conflicts(const std::vector<ScheduleConflict>& cs) override { return inner_->record_conflicts(cs); }
        std::vector<ScheduleConflict> list_conflicts(bool include_resolved) override { return inner_->list_conflicts(include_resolved); }
        std::optional<ScheduleConflict> resolve_conflict(const std::string& id, const std::string& notes) override { return inner_->resolve_conflict(id, notes); }
        void commit() override { inner_->commit(); }
    private:
        std::unique_ptr<StoreTransaction> inner_;
        FailingStore& owner_;
    };

    ScheduleStore& inner_;
};

// "2024-01-16*" marks a persisted (non-virtual) row
static std::string listing(const std::vector<EntryView>& views) {
    std::string out;
    for (const auto& v : views) {
        if (!out.empty()) out += ",";
        out += recurrence::format_iso_z(v.entry.scheduled_start).substr(0, 10);
        if (!v.is_virtual) out += "*";
    }
    return out;
}

template <typename Fn>
static bool fails_with(ErrorCode code, Fn fn) {
    try {
        fn();
    } catch (const SchedulingError& e) {
        if (e.code() == code) return true;
        std::cerr << "  got " << error_code_name(e.code()) << ": " << e.what() << "\n";
        return false;
    }
    std::cerr << "  no error raised\n";
    return false;
}

int main() {
    InMemoryStore store;
    StaticAssigneeDirectory directory;
    directory.add("roster", "alice");
    TenantTimeZones zones(recurrence::TimeZone::utc());
    SchedulingService svc(store, directory, zones, nullptr);
    const std::time_t jan = ts("2024-01-01T00:00:00Z");
    const std::time_t feb = ts("2024-02-01T00:00:00Z");

    // weekly series, then one occurrence moved
    auto created = svc.create_entry("acme", weekly_standup());
    const std::string series = created.entry.entry_id;
    if (!created.entry.is_master() || created.entry.recurrence->start_date != day("2024-01-01")) {
        std::cerr << "series not anchored on its start date\n"; return 1;
    }
    {
        auto views = svc.get_entries("acme", jan, feb);
        if (listing(views) != "2024-01-01,2024-01-08,2024-01-15,2024-01-22,2024-01-29") {
            std::cerr << "initial january: " << listing(views) << "\n"; return 1;
        }
        if (!views[0].ref.is_virtual() || views[0].ref.entry_id != series) { std::cerr << "virtual ref wrong\n"; return 1; }
    }
    EntryChanges move;
    move.scheduled_start = ts("2024-01-16T14:00:00Z");
    move.scheduled_end = ts("2024-01-16T15:00:00Z");
    auto moved = svc.update_entry("acme", EntryRef{series, day("2024-01-15")}, move, EditScope::Single);
    if (moved.entry.original_entry_id != series || moved.entry.occurrence_date != day("2024-01-15") || moved.entry.is_master()) {
        std::cerr << "single edit did not detach the occurrence\n"; return 1;
    }
    {
        auto views = svc.get_entries("acme", jan, feb);
        if (listing(views) != "2024-01-01,2024-01-08,2024-01-16*,2024-01-22,2024-01-29") {
            std::cerr << "after single edit: " << listing(views) << "\n"; return 1;
        }
        if (views[2].entry.scheduled_start != ts("2024-01-16T14:00:00Z")) { std::cerr << "detached time not kept\n"; return 1; }
    }

    // the detached occurrence is reachable through its virtual reference
    {
        EntryChanges retitle;
        retitle.title = "moved standup";
        auto r = svc.update_entry("acme", EntryRef{series, day("2024-01-15")}, retitle, EditScope::Single);
        if (r.entry.entry_id != moved.entry.entry_id || r.entry.title != "moved standup") {
            std::cerr << "edit through virtual ref did not reach the detached row\n"; return 1;
        }
    }

    // future delete from 01-22 ends the series for good
    svc.delete_entry("acme", EntryRef{series, day("2024-01-22")}, EditScope::Future);
    {
        auto views = svc.get_entries("acme", jan, ts("2024-03-01T00:00:00Z"));
        if (listing(views) != "2024-01-01,2024-01-08,2024-01-16*") { std::cerr << "after future delete: " << listing(views) << "\n"; return 1; }
        auto year = svc.get_entries("acme", ts("2023-12-01T00:00:00Z"), ts("2025-01-01T00:00:00Z"));
        if (listing(year) != "2024-01-01,2024-01-08,2024-01-16*") { std::cerr << "wide window after future delete: " << listing(year) << "\n"; return 1; }
    }

    // double booking against a series occurrence
    {
        ScheduleEntry call;
        call.title = "customer call";
        call.scheduled_start = ts("2024-01-08T09:30:00Z");
        call.scheduled_end = ts("2024-01-08T09:45:00Z");
        call.assigned_user_ids = {"u1", "u1", ""};
        auto r = svc.create_entry("acme", call);
        if (r.entry.assigned_user_ids != std::vector<std::string>{"u1"}) { std::cerr << "assignees not normalized\n"; return 1; }
        if (r.conflicts.size() != 1) { std::cerr << "expected one conflict, got " << r.conflicts.size() << "\n"; return 1; }
        const auto& c = r.conflicts[0];
        const EntryRef occ{series, day("2024-01-08")};
        if (!(c.entry_1 == occ || c.entry_2 == occ) || c.conflict_id.empty()) { std::cerr << "conflict sides wrong\n"; return 1; }

        auto views = svc.get_entries("acme", jan, feb);
        size_t tagged = 0;
        for (const auto& v : views) {
            if (!v.conflicts.empty() && v.conflicts[0].conflict_id == c.conflict_id) ++tagged;
        }
        if (tagged != 2) { std::cerr << "conflict not attached to both views: " << tagged << "\n"; return 1; }

        // recording again keeps one record per pair
        EntryChanges notes;
        notes.notes = "bring slides";
        svc.update_entry("acme", EntryRef{r.entry.entry_id, std::nullopt}, notes, std::nullopt);
        if (svc.list_conflicts("acme", false).size() != 1) { std::cerr << "conflict duplicated\n"; return 1; }

        auto resolved = svc.resolve_conflict("acme", c.conflict_id, "customer moved");
        if (!resolved.resolved || resolved.resolution_notes != "customer moved") { std::cerr << "resolve failed\n"; return 1; }
        if (!svc.list_conflicts("acme", false).empty() || svc.list_conflicts("acme", true).size() != 1) {
            std::cerr << "resolved conflict still open\n"; return 1;
        }
        if (!fails_with(ErrorCode::NotFound, [&] { svc.resolve_conflict("acme", "nope", ""); })) {
            std::cerr << "unknown conflict\n"; return 1;
        }
    }

    // future update splits the series; the union still covers every date once
    {
        auto r = svc.create_entry("split", weekly_standup("u2"));
        EntryChanges later;
        later.title = "late standup";
        later.scheduled_start = ts("2024-01-15T11:00:00Z");
        later.scheduled_end = ts("2024-01-15T12:00:00Z");
        auto next = svc.update_entry("split", EntryRef{r.entry.entry_id, day("2024-01-15")}, later, EditScope::Future);
        if (next.entry.split_from_entry_id != r.entry.entry_id || !next.entry.is_master()) {
            std::cerr << "future edit did not create a split master\n"; return 1;
        }
        if (next.entry.recurrence->occurrence_count != 3) { std::cerr << "tail count wrong\n"; return 1; }
        auto views = svc.get_entries("split", jan, ts("2024-03-01T00:00:00Z"));
        if (listing(views) != "2024-01-01,2024-01-08,2024-01-15,2024-01-22,2024-01-29") {
            std::cerr << "after future update: " << listing(views) << "\n"; return 1;
        }
        for (size_t i = 0; i < views.size(); ++i) {
            const bool late = i >= 2;
            if ((views[i].entry.title == "late standup") != late) { std::cerr << "future edit touched the wrong half\n"; return 1; }
            if (late && recurrence::format_iso_z(views[i].entry.scheduled_start).substr(11) != "11:00:00Z") {
                std::cerr << "future edit time wrong\n"; return 1;
            }
        }
    }

    // all-scope time change moves every occurrence by the same delta
    {
        auto r = svc.create_entry("shift", weekly_standup("u3"));
        EntryChanges later;
        later.scheduled_start = ts("2024-01-08T13:00:00Z");
        svc.update_entry("shift", EntryRef{r.entry.entry_id, day("2024-01-08")}, later, EditScope::All);
        auto views = svc.get_entries("shift", jan, feb);
        if (views.size() != 5) { std::cerr << "all edit changed the count\n"; return 1; }
        for (const auto& v : views) {
            if (v.entry.scheduled_end - v.entry.scheduled_start != 3600
                || recurrence::format_iso_z(v.entry.scheduled_start).substr(11) != "13:00:00Z") {
                std::cerr << "all edit time wrong: " << recurrence::format_iso_z(v.entry.scheduled_start) << "\n"; return 1;
            }
        }
    }

    // all-scope delete removes the master and its detached rows
    {
        auto r = svc.create_entry("gone", weekly_standup("u4"));
        EntryChanges move8;
        move8.scheduled_start = ts("2024-01-09T09:00:00Z");
        move8.scheduled_end = ts("2024-01-09T10:00:00Z");
        svc.update_entry("gone", EntryRef{r.entry.entry_id, day("2024-01-08")}, move8, EditScope::Single);
        if (store.entry_count("gone") != 2) { std::cerr << "expected master + detached row\n"; return 1; }
        svc.delete_entry("gone", EntryRef{r.entry.entry_id, std::nullopt}, EditScope::All);
        if (store.entry_count("gone") != 0 || !svc.get_entries("gone", jan, feb).empty()) {
            std::cerr << "all delete left rows behind\n"; return 1;
        }
    }

    // clearing the pattern leaves the anchor and the detached rows as standalone entries
    {
        auto r = svc.create_entry("flatten", weekly_standup("u8"));
        EntryChanges move29;
        move29.scheduled_start = ts("2024-01-30T09:00:00Z");
        move29.scheduled_end = ts("2024-01-30T10:00:00Z");
        svc.update_entry("flatten", EntryRef{r.entry.entry_id, day("2024-01-29")}, move29, EditScope::Single);
        EntryChanges flat;
        flat.recurrence = std::optional<recurrence::Pattern>();
        auto f = svc.update_entry("flatten", EntryRef{r.entry.entry_id, std::nullopt}, flat, EditScope::All);
        if (!f.entry.is_standalone()) { std::cerr << "master still recurring\n"; return 1; }
        auto views = svc.get_entries("flatten", jan, feb);
        if (listing(views) != "2024-01-01*,2024-01-30*") { std::cerr << "after clearing pattern: " << listing(views) << "\n"; return 1; }
        if (!views[1].entry.is_standalone()) { std::cerr << "detached row not promoted\n"; return 1; }

        // the last remaining occurrence of a series may be cancelled
        auto one = weekly_standup("u8");
        one.scheduled_start = ts("2024-03-04T09:00:00Z");
        one.scheduled_end = ts("2024-03-04T10:00:00Z");
        one.recurrence->occurrence_count = 1;
        auto single = svc.create_entry("flatten", one);
        svc.delete_entry("flatten", EntryRef{single.entry.entry_id, day("2024-03-04")}, EditScope::Single);
        if (!svc.get_entries("flatten", ts("2024-03-01T00:00:00Z"), ts("2024-04-01T00:00:00Z")).empty()) {
            std::cerr << "cancelled last occurrence still listed\n"; return 1;
        }
    }

    // earliest entry for calendar navigation
    {
        if (svc.earliest_entry("nav")) { std::cerr << "earliest on an empty tenant\n"; return 1; }
        auto later = weekly_standup("u7");
        later.scheduled_start = ts("2024-05-06T09:00:00Z");
        later.scheduled_end = ts("2024-05-06T10:00:00Z");
        svc.create_entry("nav", later);
        ScheduleEntry first;
        first.title = "kickoff";
        first.scheduled_start = ts("2023-11-02T15:00:00Z");
        first.scheduled_end = ts("2023-11-02T16:00:00Z");
        first.assigned_user_ids = {"u7"};
        auto kickoff = svc.create_entry("nav", first);
        auto e = svc.earliest_entry("nav");
        if (!e || e->entry_id != kickoff.entry.entry_id || e->title != "kickoff") { std::cerr << "earliest entry wrong\n"; return 1; }
        svc.delete_entry("nav", EntryRef{kickoff.entry.entry_id, std::nullopt}, std::nullopt);
        e = svc.earliest_entry("nav");
        if (!e || !e->is_master() || e->scheduled_start != ts("2024-05-06T09:00:00Z")) { std::cerr << "earliest after delete wrong\n"; return 1; }
    }

    // conflicts are still found when the tenant's other series fill the expansion cap
    {
        InMemoryStore busy_store;
        SchedulingService busy(busy_store, directory, zones, nullptr, ServiceLimits{20, 731});
        for (int i = 0; i < 7; ++i) {
            ScheduleEntry other;
            other.title = "rota " + std::to_string(i);
            other.scheduled_start = ts("2024-01-01T08:00:00Z");
            other.scheduled_end = ts("2024-01-01T18:00:00Z");
            other.assigned_user_ids = {"rota" + std::to_string(i)};
            other.recurrence = recurrence::Pattern{};
            busy.create_entry("busy", other);
        }
        ScheduleEntry ticket;
        ticket.title = "ticket";
        ticket.scheduled_start = ts("2024-01-03T09:30:00Z");
        ticket.scheduled_end = ts("2024-01-03T10:30:00Z");
        ticket.assigned_user_ids = {"alice"};
        busy.create_entry("busy", ticket);

        auto daily = weekly_standup("alice");
        daily.recurrence->frequency = recurrence::Daily{};
        auto made = busy.create_entry("busy", daily);
        if (made.conflicts.size() != 1 || !made.conflicts[0].involves(made.entry.entry_id)) {
            std::cerr << "conflicts on a crowded tenant: " << made.conflicts.size() << "\n"; return 1;
        }
        if (busy.list_conflicts("busy", false).size() != 1) { std::cerr << "crowded tenant conflict not recorded\n"; return 1; }
    }

    // an all-scope edit checks the period around the edited occurrence of a long-running series
    {
        auto old_series = weekly_standup("u9");
        old_series.scheduled_start = ts("2020-01-06T14:00:00Z");
        old_series.scheduled_end = ts("2020-01-06T15:00:00Z");
        old_series.recurrence->occurrence_count.reset();
        auto r = svc.create_entry("longrun", old_series);
        ScheduleEntry review;
        review.scheduled_start = ts("2024-01-08T09:30:00Z");
        review.scheduled_end = ts("2024-01-08T10:30:00Z");
        review.assigned_user_ids = {"u9"};
        if (!svc.create_entry("longrun", review).conflicts.empty()) { std::cerr << "review conflicts too early\n"; return 1; }

        EntryChanges earlier;
        earlier.scheduled_start = ts("2024-01-08T09:00:00Z");
        earlier.scheduled_end = ts("2024-01-08T10:00:00Z");
        auto moved_all = svc.update_entry("longrun", EntryRef{r.entry.entry_id, day("2024-01-08")}, earlier, EditScope::All);
        if (moved_all.conflicts.size() != 1) {
            std::cerr << "all-scope edit missed the conflict it created: " << moved_all.conflicts.size() << "\n"; return 1;
        }
        const EntryRef edited{r.entry.entry_id, day("2024-01-08")};
        if (!(moved_all.conflicts[0].entry_1 == edited || moved_all.conflicts[0].entry_2 == edited)) {
            std::cerr << "conflict not on the edited occurrence\n"; return 1;
        }
    }

    // rejected operations
    {
        auto r = svc.create_entry("errors", weekly_standup("u5"));
        const std::string id = r.entry.entry_id;
        EntryChanges title;
        title.title = "x";
        if (!fails_with(ErrorCode::InvalidScope, [&] { svc.update_entry("errors", EntryRef{id, std::nullopt}, title, std::nullopt); })) {
            std::cerr << "unscoped series edit\n"; return 1;
        }
        if (!fails_with(ErrorCode::InvalidScope, [&] { svc.delete_entry("errors", EntryRef{id, std::nullopt}, std::nullopt); })) {
            std::cerr << "unscoped series delete\n"; return 1;
        }
        if (!fails_with(ErrorCode::NotFound, [&] { svc.update_entry("errors", EntryRef{id, day("2024-01-02")}, title, EditScope::Single); })) {
            std::cerr << "edit on a non-occurrence date\n"; return 1;
        }
        if (!fails_with(ErrorCode::NotFound, [&] { svc.delete_entry("other-tenant", EntryRef{id, std::nullopt}, EditScope::All); })) {
            std::cerr << "cross-tenant delete\n"; return 1;
        }

        ScheduleEntry one;
        one.scheduled_start = ts("2024-02-01T09:00:00Z");
        one.scheduled_end = ts("2024-02-01T10:00:00Z");
        one.assigned_user_ids = {"u5"};
        auto standalone = svc.create_entry("errors", one);
        if (!fails_with(ErrorCode::InvalidScope, [&] {
                svc.update_entry("errors", EntryRef{standalone.entry.entry_id, std::nullopt}, title, EditScope::Single); })) {
            std::cerr << "single scope on a standalone entry\n"; return 1;
        }

        ScheduleEntry backwards = one;
        backwards.scheduled_end = backwards.scheduled_start;
        if (!fails_with(ErrorCode::InvalidEntry, [&] { svc.create_entry("errors", backwards); })) { std::cerr << "end == start\n"; return 1; }

        ScheduleEntry bad = weekly_standup("u5");
        bad.recurrence->interval = 0;
        if (!fails_with(ErrorCode::InvalidPattern, [&] { svc.create_entry("errors", bad); })) { std::cerr << "interval 0\n"; return 1; }
        bad = weekly_standup("u5");
        bad.recurrence->start_date = day("2024-01-02");
        if (!fails_with(ErrorCode::InvalidPattern, [&] { svc.create_entry("errors", bad); })) { std::cerr << "start_date mismatch\n"; return 1; }

        if (!fails_with(ErrorCode::RangeTooLarge, [&] { svc.get_entries("errors", jan, ts("2026-06-01T00:00:00Z")); })) {
            std::cerr << "oversized window\n"; return 1;
        }
        ScheduleEntry stranger = one;
        stranger.assigned_user_ids = {"bob"};
        if (!fails_with(ErrorCode::InvalidEntry, [&] { svc.create_entry("roster", stranger); })) { std::cerr << "unknown assignee\n"; return 1; }
        stranger.assigned_user_ids = {"alice"};
        svc.create_entry("roster", stranger);
    }

    // the occurrence cap turns into RangeTooLarge
    {
        ServiceLimits tight;
        tight.max_occurrences = 20;
        SchedulingService small(store, directory, zones, nullptr, tight);
        ScheduleEntry daily = weekly_standup("u6");
        daily.recurrence->frequency = recurrence::Daily{};
        daily.recurrence->occurrence_count.reset();
        small.create_entry("cap", daily);
        if (!fails_with(ErrorCode::RangeTooLarge, [&] { small.get_entries("cap", jan, feb); })) { std::cerr << "occurrence cap\n"; return 1; }
        if (small.get_entries("cap", jan, ts("2024-01-10T00:00:00Z")).size() != 9) { std::cerr << "small window under the cap\n"; return 1; }
    }

    // a failed mutation leaves nothing behind
    {
        FailingStore failing(store);
        SchedulingService flaky(failing, directory, zones, nullptr);
        auto r = flaky.create_entry("atomic", weekly_standup("u7"));
        failing.fail_inserts = true;
        if (!fails_with(ErrorCode::TransactionFailed, [&] {
                flaky.update_entry("atomic", EntryRef{r.entry.entry_id, day("2024-01-15")}, move, EditScope::Single); })) {
            std::cerr << "injected failure not reported\n"; return 1;
        }
        auto views = svc.get_entries("atomic", jan, feb);
        if (listing(views) != "2024-01-01,2024-01-08,2024-01-15,2024-01-22,2024-01-29") {
            std::cerr << "failed edit was partially applied: " << listing(views) << "\n"; return 1;
        }
        if (store.entry_count("atomic") != 1) { std::cerr << "failed edit left rows\n"; return 1; }
    }

    std::cout << "scheduling_scenarios ok\n";
    return 0;
}
