#include "EntryJson.h"
#include "../recurrence/IsoTime.h"
#include "../scheduling/Errors.h"
#include <cctype>
#include <sstream>

using scheduling::ErrorCode;
using scheduling::SchedulingError;

namespace {

const char* kWeekdayNames[] = {"monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"};

std::string opt_string(const std::optional<std::string>& s) {
    return s ? json_quote(*s) : std::string("null");
}

std::string opt_date(const std::optional<recurrence::Date>& d) {
    return d ? json_quote(recurrence::format_iso_date(*d)) : std::string("null");
}

std::string string_array(const std::vector<std::string>& vals) {
    std::string out = "[";
    for (size_t i = 0; i < vals.size(); ++i) {
        if (i) out += ",";
        out += json_quote(vals[i]);
    }
    return out + "]";
}

std::string ref_to_json(const scheduling::EntryRef& ref) {
    return "{\"entry_id\":" + json_quote(ref.entry_id) + ",\"occurrence_date\":" + opt_date(ref.occurrence_date) + "}";
}

std::time_t time_field(const JsonValue& v, const std::string& what) {
    auto t = recurrence::parse_iso_z(v.as_string(what));
    if (!t) throw JsonError(what + ": expected YYYY-MM-DDTHH:MM:SSZ");
    return *t;
}

recurrence::Date date_field(const JsonValue& v, const std::string& what) {
    auto d = recurrence::parse_iso_date(v.as_string(what));
    if (!d) throw JsonError(what + ": expected YYYY-MM-DD");
    return *d;
}

int weekday_field(const JsonValue& v) {
    if (v.is_string()) {
        std::string s = v.as_string("weekdays");
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        for (int i = 0; i < 7; ++i) {
            const std::string name = kWeekdayNames[i];
            if (s == name || s == name.substr(0, 3)) return i;
        }
        throw JsonError("weekdays: unknown day " + v.as_string("weekdays"));
    }
    return static_cast<int>(v.as_int("weekdays"));
}

std::vector<std::string> assignees_field(const JsonValue& v) {
    std::vector<std::string> out;
    for (const auto& item : v.as_array("assigned_user_ids")) out.push_back(item.as_string("assigned_user_ids"));
    return out;
}

scheduling::WorkItemRef work_item_field(const JsonValue& v) {
    v.as_object("work_item");
    scheduling::WorkItemRef w;
    if (const auto* t = v.find("type")) w.type = t->as_string("work_item.type");
    if (const auto* id = v.find("id"); id && !id->is_null()) w.id = id->as_string("work_item.id");
    return w;
}

const JsonValue& require(const JsonValue& obj, const std::string& key) {
    const auto* v = obj.find(key);
    if (!v) throw JsonError(key + " is required");
    return *v;
}

std::optional<recurrence::Pattern> recurrence_field(const JsonValue& v) {
    if (v.is_null()) return std::nullopt;
    return pattern_from_json(v);
}

}

std::string pattern_to_json(const recurrence::Pattern& p) {
    std::ostringstream ss;
    ss << "{\"frequency\":" << json_quote(recurrence::frequency_name(p.frequency));
    ss << ",\"interval\":" << p.interval;
    ss << ",\"start_date\":" << json_quote(recurrence::format_iso_date(p.start_date));
    ss << ",\"end_date\":" << opt_date(p.end_date);
    ss << ",\"occurrence_count\":";
    if (p.occurrence_count) ss << *p.occurrence_count; else ss << "null";
    if (const auto* d = std::get_if<recurrence::Daily>(&p.frequency)) {
        ss << ",\"workdays_only\":" << (d->workdays_only ? "true" : "false");
    } else if (const auto* w = std::get_if<recurrence::Weekly>(&p.frequency)) {
        ss << ",\"weekdays\":[";
        for (size_t i = 0; i < w->weekdays.size(); ++i) ss << (i ? "," : "") << w->weekdays[i];
        ss << "]";
    } else if (const auto* m = std::get_if<recurrence::Monthly>(&p.frequency)) {
        ss << ",\"day_of_month\":" << m->day_of_month;
    } else if (const auto* y = std::get_if<recurrence::Yearly>(&p.frequency)) {
        ss << ",\"day_of_month\":" << y->day_of_month;
    }
    ss << ",\"exceptions\":[";
    bool first = true;
    for (const auto& d : p.exceptions) {
        ss << (first ? "" : ",") << json_quote(recurrence::format_iso_date(d));
        first = false;
    }
    ss << "]}";
    return ss.str();
}

std::string entry_to_json(const scheduling::ScheduleEntry& e) {
    std::ostringstream ss;
    ss << "{\"entry_id\":" << json_quote(e.entry_id);
    ss << ",\"tenant_id\":" << json_quote(e.tenant_id);
    ss << ",\"title\":" << json_quote(e.title);
    ss << ",\"notes\":" << json_quote(e.notes);
    ss << ",\"status\":" << json_quote(e.status);
    ss << ",\"scheduled_start\":" << json_quote(recurrence::format_iso_z(e.scheduled_start));
    ss << ",\"scheduled_end\":" << json_quote(recurrence::format_iso_z(e.scheduled_end));
    ss << ",\"assigned_user_ids\":" << string_array(e.assigned_user_ids);
    ss << ",\"work_item\":{\"type\":" << json_quote(e.work_item.type) << ",\"id\":" << opt_string(e.work_item.id) << "}";
    ss << ",\"original_entry_id\":" << opt_string(e.original_entry_id);
    ss << ",\"occurrence_date\":" << opt_date(e.occurrence_date);
    ss << ",\"split_from_entry_id\":" << opt_string(e.split_from_entry_id);
    ss << ",\"recurrence\":" << (e.recurrence ? pattern_to_json(*e.recurrence) : std::string("null"));
    ss << "}";
    return ss.str();
}

std::string conflict_to_json(const scheduling::ScheduleConflict& c) {
    return "{\"conflict_id\":" + json_quote(c.conflict_id)
        + ",\"entry_1\":" + ref_to_json(c.entry_1)
        + ",\"entry_2\":" + ref_to_json(c.entry_2)
        + ",\"conflict_type\":" + json_quote(c.conflict_type)
        + ",\"resolved\":" + (c.resolved ? "true" : "false")
        + ",\"resolution_notes\":" + json_quote(c.resolution_notes) + "}";
}

std::string conflicts_to_json(const std::vector<scheduling::ScheduleConflict>& cs) {
    std::string out = "[";
    for (size_t i = 0; i < cs.size(); ++i) {
        if (i) out += ",";
        out += conflict_to_json(cs[i]);
    }
    return out + "]";
}

std::string view_to_json(const scheduling::EntryView& v) {
    return "{\"ref\":" + ref_to_json(v.ref)
        + ",\"is_virtual\":" + (v.is_virtual ? "true" : "false")
        + ",\"entry\":" + entry_to_json(v.entry)
        + ",\"conflicts\":" + conflicts_to_json(v.conflicts) + "}";
}

recurrence::Pattern pattern_from_json(const JsonValue& js) {
    try {
        js.as_object("recurrence");
        recurrence::Pattern p;
        const std::string freq_name = require(js, "frequency").as_string("frequency");
        auto freq = recurrence::frequency_from_name(freq_name);
        if (!freq) throw JsonError("unknown frequency " + freq_name);
        p.frequency = *freq;
        if (const auto* v = js.find("interval")) p.interval = static_cast<int>(v->as_int("interval"));
        // start_date may be left to the entry's start
        if (const auto* v = js.find("start_date"); v && !v->is_null()) p.start_date = date_field(*v, "start_date");
        if (const auto* v = js.find("end_date"); v && !v->is_null()) p.end_date = date_field(*v, "end_date");
        if (const auto* v = js.find("occurrence_count"); v && !v->is_null()) {
            p.occurrence_count = static_cast<int>(v->as_int("occurrence_count"));
        }
        if (const auto* v = js.find("workdays_only"); v && v->as_bool("workdays_only")) {
            auto* daily = std::get_if<recurrence::Daily>(&p.frequency);
            if (!daily) throw JsonError("workdays_only applies to daily patterns only");
            daily->workdays_only = true;
        }
        if (const auto* v = js.find("weekdays"); v && !v->is_null()) {
            auto* weekly = std::get_if<recurrence::Weekly>(&p.frequency);
            if (!weekly) throw JsonError("weekdays applies to weekly patterns only");
            for (const auto& item : v->as_array("weekdays")) weekly->weekdays.push_back(weekday_field(item));
        }
        if (const auto* v = js.find("day_of_month"); v && !v->is_null()) {
            int dom = static_cast<int>(v->as_int("day_of_month"));
            if (auto* m = std::get_if<recurrence::Monthly>(&p.frequency)) m->day_of_month = dom;
            else if (auto* y = std::get_if<recurrence::Yearly>(&p.frequency)) y->day_of_month = dom;
            else throw JsonError("day_of_month applies to monthly and yearly patterns only");
        }
        if (const auto* v = js.find("exceptions"); v && !v->is_null()) {
            for (const auto& item : v->as_array("exceptions")) p.exceptions.insert(date_field(item, "exceptions"));
        }
        return p;
    } catch (const JsonError& e) {
        throw SchedulingError(ErrorCode::InvalidPattern, e.what());
    }
}

scheduling::ScheduleEntry draft_from_json(const JsonValue& js) {
    try {
        js.as_object("body");
        scheduling::ScheduleEntry e;
        e.scheduled_start = time_field(require(js, "scheduled_start"), "scheduled_start");
        e.scheduled_end = time_field(require(js, "scheduled_end"), "scheduled_end");
        e.assigned_user_ids = assignees_field(require(js, "assigned_user_ids"));
        if (const auto* v = js.find("title")) e.title = v->as_string("title");
        if (const auto* v = js.find("notes")) e.notes = v->as_string("notes");
        if (const auto* v = js.find("status")) e.status = v->as_string("status");
        if (const auto* v = js.find("work_item"); v && !v->is_null()) e.work_item = work_item_field(*v);
        if (const auto* v = js.find("recurrence")) e.recurrence = recurrence_field(*v);
        return e;
    } catch (const JsonError& e) {
        throw SchedulingError(ErrorCode::InvalidEntry, e.what());
    }
}

scheduling::EntryChanges changes_from_json(const JsonValue& js) {
    try {
        js.as_object("body");
        scheduling::EntryChanges c;
        if (const auto* v = js.find("scheduled_start")) c.scheduled_start = time_field(*v, "scheduled_start");
        if (const auto* v = js.find("scheduled_end")) c.scheduled_end = time_field(*v, "scheduled_end");
        if (const auto* v = js.find("assigned_user_ids")) c.assigned_user_ids = assignees_field(*v);
        if (const auto* v = js.find("title")) c.title = v->as_string("title");
        if (const auto* v = js.find("notes")) c.notes = v->as_string("notes");
        if (const auto* v = js.find("status")) c.status = v->as_string("status");
        if (const auto* v = js.find("work_item")) c.work_item = work_item_field(*v);
        if (const auto* v = js.find("recurrence")) c.recurrence = recurrence_field(*v);
        return c;
    } catch (const JsonError& e) {
        throw SchedulingError(ErrorCode::InvalidEntry, e.what());
    }
}
