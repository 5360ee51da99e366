#pragma once

#include "MiniJson.h"
#include "../scheduling/Entry.h"
#include <string>
#include <vector>

// Wire format of entries, patterns and conflicts. Decoders throw
// scheduling::SchedulingError (InvalidEntry, or InvalidPattern for the recurrence
// object) on malformed input.

std::string pattern_to_json(const recurrence::Pattern& p);
std::string entry_to_json(const scheduling::ScheduleEntry& e);
std::string conflict_to_json(const scheduling::ScheduleConflict& c);
std::string conflicts_to_json(const std::vector<scheduling::ScheduleConflict>& cs);
std::string view_to_json(const scheduling::EntryView& v);

recurrence::Pattern pattern_from_json(const JsonValue& js);
// Body of POST /entries
scheduling::ScheduleEntry draft_from_json(const JsonValue& js);
// Body of PUT /entries/{id}; only members present in the object are changed
scheduling::EntryChanges changes_from_json(const JsonValue& js);
