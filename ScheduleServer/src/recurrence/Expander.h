#pragma once

#include "HolidayCalendar.h"
#include "Pattern.h"
#include "TimeZone.h"
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace recurrence {

// Times of the master row; wall-clock time of day and duration are taken from it.
struct SeriesAnchor {
    std::time_t start = 0;
    std::time_t end = 0;
};

// occurrence date -> detached entry id, or nullopt for a tombstone
using OverrideMap = std::map<Date, std::optional<std::string>>;

struct Occurrence {
    Date anchor_date;
    std::time_t start = 0;
    std::time_t end = 0;
    // set when a detached entry replaces this occurrence
    std::optional<std::string> override_entry_id;
};

struct ExpansionContext {
    const TimeZone& tz;
    const HolidayCalendar* holidays = nullptr;
    size_t max_occurrences = 5000;
};

class ExpansionLimitExceeded : public std::runtime_error {
public:
    explicit ExpansionLimitExceeded(size_t limit);
    size_t limit() const { return limit_; }
private:
    size_t limit_;
};

// Occurrences of the series intersecting [window_start, window_end), ordered by date.
// Throws ExpansionLimitExceeded when more than ctx.max_occurrences would be returned.
std::vector<Occurrence> expand(const Pattern& p,
                               const SeriesAnchor& anchor,
                               std::time_t window_start,
                               std::time_t window_end,
                               const OverrideMap& overrides,
                               const ExpansionContext& ctx);

// d is in the candidate sequence and inside the end condition
bool is_candidate(const Pattern& p, const Date& d);
// d is cancelled (exceptions) or, for workdays_only, a holiday
bool is_skipped(const Pattern& p, const Date& d, const HolidayCalendar* holidays);
// candidates strictly before d, ignoring the end condition
int64_t count_candidates_before(const Pattern& p, const Date& d);
std::optional<Date> last_candidate_before(const Pattern& p, const Date& d);
std::optional<Date> first_candidate(const Pattern& p);
// ordered candidates in [from, to], at most limit of them
std::vector<Date> candidates_between(const Pattern& p, const Date& from, const Date& to, size_t limit);

Occurrence occurrence_on(const SeriesAnchor& anchor, const Date& d, const TimeZone& tz);

// Pattern continuing the series from candidate d: weekdays and day of month made explicit,
// remaining occurrence count, exceptions on or after d.
Pattern tail_pattern(const Pattern& p, const Date& d);
// Ends the series before d and drops exceptions on or after d.
// Returns false (leaving p untouched) when no candidate precedes d.
bool truncate_before(Pattern& p, const Date& d);

}
