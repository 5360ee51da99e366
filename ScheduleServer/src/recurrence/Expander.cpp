#include "Expander.h"
#include <algorithm>

namespace recurrence {

namespace greg = boost::gregorian;

namespace {

const Date kMaxDate(9999, 12, 31);
constexpr int kMaxEmptyPeriods = 8;

int clamp_day(int year, int month, int day) {
    int last = greg::gregorian_calendar::end_of_month_day(static_cast<unsigned short>(year), static_cast<unsigned short>(month));
    return std::min(day, last);
}

// Candidate dates grouped into periods: one day (daily), one week starting Monday (weekly),
// one month (monthly) or one year (yearly), every `interval` units from start_date.
class CandidateSequence {
public:
    explicit CandidateSequence(const Pattern& p) : p_(p), start_(p.start_date) {
        if (const auto* w = std::get_if<Weekly>(&p.frequency)) {
            weekdays_ = w->weekdays;
            std::sort(weekdays_.begin(), weekdays_.end());
            weekdays_.erase(std::unique(weekdays_.begin(), weekdays_.end()), weekdays_.end());
            if (weekdays_.empty()) weekdays_.push_back(weekday_index(start_));
            week_start_ = start_ - greg::days(weekday_index(start_));
        } else if (const auto* m = std::get_if<Monthly>(&p.frequency)) {
            day_of_month_ = m->day_of_month > 0 ? m->day_of_month : start_.day().as_number();
        } else if (const auto* y = std::get_if<Yearly>(&p.frequency)) {
            day_of_month_ = y->day_of_month > 0 ? y->day_of_month : start_.day().as_number();
        } else if (workdays_only(p)) {
            const int w0 = weekday_index(start_);
            for (int k = 0; k < 7; ++k) {
                bool workday = ((w0 + static_cast<int64_t>(k) * p.interval) % 7) < 5;
                cycle_[k] = workday;
                if (workday) ++cycle_count_;
            }
        }
        std::vector<Date> first;
        slots(0, first);
        first_period_count_ = static_cast<int64_t>(first.size());
    }

    const Pattern& pattern() const { return p_; }
    const std::vector<int>& weekdays() const { return weekdays_; }
    int day_of_month() const { return day_of_month_; }

    // Candidates of period n in ascending order. False once the period lies past the calendar.
    bool slots(int64_t period, std::vector<Date>& out) const {
        out.clear();
        const int64_t interval = p_.interval;
        const int64_t room = (kMaxDate - start_).days();
        switch (p_.frequency.index()) {
            case 0: {
                int64_t off = period * interval;
                if (off > room) return false;
                Date d = start_ + greg::days(static_cast<long>(off));
                if (!workdays_only(p_) || weekday_index(d) < 5) out.push_back(d);
                return true;
            }
            case 1: {
                int64_t off = period * 7 * interval - weekday_index(start_);
                if (off > room) return false;
                Date ws = week_start_ + greg::days(static_cast<long>(period * 7 * interval));
                for (int wd : weekdays_) {
                    if (off + wd > room) break;
                    Date d = ws + greg::days(wd);
                    if (d >= start_) out.push_back(d);
                }
                return true;
            }
            case 2: {
                int64_t months = static_cast<int64_t>(start_.month().as_number()) - 1 + period * interval;
                int64_t year = static_cast<int64_t>(start_.year()) + months / 12;
                if (year > 9999) return false;
                int month = static_cast<int>(months % 12) + 1;
                Date d(static_cast<int>(year), month, clamp_day(static_cast<int>(year), month, day_of_month_));
                if (d >= start_) out.push_back(d);
                return true;
            }
            default: {
                int64_t year = static_cast<int64_t>(start_.year()) + period * interval;
                if (year > 9999) return false;
                int month = start_.month().as_number();
                Date d(static_cast<int>(year), month, clamp_day(static_cast<int>(year), month, day_of_month_));
                if (d >= start_) out.push_back(d);
                return true;
            }
        }
    }

    // Last period whose first day is on or before d (0 when d precedes the series).
    int64_t period_at_or_before(const Date& d) const {
        if (d <= start_) return 0;
        const int64_t interval = p_.interval;
        switch (p_.frequency.index()) {
            case 0:
                return (d - start_).days() / interval;
            case 1:
                return (d - week_start_).days() / (7 * interval);
            case 2: {
                int64_t months = (static_cast<int64_t>(d.year()) - start_.year()) * 12
                    + (static_cast<int64_t>(d.month().as_number()) - start_.month().as_number());
                return months / interval;
            }
            default:
                return (static_cast<int64_t>(d.year()) - start_.year()) / interval;
        }
    }

    // Candidates in periods [0, period).
    int64_t count_before_period(int64_t period) const {
        if (period <= 0) return 0;
        switch (p_.frequency.index()) {
            case 0: {
                if (!workdays_only(p_)) return period;
                int64_t n = (period / 7) * cycle_count_;
                for (int64_t k = 0; k < period % 7; ++k) {
                    if (cycle_[k]) ++n;
                }
                return n;
            }
            case 1:
                return first_period_count_ + (period - 1) * static_cast<int64_t>(weekdays_.size());
            default:
                return first_period_count_ + (period - 1);
        }
    }

private:
    const Pattern& p_;
    Date start_;
    Date week_start_;
    std::vector<int> weekdays_;
    int day_of_month_ = 1;
    bool cycle_[7] = {false, false, false, false, false, false, false};
    int64_t cycle_count_ = 0;
    int64_t first_period_count_ = 0;
};

// Visits candidates in [from, to] within the end condition; visit(date, index) returns false to stop.
template <typename Visit>
void walk(const CandidateSequence& seq, const Date& from, const Date& to, Visit visit) {
    const Pattern& p = seq.pattern();
    int64_t period = seq.period_at_or_before(from);
    int64_t index = seq.count_before_period(period);
    int empty_run = 0;
    std::vector<Date> slots;
    for (;; ++period) {
        if (!seq.slots(period, slots)) return;
        if (slots.empty()) {
            if (++empty_run > kMaxEmptyPeriods) return;
            continue;
        }
        empty_run = 0;
        for (const Date& d : slots) {
            if (p.occurrence_count && index >= *p.occurrence_count) return;
            if (p.end_date && d > *p.end_date) return;
            if (d > to) return;
            if (d >= from && !visit(d, index)) return;
            ++index;
        }
    }
}

}

ExpansionLimitExceeded::ExpansionLimitExceeded(size_t limit)
    : std::runtime_error("expansion exceeds " + std::to_string(limit) + " occurrences"), limit_(limit) {}

Occurrence occurrence_on(const SeriesAnchor& anchor, const Date& d, const TimeZone& tz) {
    Occurrence occ;
    occ.anchor_date = d;
    occ.start = tz.to_utc(d, tz.local_time_of_day(anchor.start));
    occ.end = occ.start + (anchor.end - anchor.start);
    return occ;
}

bool is_skipped(const Pattern& p, const Date& d, const HolidayCalendar* holidays) {
    if (p.exceptions.count(d)) return true;
    return workdays_only(p) && holidays && holidays->is_holiday(d);
}

std::vector<Occurrence> expand(const Pattern& p,
                               const SeriesAnchor& anchor,
                               std::time_t window_start,
                               std::time_t window_end,
                               const OverrideMap& overrides,
                               const ExpansionContext& ctx) {
    std::vector<Occurrence> out;
    if (window_end <= window_start || p.start_date.is_special()) return out;

    const std::time_t duration = anchor.end - anchor.start;
    // one extra day either side absorbs the offset between the anchor's zone day and UTC
    Date from = ctx.tz.local_date(window_start - duration) - greg::days(1);
    Date to = ctx.tz.local_date(window_end);
    if (from < p.start_date) from = p.start_date;
    if (to < from) return out;

    CandidateSequence seq(p);
    walk(seq, from, to, [&](const Date& d, int64_t) {
        std::optional<std::string> override_id;
        auto ov = overrides.find(d);
        if (ov != overrides.end()) {
            if (!ov->second) return true;
            override_id = ov->second;
        } else if (is_skipped(p, d, ctx.holidays)) {
            return true;
        }
        Occurrence occ = occurrence_on(anchor, d, ctx.tz);
        if (occ.end <= window_start || occ.start >= window_end) return true;
        occ.override_entry_id = std::move(override_id);
        out.push_back(std::move(occ));
        if (out.size() > ctx.max_occurrences) throw ExpansionLimitExceeded(ctx.max_occurrences);
        return true;
    });
    return out;
}

bool is_candidate(const Pattern& p, const Date& d) {
    if (p.start_date.is_special() || d < p.start_date) return false;
    bool found = false;
    CandidateSequence seq(p);
    walk(seq, d, d, [&](const Date&, int64_t) {
        found = true;
        return false;
    });
    return found;
}

int64_t count_candidates_before(const Pattern& p, const Date& d) {
    if (p.start_date.is_special() || d <= p.start_date) return 0;
    CandidateSequence seq(p);
    int64_t period = seq.period_at_or_before(d);
    int64_t n = seq.count_before_period(period);
    std::vector<Date> slots;
    if (seq.slots(period, slots)) {
        for (const Date& s : slots) {
            if (s < d) ++n;
        }
    }
    return n;
}

std::optional<Date> last_candidate_before(const Pattern& p, const Date& d) {
    if (p.start_date.is_special() || d <= p.start_date) return std::nullopt;
    CandidateSequence seq(p);
    std::vector<Date> slots;
    const int64_t top = seq.period_at_or_before(d);
    for (int64_t period = top; period >= 0 && period >= top - 2 * kMaxEmptyPeriods; --period) {
        if (!seq.slots(period, slots)) continue;
        for (auto it = slots.rbegin(); it != slots.rend(); ++it) {
            if (*it < d) return *it;
        }
    }
    return std::nullopt;
}

std::optional<Date> first_candidate(const Pattern& p) {
    if (p.start_date.is_special()) return std::nullopt;
    std::optional<Date> first;
    CandidateSequence seq(p);
    walk(seq, p.start_date, kMaxDate, [&](const Date& d, int64_t) {
        first = d;
        return false;
    });
    return first;
}

std::vector<Date> candidates_between(const Pattern& p, const Date& from, const Date& to, size_t limit) {
    std::vector<Date> out;
    if (p.start_date.is_special() || to < from || limit == 0) return out;
    CandidateSequence seq(p);
    walk(seq, std::max(from, p.start_date), to, [&](const Date& d, int64_t) {
        out.push_back(d);
        return out.size() < limit;
    });
    return out;
}

Pattern tail_pattern(const Pattern& p, const Date& d) {
    Pattern tail = p;
    CandidateSequence seq(p);
    tail.start_date = d;
    if (auto* w = std::get_if<Weekly>(&tail.frequency)) {
        w->weekdays = seq.weekdays();
    } else if (auto* m = std::get_if<Monthly>(&tail.frequency)) {
        m->day_of_month = seq.day_of_month();
    } else if (auto* y = std::get_if<Yearly>(&tail.frequency)) {
        y->day_of_month = seq.day_of_month();
    }
    if (tail.occurrence_count) {
        int64_t remaining = *tail.occurrence_count - count_candidates_before(p, d);
        tail.occurrence_count = static_cast<int>(std::max<int64_t>(remaining, 1));
    }
    if (tail.end_date && *tail.end_date <= d) {
        tail.end_date.reset();
        tail.occurrence_count = 1;
    }
    tail.exceptions.clear();
    for (auto it = p.exceptions.lower_bound(d); it != p.exceptions.end(); ++it) tail.exceptions.insert(*it);
    return tail;
}

bool truncate_before(Pattern& p, const Date& d) {
    const int64_t before = count_candidates_before(p, d);
    if (before == 0) return false;
    if (p.occurrence_count) {
        p.occurrence_count = static_cast<int>(std::min<int64_t>(*p.occurrence_count, before));
    } else {
        auto last = last_candidate_before(p, d);
        if (last && *last > p.start_date) {
            p.end_date = *last;
        } else {
            // a lone first occurrence cannot be expressed as end_date > start_date
            p.end_date.reset();
            p.occurrence_count = static_cast<int>(before);
        }
    }
    p.exceptions.erase(p.exceptions.lower_bound(d), p.exceptions.end());
    return true;
}

}
