#include <cassert>
#include <iostream>
#include <vector>

#include "domain/PlannerErrors.hpp"
#include "domain/PlaylistDate.hpp"
#include "domain/ScheduleTemplate.hpp"

using namespace playoutplanner::domain;

namespace {

bool RejectsTemplate(const std::vector<SlotSpec>& specs) {
    try {
        ScheduleTemplate::FromSpecs(specs);
    } catch (const InvalidTemplate& e) {
        assert(!e.problems().empty());
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ScheduleTemplate Test..." << std::endl;

    // Clock parsing
    assert(ParseClock("00:00") == 0);
    assert(ParseClock("07:14:00") == 7 * 3600 + 14 * 60);
    assert(ParseClock("23:59:59") == 86399);
    assert(!ParseClock("24:00"));
    assert(!ParseClock("12:60"));
    assert(!ParseClock("12"));
    assert(!ParseClock("12:00:"));
    assert(!ParseClock("ab:cd"));
    assert(FormatClock(22 * 3600 + 24 * 60) == "22:24:00");

    // A valid day
    auto tmpl = ScheduleTemplate::FromSpecs({
        {"06:00:00", "psaltir", 3600.0},
        {"07:14:00", "molitve", 900.0},
        {"13:00", "serije", 2700.0},
    });
    assert(tmpl.size() == 3);
    assert(tmpl.at(1).startTime == 7 * 3600 + 14 * 60);
    assert(tmpl.at(0).endTime() == 7 * 3600);

    // Touching windows are allowed
    auto touching = ScheduleTemplate::FromSpecs({{"00:00", "news", 300.0}, {"00:05", "news", 300.0}});
    assert(touching.size() == 2);

    // Empty template is valid and yields an empty playlist later
    assert(ScheduleTemplate::FromSpecs({}).empty());

    // Structural rejections
    assert(RejectsTemplate({{"10:00", "news", 300.0}, {"09:00", "news", 300.0}}));  // unordered
    assert(RejectsTemplate({{"10:00", "news", 300.0}, {"10:00", "news", 300.0}}));  // same start
    assert(RejectsTemplate({{"10:00", "news", 900.0}, {"10:10", "news", 300.0}}));  // overlap
    assert(RejectsTemplate({{"10:00", "", 300.0}}));                                 // no category
    assert(RejectsTemplate({{"10:00", "news", 0.0}}));                               // no duration
    assert(RejectsTemplate({{"25:00", "news", 300.0}}));                             // bad clock

    try {
        ScheduleTemplate::FromSlots({ScheduleSlot{-5, "news", 10.0}});
        assert(false && "Negative start must be rejected.");
    } catch (const InvalidTemplate& e) {
        assert(e.problems().size() == 1);
    }

    // Playlist dates
    auto date = PlaylistDate::Parse("2026-06-01");
    assert(date && date->year == 2026 && date->month == 6 && date->day == 1);
    assert(date->toString() == "2026-06-01");
    assert(date->midnightEpochSeconds() == 1780272000LL);
    assert(PlaylistDate::Parse("2024-02-29")->midnightEpochSeconds() == 1709164800LL);
    assert(!PlaylistDate::Parse("2025-02-29"));
    assert(!PlaylistDate::Parse("2026-13-01"));
    assert(!PlaylistDate::Parse("2026-6-1"));
    assert(PlaylistDate::Parse("2026-12-31")->next().toString() == "2027-01-01");
    assert(PlaylistDate::Parse("2024-02-28")->next().toString() == "2024-02-29");

    std::cout << "[PASS] ScheduleTemplate Test." << std::endl;
    return 0;
}
