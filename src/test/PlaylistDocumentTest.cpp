#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/PlaylistDocument.hpp"
#include "TestSupport.hpp"

using namespace playoutplanner::domain;
using playoutplanner::test::Item;
using playoutplanner::test::Slot;

namespace {

PlaylistEntry Entry(std::size_t slotIndex, const ScheduleSlot& slot, const MediaItem& item) {
    PlaylistEntry entry;
    entry.slotIndex = slotIndex;
    entry.startTime = slot.startTime;
    entry.mediaItem = item;
    entry.actualDurationSeconds = item.durationSeconds;
    return entry;
}

bool Mentions(const std::vector<std::string>& violations, const std::string& needle) {
    for (const auto& v : violations) {
        if (v.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PlaylistDocument Validation Test..." << std::endl;

    const std::vector<ScheduleSlot> slots = {
        Slot("06:00", "news", 300.0),
        Slot("07:00", "film", 5400.0),
        Slot("10:00", "news", 300.0),
    };
    const auto news = Item("newsA", "news", 300.0);
    const auto film = Item("film1", "film", 5400.0);

    // Sound document
    {
        PlaylistDocument doc("Channel 1", "2026-06-01", slots);
        doc.addEntry(Entry(0, slots[0], news));
        doc.addEntry(Entry(1, slots[1], film));
        UnfillableSlot gap;
        gap.slotIndex = 2;
        gap.startTime = slots[2].startTime;
        gap.category = "news";
        doc.addUnfillable(gap);
        assert(doc.validate().empty());
        assert(!doc.isComplete());
    }

    // Entries out of airtime order
    {
        PlaylistDocument doc("Channel 1", "2026-06-01", slots);
        doc.addEntry(Entry(2, slots[2], news));
        doc.addEntry(Entry(0, slots[0], news));
        doc.addEntry(Entry(1, slots[1], film));
        assert(Mentions(doc.validate(), "out of order"));
    }

    // Category mismatch
    {
        PlaylistDocument doc("Channel 1", "2026-06-01", slots);
        doc.addEntry(Entry(0, slots[0], news));
        doc.addEntry(Entry(1, slots[1], news));
        doc.addEntry(Entry(2, slots[2], news));
        assert(Mentions(doc.validate(), "requires 'film'"));
    }

    // Start time not taken from the slot
    {
        PlaylistDocument doc("Channel 1", "2026-06-01", slots);
        auto shifted = Entry(0, slots[0], news);
        shifted.startTime += 60;
        doc.addEntry(shifted);
        doc.addEntry(Entry(1, slots[1], film));
        doc.addEntry(Entry(2, slots[2], news));
        assert(Mentions(doc.validate(), "instead of 06:00:00"));
    }

    // Slot left unaccounted and a slot reported twice
    {
        PlaylistDocument doc("Channel 1", "2026-06-01", slots);
        doc.addEntry(Entry(0, slots[0], news));
        UnfillableSlot gap;
        gap.slotIndex = 0;
        gap.category = "news";
        doc.addUnfillable(gap);
        auto violations = doc.validate();
        assert(Mentions(violations, "slot 0 is accounted for 2 times"));
        assert(Mentions(violations, "slot 1 is neither filled nor reported unfillable"));
        assert(Mentions(violations, "slot 2 is neither filled nor reported unfillable"));
    }

    // Overlapping windows in a document built against a malformed slot list
    {
        const std::vector<ScheduleSlot> overlapping = {Slot("06:00", "news", 900.0), Slot("06:10", "news", 300.0)};
        PlaylistDocument doc("Channel 1", "2026-06-01", overlapping);
        doc.addEntry(Entry(0, overlapping[0], news));
        doc.addEntry(Entry(1, overlapping[1], Item("newsB", "news", 280.0)));
        assert(Mentions(doc.validate(), "overlaps"));
    }

    // Reference outside the template
    {
        PlaylistDocument doc("Channel 1", "2026-06-01", slots);
        doc.addEntry(Entry(7, slots[0], news));
        assert(Mentions(doc.validate(), "outside the template"));
    }

    std::cout << "[PASS] PlaylistDocument Validation Test." << std::endl;
    return 0;
}
