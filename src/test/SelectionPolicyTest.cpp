#include <cassert>
#include <iostream>

#include "application/SelectionPolicy.hpp"
#include "TestSupport.hpp"

using namespace playoutplanner;
using test::Item;

int main() {
    std::cout << "[Test] Starting SelectionPolicy Test..." << std::endl;

    domain::MediaCatalog catalog;
    catalog.add(Item("long", "film", 3000.0));
    catalog.add(Item("fit", "film", 2650.0));
    catalog.add(Item("exact", "film", 2700.0));
    catalog.add(Item("slightlyOver", "film", 2800.0));
    catalog.declareCategory("sports");

    application::SelectionPolicy policy(catalog, 0.05);

    // Fresh history: closest duration within tolerance wins among never-used items
    {
        domain::UsageHistory history;
        auto r = policy.select("film", 2700.0, history, 100);
        assert(r.found());
        assert(r.item->id == "exact");
        assert(history.size() == 1);
        assert(history.lastUsed("exact") == 100);

        // Next pick prefers the remaining never-used items
        auto r2 = policy.select("film", 2700.0, history, 200);
        assert(r2.item->id == "fit" || r2.item->id == "slightlyOver");
        // 2650 (diff 50) beats 2800 (diff 100, still within +5%)
        assert(r2.item->id == "fit");
    }

    // Items exceeding the target beyond tolerance lose to shorter ones even when closer
    {
        domain::MediaCatalog c;
        c.add(Item("over", "news", 330.0));   // +10%, beyond tolerance
        c.add(Item("under", "news", 250.0));  // -16%, still does not exceed
        application::SelectionPolicy p(c, 0.05);
        domain::UsageHistory history;
        assert(p.select("news", 300.0, history, 1).item->id == "under");
    }

    // Nothing fits within tolerance: closest absolute match
    {
        domain::MediaCatalog c;
        c.add(Item("far", "news", 900.0));
        c.add(Item("near", "news", 400.0));
        application::SelectionPolicy p(c, 0.05);
        domain::UsageHistory history;
        assert(p.select("news", 300.0, history, 1).item->id == "near");
    }

    // Equal duration and recency: catalog insertion order
    {
        domain::MediaCatalog c;
        c.add(Item("first", "news", 300.0));
        c.add(Item("second", "news", 300.0));
        application::SelectionPolicy p(c, 0.05);
        domain::UsageHistory history;
        assert(p.select("news", 300.0, history, 1).item->id == "first");
        assert(p.select("news", 300.0, history, 2).item->id == "second");
        assert(p.select("news", 300.0, history, 3).item->id == "first");
    }

    // Recency dominates duration fit
    {
        domain::MediaCatalog c;
        c.add(Item("perfect", "news", 300.0));
        c.add(Item("poor", "news", 120.0));
        application::SelectionPolicy p(c, 0.05);
        domain::UsageHistory history;
        history.recordUse("perfect", 50);
        history.recordUse("poor", 10);
        assert(p.select("news", 300.0, history, 60).item->id == "poor");
    }

    // The item's own last-used timestamp counts when the history is silent
    {
        domain::MediaCatalog c;
        auto aired = Item("aired", "news", 300.0);
        aired.lastUsedTimestamp = 1000;
        c.add(aired);
        c.add(Item("fresh", "news", 200.0));
        application::SelectionPolicy p(c, 0.05);
        domain::UsageHistory history;
        assert(p.select("news", 300.0, history, 2000).item->id == "fresh");
    }

    // NotFound outcomes leave the history untouched
    {
        domain::UsageHistory history;
        auto empty = policy.select("sports", 600.0, history, 1);
        assert(!empty.found());
        assert(empty.failure == domain::UnfillableCode::CategoryEmpty);

        auto absent = policy.select("weather", 600.0, history, 1);
        assert(!absent.found());
        assert(absent.failure == domain::UnfillableCode::CategoryNotFound);
        assert(history.empty());
    }

    assert(policy.withinTolerance(285.0, 300.0));
    assert(!policy.withinTolerance(280.0, 300.0));
    assert(policy.fitsTarget(100.0, 300.0));
    assert(!policy.fitsTarget(316.0, 300.0));

    std::cout << "[PASS] SelectionPolicy Test." << std::endl;
    return 0;
}
