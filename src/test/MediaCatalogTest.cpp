#include <cassert>
#include <iostream>

#include "domain/MediaCatalog.hpp"
#include "domain/PlannerErrors.hpp"
#include "TestSupport.hpp"

using namespace playoutplanner::domain;
using playoutplanner::test::Item;

int main() {
    std::cout << "[Test] Starting MediaCatalog Test..." << std::endl;

    auto catalog = MediaCatalog::FromScan({
        {"/media/news/b.mp4", "news", 280.0},
        {"/media/music/x.mp4", "music", 200.0},
        {"/media/news/a.mp4", "news", 300.0},
    }, {"sports"});

    assert(catalog.size() == 3);
    assert(catalog.categories().size() == 3);
    assert(catalog.categories()[0] == "sports");
    assert(catalog.categories()[1] == "news");

    // Insertion order is scan order
    const auto& news = catalog.itemsFor("news");
    assert(news.size() == 2);
    assert(news[0].filePath == "/media/news/b.mp4");
    assert(news[1].id == "/media/news/a.mp4");

    assert(catalog.hasCategory("sports"));
    assert(catalog.isEmpty("sports"));
    assert(catalog.itemsFor("sports").empty());
    assert(!catalog.hasCategory("weather"));
    assert(catalog.isEmpty("weather"));

    bool notFound = false;
    try {
        catalog.itemsFor("weather");
    } catch (const CategoryNotFound& e) {
        notFound = e.category() == "weather";
    }
    assert(notFound);

    // Invariants at the boundary
    MediaCatalog strict;
    strict.add(Item("a", "news", 300.0));

    bool duplicate = false;
    try {
        strict.add(Item("a", "music", 120.0));
    } catch (const InvalidCatalog&) {
        duplicate = true;
    }
    assert(duplicate && "An item may live in one bucket only.");

    bool zeroDuration = false;
    try {
        strict.add(Item("b", "news", 0.0));
    } catch (const InvalidCatalog&) {
        zeroDuration = true;
    }
    assert(zeroDuration);

    bool noCategory = false;
    try {
        strict.add(Item("c", "", 10.0));
    } catch (const InvalidCatalog&) {
        noCategory = true;
    }
    assert(noCategory);
    assert(strict.size() == 1);

    std::cout << "[PASS] MediaCatalog Test." << std::endl;
    return 0;
}
