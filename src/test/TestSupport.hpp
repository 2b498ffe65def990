/**
 * @file TestSupport.hpp
 * @brief Builders and in-memory fakes shared by the test executables.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/MediaCatalog.hpp"
#include "domain/MediaScanner.hpp"
#include "domain/PlaylistRepository.hpp"
#include "domain/ScheduleTemplate.hpp"

namespace playoutplanner::test {

inline domain::MediaItem Item(const std::string& id, const std::string& category, double duration) {
    domain::MediaItem item;
    item.id = id;
    item.filePath = "/media/" + category + "/" + id + ".mp4";
    item.category = category;
    item.durationSeconds = duration;
    return item;
}

inline domain::ScheduleSlot Slot(const std::string& clock, const std::string& category, double target) {
    return domain::ScheduleSlot{*domain::ParseClock(clock), category, target};
}

/// Scanner returning a fixed inventory.
class FakeScanner : public domain::MediaScanner {
public:
    explicit FakeScanner(domain::ScanResult result) : m_result(std::move(result)) {}
    domain::ScanResult scan() override { return m_result; }
    std::string rootPath() const override { return "/media"; }

private:
    domain::ScanResult m_result;
};

/// Probe answering from a file-name table; unknown files cannot be probed.
class FakeProbe : public domain::MediaProbe {
public:
    explicit FakeProbe(std::map<std::string, double> durations) : m_durations(std::move(durations)) {}

    std::optional<double> probeDuration(const std::string& filePath) override {
        const auto slash = filePath.find_last_of('/');
        const std::string name = slash == std::string::npos ? filePath : filePath.substr(slash + 1);
        auto it = m_durations.find(name);
        if (it == m_durations.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, double> m_durations;
};

class InMemoryPlaylistRepository : public domain::PlaylistRepository {
public:
    std::string save(const domain::PlaylistDocument& document) override {
        m_saved[document.date()] = document.entries().size();
        return "memory://" + document.date();
    }

    std::optional<std::string> load(const domain::PlaylistDate& date) override {
        auto it = m_saved.find(date.toString());
        if (it == m_saved.end()) return std::nullopt;
        return "{\"date\": \"" + it->first + "\", \"total_items\": " + std::to_string(it->second) + "}";
    }

    std::size_t savedCount() const { return m_saved.size(); }

private:
    std::map<std::string, std::size_t> m_saved;
};

class InMemoryUsageHistoryRepository : public domain::UsageHistoryRepository {
public:
    domain::UsageHistory load() override { return m_history; }
    void save(const domain::UsageHistory& history) override { m_history = history; }

private:
    domain::UsageHistory m_history;
};

} // namespace playoutplanner::test
