/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the planner configuration (settings.json).
 *
 * Provides a unified way to access directories, the daily template and
 * selection tuning without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ScheduleTemplate.hpp"

namespace playoutplanner::infrastructure {

/**
 * @struct PlannerConfig
 * @brief Every tunable of the service, with station defaults.
 */
struct PlannerConfig {
    std::string channel = "Channel 1";
    std::string videoDirectory = "./mock_media";
    std::string outputDirectory = "./playlists";
    std::string stateFile;                  ///< Empty means <outputDirectory>/.playlist_state.json.
    double durationTolerance = 0.05;
    double defaultDurationSeconds = 900.0;  ///< Used when a file cannot be probed.
    std::string httpHost = "0.0.0.0";
    int httpPort = 8000;

    /// Folder-name substring -> logical category, matched in order.
    std::vector<std::pair<std::string, std::string>> categoryMap;

    std::vector<domain::SlotSpec> fixedSlots;

    /** @brief Rotation state file, resolving the default location. */
    std::string resolvedStateFile() const;
};

class ConfigLoader {
public:
    /** @brief Configuration used when settings.json is absent. */
    static PlannerConfig Defaults();

    /**
     * @brief Reads settings.json, falling back to defaults key by key.
     * @param configPath Path to the JSON file.
     * @return Loaded configuration; unreadable files yield Defaults().
     */
    static PlannerConfig Load(const std::string& configPath);

    /**
     * @brief Applies PLAYOUT_VIDEO_DIR / PLAYOUT_OUTPUT_DIR overrides.
     */
    static void ApplyEnvironment(PlannerConfig& config);

    /**
     * @brief Parses a "fixed_slots" array.
     * @throws std::invalid_argument or nlohmann::json::exception on a malformed record.
     */
    static std::vector<domain::SlotSpec> ParseSlots(const nlohmann::json& slots);

    /** @brief Serializes slots back to the "fixed_slots" form. */
    static nlohmann::json SlotsToJson(const std::vector<domain::SlotSpec>& slots);
};

} // namespace playoutplanner::infrastructure
