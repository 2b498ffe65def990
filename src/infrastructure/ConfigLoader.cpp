/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace playoutplanner::infrastructure {

using json = nlohmann::json;

namespace {

// settings.json is read as ordered_json so category_map keeps its file order.
template <typename Json>
std::vector<domain::SlotSpec> SlotsFrom(const Json& slots) {
    std::vector<domain::SlotSpec> result;
    if (!slots.is_array()) {
        throw std::invalid_argument("fixed_slots must be an array");
    }
    for (const auto& slot : slots) {
        domain::SlotSpec spec;
        spec.start = slot.at("start").template get<std::string>();
        spec.category = slot.at("category").template get<std::string>();
        spec.targetDurationSeconds = slot.at("target_duration").template get<double>();
        result.push_back(std::move(spec));
    }
    return result;
}

} // namespace

std::string PlannerConfig::resolvedStateFile() const {
    if (!stateFile.empty()) return stateFile;
    return (std::filesystem::path(outputDirectory) / ".playlist_state.json").string();
}

PlannerConfig ConfigLoader::Defaults() {
    PlannerConfig config;
    config.categoryMap = {
        {"psaltir", "psaltir"},
        {"molitv", "molitve"},
        {"duhov", "duhovne_pouke"},
        {"decij", "deciji"},
        {"serij", "serije"},
        {"dokument", "dokumentarni"},
        {"putopis", "putopisi"},
        {"muzik", "muzika"},
        {"ostalo", "ostalo"},
        {"spica", "spica"},
    };
    config.fixedSlots = {
        {"06:00:00", "psaltir", 3600.0},
        {"07:14:00", "molitve", 900.0},
        {"13:00:00", "serije", 2700.0},
        {"18:00:00", "molitve", 900.0},
        {"19:00:00", "deciji", 1800.0},
        {"20:00:00", "serije", 2700.0},
        {"22:24:00", "psaltir", 1800.0},
        {"23:00:00", "serije", 2700.0},
    };
    return config;
}

std::vector<domain::SlotSpec> ConfigLoader::ParseSlots(const json& slots) {
    return SlotsFrom(slots);
}

json ConfigLoader::SlotsToJson(const std::vector<domain::SlotSpec>& slots) {
    json out = json::array();
    for (const auto& slot : slots) {
        out.push_back({
            {"start", slot.start},
            {"category", slot.category},
            {"target_duration", slot.targetDurationSeconds}
        });
    }
    return out;
}

PlannerConfig ConfigLoader::Load(const std::string& configPath) {
    PlannerConfig config = Defaults();
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] " << configPath << " not found, using defaults." << std::endl;
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::ordered_json j;
        f >> j;

        config.channel = j.value("channel", config.channel);
        config.videoDirectory = j.value("video_directory", config.videoDirectory);
        config.outputDirectory = j.value("output_directory", config.outputDirectory);
        config.stateFile = j.value("state_file", config.stateFile);
        config.durationTolerance = j.value("duration_tolerance", config.durationTolerance);
        config.defaultDurationSeconds = j.value("default_duration_seconds", config.defaultDurationSeconds);
        config.httpHost = j.value("http_host", config.httpHost);
        config.httpPort = j.value("http_port", config.httpPort);

        if (j.contains("category_map") && j["category_map"].is_object()) {
            config.categoryMap.clear();
            for (auto it = j["category_map"].begin(); it != j["category_map"].end(); ++it) {
                config.categoryMap.emplace_back(it.key(), it.value().get<std::string>());
            }
        }
        if (j.contains("fixed_slots")) {
            config.fixedSlots = SlotsFrom(j["fixed_slots"]);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                  << " (falling back to defaults)" << std::endl;
        return Defaults();
    }

    if (config.durationTolerance < 0.0) {
        std::cerr << "[ConfigLoader] Negative duration_tolerance ignored." << std::endl;
        config.durationTolerance = Defaults().durationTolerance;
    }
    if (config.defaultDurationSeconds <= 0.0) {
        std::cerr << "[ConfigLoader] Non-positive default_duration_seconds ignored." << std::endl;
        config.defaultDurationSeconds = Defaults().defaultDurationSeconds;
    }
    return config;
}

void ConfigLoader::ApplyEnvironment(PlannerConfig& config) {
    const char* videoDir = std::getenv("PLAYOUT_VIDEO_DIR");
    if (videoDir && *videoDir) {
        config.videoDirectory = videoDir;
    }
    const char* outputDir = std::getenv("PLAYOUT_OUTPUT_DIR");
    if (outputDir && *outputDir) {
        config.outputDirectory = outputDir;
    }
}

} // namespace playoutplanner::infrastructure
