/**
 * @file ApiServer.cpp
 * @brief Implementation of ApiServer.
 */

#include "infrastructure/ApiServer.hpp"
#include <httplib.h>
#include <iostream>
#include "domain/PlannerErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonPlaylistRepository.hpp"

namespace playoutplanner::infrastructure {

using json = nlohmann::json;

namespace {

ApiResponse Error(int status, const std::string& detail) {
    return ApiResponse{status, json{{"detail", detail}}};
}

std::optional<std::string> QueryParam(const httplib::Request& req, const char* key) {
    if (!req.has_param(key)) return std::nullopt;
    return req.get_param_value(key);
}

bool IsTrue(const std::optional<std::string>& value) {
    return value && (*value == "true" || *value == "1" || *value == "yes");
}

void Reply(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    res.set_content(response.body.dump(2), "application/json");
}

std::optional<domain::PlaylistDate> ResolveDate(const std::optional<std::string>& text) {
    if (!text || text->empty()) return domain::PlaylistDate::Today();
    return domain::PlaylistDate::Parse(*text);
}

} // namespace

ApiServer::ApiServer(application::PlaylistService& service)
    : m_service(service), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::registerRoutes() {
    m_server->Get("/videos", [this](const httplib::Request&, httplib::Response& res) {
        Reply(res, listVideos());
    });

    m_server->Get("/template", [this](const httplib::Request&, httplib::Response& res) {
        Reply(res, showTemplate());
    });

    m_server->Post("/generate-playlist", [this](const httplib::Request& req, httplib::Response& res) {
        Reply(res, generatePlaylist(QueryParam(req, "date"), IsTrue(QueryParam(req, "allow_partial")), req.body));
    });

    m_server->Get("/playlist", [this](const httplib::Request& req, httplib::Response& res) {
        Reply(res, fetchPlaylist(QueryParam(req, "date")));
    });
}

bool ApiServer::listen(const std::string& host, int port) {
    std::cout << "[ApiServer] Listening on " << host << ":" << port << std::endl;
    return m_server->listen(host.c_str(), port);
}

void ApiServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

ApiResponse ApiServer::listVideos() {
    try {
        auto catalog = m_service.buildCatalog();
        json files = json::object();
        for (const auto& category : catalog.categories()) {
            json paths = json::array();
            for (const auto& item : catalog.itemsFor(category)) {
                paths.push_back(item.filePath);
            }
            files[category] = paths;
        }
        return ApiResponse{200, json{{"video_directory", m_service.videoDirectory()}, {"video_files", files}}};
    } catch (const domain::InvalidCatalog& e) {
        std::cerr << "[ApiServer] /videos: " << e.what() << std::endl;
        return Error(500, e.what());
    }
}

ApiResponse ApiServer::showTemplate() {
    return ApiResponse{200, json{{"fixed_slots", ConfigLoader::SlotsToJson(m_service.defaultSlots())}}};
}

ApiResponse ApiServer::generatePlaylist(const std::optional<std::string>& date, bool allowPartial,
                                        const std::string& requestBody) {
    auto playlistDate = ResolveDate(date);
    if (!playlistDate) {
        return Error(400, "Invalid date '" + date.value_or("") + "', expected YYYY-MM-DD");
    }

    std::optional<std::vector<domain::SlotSpec>> slots;
    if (!requestBody.empty()) {
        try {
            auto body = json::parse(requestBody);
            if (body.contains("fixed_slots")) {
                slots = ConfigLoader::ParseSlots(body["fixed_slots"]);
            }
        } catch (const std::exception& e) {
            return Error(400, std::string("Malformed template body: ") + e.what());
        }
    }

    try {
        auto result = slots ? m_service.generate(*playlistDate, *slots) : m_service.generate(*playlistDate);
        const auto& document = result.document;
        json playlist = JsonPlaylistRepository::ToJson(document);

        json body = {
            {"playlist_file", result.playlistFile},
            {"total_items", document.entries().size()},
            {"unfillable", playlist["unfillable"]},
            {"warnings", playlist["warnings"]},
            {"playlist", playlist}
        };
        if (!document.isComplete() && !allowPartial) {
            body["detail"] = std::to_string(document.unfillable().size()) + " slot(s) could not be filled";
            return ApiResponse{422, body};
        }
        body["message"] = "Playlist generated successfully for " + document.date();
        return ApiResponse{200, body};
    } catch (const domain::InvalidTemplate& e) {
        return ApiResponse{400, json{{"detail", "Invalid schedule template"}, {"problems", e.problems()}}};
    } catch (const domain::AssemblyInvariantViolation& e) {
        std::cerr << "[ApiServer] " << e.what() << std::endl;
        return ApiResponse{500, json{{"detail", "Internal error: playlist invariants violated"},
                                     {"violations", e.violations()}}};
    } catch (const domain::PlannerError& e) {
        std::cerr << "[ApiServer] " << e.what() << std::endl;
        return Error(500, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[ApiServer] Generation failed: " << e.what() << std::endl;
        return Error(500, e.what());
    }
}

ApiResponse ApiServer::fetchPlaylist(const std::optional<std::string>& date) {
    auto playlistDate = ResolveDate(date);
    if (!playlistDate) {
        return Error(400, "Invalid date '" + date.value_or("") + "', expected YYYY-MM-DD");
    }
    auto stored = m_service.storedPlaylist(*playlistDate);
    if (!stored) {
        return Error(404, "No playlist stored for " + playlistDate->toString());
    }
    try {
        return ApiResponse{200, json::parse(*stored)};
    } catch (const json::exception& e) {
        return Error(500, std::string("Stored playlist is unreadable: ") + e.what());
    }
}

} // namespace playoutplanner::infrastructure
