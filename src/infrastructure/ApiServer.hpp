/**
 * @file ApiServer.hpp
 * @brief HTTP front-end of the playlist service (cpp-httplib).
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "application/PlaylistService.hpp"

namespace httplib {
class Server;
}

namespace playoutplanner::infrastructure {

/**
 * @struct ApiResponse
 * @brief Status code and JSON body produced by a route handler.
 */
struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @class ApiServer
 * @brief Routes:
 *   GET  /videos                      catalog contents per category
 *   GET  /template                    configured daily slots
 *   POST /generate-playlist?date=&allow_partial=   generate, store, report
 *   GET  /playlist?date=              stored playlist document
 */
class ApiServer {
public:
    explicit ApiServer(application::PlaylistService& service);
    ~ApiServer();

    /** @brief Blocks serving requests until stop() is called. @return False if the socket could not be bound. */
    bool listen(const std::string& host, int port);

    void stop();

    ApiResponse listVideos();
    ApiResponse showTemplate();

    /**
     * @brief Generates the playlist of a date.
     * @param date "YYYY-MM-DD"; today when absent.
     * @param allowPartial Answer 200 even when some slots are unfillable.
     * @param requestBody Optional JSON body with an ad-hoc "fixed_slots" template.
     */
    ApiResponse generatePlaylist(const std::optional<std::string>& date, bool allowPartial,
                                 const std::string& requestBody);

    ApiResponse fetchPlaylist(const std::optional<std::string>& date);

private:
    void registerRoutes();

    application::PlaylistService& m_service;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace playoutplanner::infrastructure
