/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/PlaylistService.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace playoutplanner::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::unique_ptr<PlaylistService> playlistService;
};

} // namespace playoutplanner::application
