/**
 * @file PlaylistAssembler.hpp
 * @brief Drives a schedule template through the selection policy.
 */

#pragma once
#include <cstdint>
#include <string>
#include "application/SelectionPolicy.hpp"
#include "domain/MediaCatalog.hpp"
#include "domain/PlaylistDocument.hpp"
#include "domain/ScheduleTemplate.hpp"
#include "domain/UsageHistory.hpp"

namespace playoutplanner::application {

/**
 * @struct AssemblyOptions
 * @brief Parameters of one generation run.
 */
struct AssemblyOptions {
    std::string channel = "Channel 1";
    std::string date;                 ///< "YYYY-MM-DD" written into the document.
    std::int64_t dayStartEpoch = 0;   ///< Epoch seconds of the date's midnight; lower bound of the run's rotation timestamps.
    double durationTolerance = kDefaultDurationTolerance;
};

/**
 * @class PlaylistAssembler
 * @brief Fills template slots in airtime order.
 *
 * An unfillable slot never aborts the run; a document that fails its own
 * validation does (AssemblyInvariantViolation).
 */
class PlaylistAssembler {
public:
    explicit PlaylistAssembler(AssemblyOptions options);

    /**
     * @brief Builds the playlist for one day.
     * @param history Rotation state; receives one update per filled slot.
     * @throws domain::AssemblyInvariantViolation
     */
    domain::PlaylistDocument assemble(const domain::ScheduleTemplate& scheduleTemplate,
                                      const domain::MediaCatalog& catalog,
                                      domain::UsageHistory& history) const;

    const AssemblyOptions& options() const { return m_options; }

private:
    AssemblyOptions m_options;
};

} // namespace playoutplanner::application
