/**
 * @file FfprobeMediaProbe.hpp
 * @brief Media duration probe backed by the ffprobe command-line tool.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/MediaScanner.hpp"

namespace playoutplanner::infrastructure {

class FfprobeMediaProbe : public domain::MediaProbe {
public:
    explicit FfprobeMediaProbe(std::string ffprobeBinary = "ffprobe");

    std::optional<double> probeDuration(const std::string& filePath) override;

    /** @brief Parses the single-number output of ffprobe's format=duration query. */
    static std::optional<double> ParseDuration(const std::string& output);

private:
    static std::string RunCommand(const std::string& cmd);
    static std::string ShellQuote(const std::string& text);

    std::string m_binary;
};

} // namespace playoutplanner::infrastructure
