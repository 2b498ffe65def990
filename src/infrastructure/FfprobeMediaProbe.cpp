/**
 * @file FfprobeMediaProbe.cpp
 * @brief Implementation of FfprobeMediaProbe.
 */

#include "infrastructure/FfprobeMediaProbe.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace playoutplanner::infrastructure {

FfprobeMediaProbe::FfprobeMediaProbe(std::string ffprobeBinary)
    : m_binary(std::move(ffprobeBinary)) {}

std::string FfprobeMediaProbe::RunCommand(const std::string& cmd) {
    std::string output;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output.append(buffer);
    }
    pclose(pipe);
    return output;
}

std::string FfprobeMediaProbe::ShellQuote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::optional<double> FfprobeMediaProbe::ParseDuration(const std::string& output) {
    const char* begin = output.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) return std::nullopt;
    if (!std::isfinite(value) || value <= 0.0) return std::nullopt;
    return value;
}

std::optional<double> FfprobeMediaProbe::probeDuration(const std::string& filePath) {
    const std::string cmd = m_binary +
        " -v error -show_entries format=duration -of default=noprint_wrappers=1:nokey=1 " +
        ShellQuote(filePath) + " 2>/dev/null";
    return ParseDuration(RunCommand(cmd));
}

} // namespace playoutplanner::infrastructure
