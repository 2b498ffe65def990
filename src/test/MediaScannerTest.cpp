#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "infrastructure/FfprobeMediaProbe.hpp"
#include "infrastructure/FileSystemMediaScanner.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using playoutplanner::infrastructure::FfprobeMediaProbe;
using playoutplanner::infrastructure::FileSystemMediaScanner;

namespace {

void Touch(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "video";
}

} // namespace

int main() {
    std::cout << "[Test] Starting Media Scanner Test..." << std::endl;

    const std::vector<std::pair<std::string, std::string>> categoryMap = {
        {"psaltir", "psaltir"},
        {"molitv", "molitve"},
        {"crtani", "deciji"},
    };

    // Folder name mapping
    assert(FileSystemMediaScanner::MapCategory("Psaltir - Katizme", categoryMap) == "psaltir");
    assert(FileSystemMediaScanner::MapCategory("Jutarnje MOLITVE", categoryMap) == "molitve");
    assert(FileSystemMediaScanner::MapCategory("Crtani filmovi", categoryMap) == "deciji");
    assert(FileSystemMediaScanner::MapCategory("Duhovne pouke", categoryMap) == "duhovne_pouke");
    assert(FileSystemMediaScanner::MapCategory("15min", categoryMap) == "15min");
    // First matching entry wins.
    assert(FileSystemMediaScanner::MapCategory("psaltir molitve", categoryMap) == "psaltir");

    assert(FileSystemMediaScanner::IsVideoFile("/x/a.mp4"));
    assert(FileSystemMediaScanner::IsVideoFile("/x/B.MKV"));
    assert(FileSystemMediaScanner::IsVideoFile("clip.mov"));
    assert(!FileSystemMediaScanner::IsVideoFile("/x/a.srt"));
    assert(!FileSystemMediaScanner::IsVideoFile("/x/mp4"));

    // ffprobe output parsing
    auto parsed = FfprobeMediaProbe::ParseDuration("1500.042000\n");
    assert(parsed && *parsed > 1500.0 && *parsed < 1500.1);
    assert(!FfprobeMediaProbe::ParseDuration("N/A\n"));
    assert(!FfprobeMediaProbe::ParseDuration(""));
    assert(!FfprobeMediaProbe::ParseDuration("0.000000"));
    assert(!FfprobeMediaProbe::ParseDuration("-3"));

    FfprobeMediaProbe missingTool("/nonexistent/ffprobe");
    assert(!missingTool.probeDuration("/nonexistent/clip.mp4"));

    std::cout << "[Test] Scanning a temporary library..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "playout_planner_scanner_test";
    fs::remove_all(root);
    Touch(root / "Molitve jutro" / "b.mp4");
    Touch(root / "Molitve jutro" / "a.mkv");
    Touch(root / "Molitve jutro" / "cover.jpg");
    Touch(root / "Duhovne pouke" / "pouka.mp4");
    Touch(root / "loose.mp4");
    fs::create_directories(root / "Psaltir");

    auto probe = std::make_shared<playoutplanner::test::FakeProbe>(std::map<std::string, double>{
        {"a.mkv", 905.5}, {"b.mp4", 880.0}});
    FileSystemMediaScanner scanner(root.string(), categoryMap, probe, 900.0);
    auto result = scanner.scan();

    assert(result.records.size() == 3);
    // Folders in path order, files in name order.
    assert(result.records[0].category == "duhovne_pouke");
    assert(result.records[0].durationSeconds == 900.0);
    assert(fs::path(result.records[1].filePath).filename() == "a.mkv");
    assert(result.records[1].category == "molitve");
    assert(result.records[1].durationSeconds == 905.5);
    assert(fs::path(result.records[2].filePath).filename() == "b.mp4");
    assert(fs::path(result.records[2].filePath).is_absolute());

    assert((result.categories == std::vector<std::string>{"duhovne_pouke", "molitve", "psaltir"}));

    FileSystemMediaScanner missing((root / "absent").string(), categoryMap, probe, 900.0);
    auto nothing = missing.scan();
    assert(nothing.records.empty());
    assert(nothing.categories.empty());

    fs::remove_all(root);

    std::cout << "[PASS] Media Scanner Test." << std::endl;
    return 0;
}
