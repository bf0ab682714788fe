#undef NDEBUG
#include "ConfigParser.hpp"
#include "Organizer.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path MakeWorkspace(const std::string& testName) {
    const auto dir = fs::temp_directory_path() / "filmjanitor_organizer_tests" / testName;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void Touch(const fs::path& path, std::size_t size) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << std::string(size, 'x');
}

json MakeConfig(const fs::path& workspace, bool dryRun) {
    return json{
        {"source_folders", json::array({(workspace / "downloads").string()})},
        {"destination_folders",
         {{"1080p", (workspace / "library" / "HD").string()}, {"default", (workspace / "library" / "SD").string()}}},
        {"dry_run", dryRun},
    };
}

void TestFilmsAreFiledByResolution() {
    const auto workspace = MakeWorkspace("filed");
    const auto downloads = workspace / "downloads";
    Touch(downloads / "Heat.1995.1080p.BluRay" / "heat-sample-release.mkv", 2048);
    Touch(downloads / "Amadeus.Directors.Cut.1984.DVD.avi", 1024);
    Touch(downloads / "notes.txt", 10);
    Touch(downloads / "Other.2019.mkv.partial~", 10);

    ConfigParser config;
    assert(config.loadFromJson(MakeConfig(workspace, false), "organizer_test"));

    Organizer organizer(config);
    assert(organizer.organizeOnce());

    assert(fs::exists(workspace / "library" / "HD" / "Heat (1995)" / "Heat (1995) Bluray-1080p.mkv"));
    assert(fs::exists(workspace / "library" / "SD" / "Amadeus (1984)" / "Amadeus (1984) Director's Cut DVD.avi"));
    assert(!fs::exists(downloads / "Heat.1995.1080p.BluRay" / "heat-sample-release.mkv"));
    assert(fs::exists(downloads / "notes.txt"));
    assert(fs::exists(downloads / "Other.2019.mkv.partial~"));
}

void TestDryRunLeavesDownloadsAlone() {
    const auto workspace = MakeWorkspace("dry_run");
    const auto downloads = workspace / "downloads";
    Touch(downloads / "Heat.1995.1080p.BluRay.mkv", 2048);

    ConfigParser config;
    assert(config.loadFromJson(MakeConfig(workspace, true), "organizer_dry_run_test"));

    Organizer organizer(config);
    assert(organizer.organizeOnce());
    assert(fs::exists(downloads / "Heat.1995.1080p.BluRay.mkv"));
    assert(!fs::exists(workspace / "library"));
}

void TestDestinationResolution() {
    const auto workspace = MakeWorkspace("resolve");

    ConfigParser config;
    assert(config.loadFromJson(MakeConfig(workspace, true), "organizer_resolve_test"));
    const Organizer organizer(config);

    assert(organizer.resolveDestinationFor("/downloads/Rogue.One.A.Star.Wars.Story.2016.PROPER.1080p.BluRay.mkv") ==
           workspace / "library" / "HD" / "Rogue One A Star Wars Story (2016)" /
               "Rogue One A Star Wars Story (2016) Bluray-1080p Proper.mkv");
    // Nothing left of the name once the tags are gone.
    assert(organizer.resolveDestinationFor("/downloads/1080p.BluRay.mkv").empty());

    assert(organizer.isVideoFile("/downloads/Heat.1995.MKV"));
    assert(!organizer.isVideoFile("/downloads/Heat.1995.nfo"));
    assert(!organizer.isVideoFile("/downloads/Heat.1995.mkv.partial~"));
    assert(Organizer::normalizeExtension(" MKV ") == ".mkv");
}

void TestMissingSourceFolderFails() {
    const auto workspace = MakeWorkspace("missing_source");

    ConfigParser config;
    assert(config.loadFromJson(MakeConfig(workspace, false), "organizer_missing_test"));
    Organizer organizer(config);
    assert(!organizer.organizeOnce());
}

} // namespace

int main() {
    TestFilmsAreFiledByResolution();
    TestDryRunLeavesDownloadsAlone();
    TestDestinationResolution();
    TestMissingSourceFolderFails();

    fs::remove_all(fs::temp_directory_path() / "filmjanitor_organizer_tests");
    std::cout << "filmjanitor_organizer: pass\n";
    return 0;
}
