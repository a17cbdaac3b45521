#pragma once

#include <hatch/platform.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace hatch_test {

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("hatch_test_" + hatch::generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string sub(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// AppX: one text association gated by "assoc", one ungated authored value,
// a start menu shortcut and a desktop shortcut gated by "desktopicon"
inline const char* sample_manifest_json() {
    return R"({
        "$schema": "hatch.manifest.v1",
        "app": {
            "id": "com.example.appx",
            "name": "App X",
            "version": "1.4.0",
            "publisher": "Example",
            "executable": "AppX.exe"
        },
        "install": { "dir": "/opt/AppX" },
        "files": [
            { "source": "payload/AppX.exe", "dest": "AppX.exe" },
            { "source": "payload/docs", "dest": "docs", "recurse": true }
        ],
        "tasks": [
            { "id": "assoc", "description": "Associate .txt files", "default": true },
            { "id": "desktopicon", "description": "Create a desktop icon" }
        ],
        "associations": [
            {
                "extension": ".txt",
                "prog_id": "AppX.txt",
                "friendly_name": "Text Document",
                "icon": "{app}\AppX.exe,0",
                "command": ""{app}\AppX.exe" "%1"",
                "task": "assoc"
            }
        ],
        "registry": [
            {
                "path": "Software\Example\AppX",
                "value": "InstallDir",
                "data": "{app}",
                "uninstall": "delete_key"
            }
        ],
        "shortcuts": [
            { "name": "App X", "target": "{app}/AppX.exe" },
            { "name": "App X", "target": "{app}/AppX.exe", "location": "desktop", "task": "desktopicon" }
        ]
    })";
}

} // namespace hatch_test
