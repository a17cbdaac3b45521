#include "hatch/journal.hpp"
#include "hatch/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace hatch {

std::string FileJournal::journalPath(const std::string& install_id) const {
    return join_path(dir_, install_id + ".journal");
}

Result<void> FileJournal::record(const JournalEntry& entry) {
    if (!is_directory(dir_)) {
        auto made = atomic_create_directory(dir_);
        if (!made.ok) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, made.error, dir_));
        }
    }

    std::string path = journalPath(entry.install_id);
    std::string line;
    try {
        line = serialize_journal_entry(entry);
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, std::string("cannot encode journal entry: ") + e.what(), path));
    }
    auto appended = durable_append_line(path, line);
    if (!appended.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, appended.error, path));
    }
    return Result<void>::ok();
}

Result<std::vector<JournalEntry>> FileJournal::allEntries(const std::string& install_id) const {
    std::vector<JournalEntry> entries;
    std::string path = journalPath(install_id);
    if (!path_exists(path)) {
        return Result<std::vector<JournalEntry>>::ok(std::move(entries));
    }

    auto content = read_file(path);
    if (!content) {
        return Result<std::vector<JournalEntry>>::err(
            Error(ErrorCode::IO_ERROR, "cannot read journal", path));
    }

    std::istringstream in(*content);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        auto entry = parse_journal_entry(line);
        if (!entry || entry->install_id != install_id) {
            spdlog::warn("journal {}: skipping corrupt line {}", path, line_no);
            if (warnings_) {
                warnings_->emit(Warning::journal_line_corrupt, warnings::journal_line(path, line_no));
            }
            continue;
        }
        entries.push_back(std::move(*entry));
    }

    return Result<std::vector<JournalEntry>>::ok(std::move(entries));
}

Result<void> FileJournal::clear(const std::string& install_id) {
    std::string path = journalPath(install_id);
    if (path_exists(path) && !remove_file(path)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot remove journal", path));
    }
    return Result<void>::ok();
}

Result<void> FileJournal::retain(const std::string& install_id,
                                 const std::vector<JournalEntry>& entries) {
    if (entries.empty()) {
        return clear(install_id);
    }

    std::string path = journalPath(install_id);
    std::string content;
    try {
        for (const auto& entry : entries) {
            content += serialize_journal_entry(entry);
            content += '\n';
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, std::string("cannot encode journal entry: ") + e.what(), path));
    }

    auto written = atomic_write_file(path, content);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error, path));
    }
    return Result<void>::ok();
}

std::vector<std::string> FileJournal::installIds() const {
    std::vector<std::string> ids;
    if (!is_directory(dir_)) {
        return ids;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".journal" &&
            entry.file_size(ec) > 0) {
            ids.push_back(entry.path().stem().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace hatch
