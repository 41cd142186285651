#include "cli/cli_history.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#ifdef _WIN32
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace tb {

CliHistory::CliHistory() : CliHistory(DefaultHistoryFilePath()) {}

CliHistory::CliHistory(std::filesystem::path file) : history_file_path_(std::move(file)) {
    Load();
}

std::filesystem::path CliHistory::DefaultHistoryFilePath() {
    if (const char* override_path = std::getenv("TOOLBENCH_HISTORY_FILE")) {
        if (*override_path) return override_path;
    }
    std::filesystem::path home_dir;
#ifdef _WIN32
    char path[MAX_PATH];
    if (SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path) == S_OK) {
        home_dir = path;
    }
#else
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) home = pw->pw_dir;
    }
    if (home) home_dir = home;
#endif
    if (home_dir.empty()) {
        return ".toolbench_history"; // fallback to current dir
    }
    return home_dir / ".toolbench_history";
}

void CliHistory::Load() {
    history_.clear();
    std::ifstream file(history_file_path_);
    if (file) {
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty()) history_.push_back(line);
        }
    }
    Trim();
    nav_index_ = history_.size();
}

void CliHistory::Save() const {
    std::ofstream file(history_file_path_);
    if (!file) {
        std::cerr << "Warning: Could not save command history to " << history_file_path_ << std::endl;
        return;
    }
    for (const auto& line : history_) file << line << "\n";
}

void CliHistory::Add(const std::string& command) {
    if (command.empty()) return;
    // Consecutive duplicates are stored once
    if (history_.empty() || history_.back() != command) {
        history_.push_back(command);
        Trim();
    }
    nav_index_ = history_.size();
}

void CliHistory::Trim() {
    if (max_size_ == 0 || history_.size() <= max_size_) return;
    history_.erase(history_.begin(), history_.begin() + (history_.size() - max_size_));
}

std::string CliHistory::GetPrevious(const std::string& current_prefix) {
    for (size_t i = nav_index_; i-- > 0;) {
        if (history_[i].rfind(current_prefix, 0) == 0) {
            nav_index_ = i;
            return history_[i];
        }
    }
    return nav_index_ < history_.size() ? history_[nav_index_] : current_prefix;
}

std::string CliHistory::GetNext(const std::string& current_prefix) {
    for (size_t i = nav_index_ + 1; i < history_.size(); ++i) {
        if (history_[i].rfind(current_prefix, 0) == 0) {
            nav_index_ = i;
            return history_[i];
        }
    }
    // Past the newest match: back to what the user typed
    nav_index_ = history_.size();
    return current_prefix;
}

void CliHistory::ResetNavigation() {
    nav_index_ = history_.size();
}

void CliHistory::SetMaxSize(size_t size) {
    max_size_ = size;
    Trim();
    nav_index_ = history_.size();
}

} // namespace tb
