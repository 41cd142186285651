#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace tb {

// Shell command history persisted to ~/.toolbench_history (or the file named
// by TOOLBENCH_HISTORY_FILE).
class CliHistory {
public:
    CliHistory();
    explicit CliHistory(std::filesystem::path file);

    void Load();
    void Save() const;
    void Add(const std::string& command);

    // Get previous/next command that starts with the given prefix
    std::string GetPrevious(const std::string& current_prefix);
    std::string GetNext(const std::string& current_prefix);

    // Resets the navigation index (e.g., when a new command is typed)
    void ResetNavigation();

    // 0 keeps every entry.
    void SetMaxSize(size_t size);

    const std::filesystem::path& Path() const { return history_file_path_; }
    const std::vector<std::string>& Entries() const { return history_; }

private:
    static std::filesystem::path DefaultHistoryFilePath();
    void Trim();

    std::filesystem::path history_file_path_;
    std::vector<std::string> history_;
    size_t nav_index_ = 0;
    size_t max_size_ = 1000;
};

} // namespace tb
