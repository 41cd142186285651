// No name given: the host derives "Code3 Directory Listing" from the file name.
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "unit_api.hpp"

namespace {

void list_working_directory() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::current_path();
    if (!fs::is_directory(dir)) {
        throw std::runtime_error("working directory is not a directory: " + dir.string());
    }
    int count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::cout << (entry.is_directory() ? "  [dir]  " : "         ")
                  << entry.path().filename().string() << "\n";
        ++count;
    }
    std::cout << count << " entries in " << dir.string() << std::endl;
}

} // namespace

extern "C" UNIT_API void register_toolbench_unit(tb::UnitManifest& manifest) {
    manifest.description = "Lists the entries of the working directory.";
    manifest.run = list_working_directory;
}
