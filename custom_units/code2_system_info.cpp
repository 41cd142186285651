#include <filesystem>
#include <iostream>
#include <thread>

#include "unit_api.hpp"

namespace {

void print_system_info() {
    namespace fs = std::filesystem;
    std::cout << "Hardware threads:  " << std::thread::hardware_concurrency() << "\n";
    std::cout << "Working directory: " << fs::current_path().string() << "\n";

    std::error_code ec;
    auto space = fs::space(fs::current_path(), ec);
    if (ec) {
        std::cout << "Disk space:        unavailable (" << ec.message() << ")" << std::endl;
        return;
    }
    constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
    std::cout << "Disk space:        " << space.available / kGiB << " GiB free of "
              << space.capacity / kGiB << " GiB" << std::endl;
}

} // namespace

extern "C" UNIT_API void register_toolbench_unit(tb::UnitManifest& manifest) {
    manifest.name = "System Info";
    manifest.description = "Shows thread count, working directory and free disk space.";
    manifest.order = 2;
    manifest.run = print_system_info;
}
