#include <moo/app.hpp>
#include <moo/settings.hpp>
#include <iostream>

using namespace moo;

int main(int argc, char* argv[]) {
    std::string settings_path = user_settings_path();
    if (!settings_path.empty()) {
        auto settings = UserSettings::load(settings_path);
        if (settings.is_ok()) {
            settings.value().apply();
        } else if (settings.error().code != MooError::NotFound) {
            log::warn("ignoring %s: %s", settings_path.c_str(),
                      settings.error().message.c_str());
        }
    }

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        std::cerr << io_error("read", "the current directory", ec).format() << "\n";
        return kFailure;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    return run_cli(args, cwd, disk_filesystem(), std::cout, std::cerr);
}
