/**
 * @file waterfalls_viewer.cpp
 * @brief Command-line aggregation tool: draws the reports of a directory.
 *
 * Exit status:
 *   0  chart drawn or image written
 *   1  directory missing, no records, unreadable report, or chart not written
 *   2  invalid command line
 */

#include <waterfalls/waterfalls.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
    waterfalls::ViewerOptions options;
    try {
        // First pass only looks for --config so file defaults can be
        // applied before the remaining flags override them.
        waterfalls::ViewerOptions first = waterfalls::parse_arguments(argc, argv);
        if (first.help) {
            waterfalls::print_usage(argv[0]);
            return 0;
        }

        std::string config_file = first.config_file;
        if (config_file.empty()) {
            const char* env = std::getenv(WATERFALLS_CONFIG_ENV);
            if (env && env[0]) config_file = env;
        }
        if (!config_file.empty() && !waterfalls::load_config(config_file.c_str())) {
            return 1;
        }

        options = waterfalls::parse_arguments(argc, argv,
                                              waterfalls::ViewerOptions::from_config(waterfalls::get_config()));
    }
    catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "waterfalls: Error: %s\n\n", e.what());
        waterfalls::print_usage(argv[0], stderr);
        return 2;
    }

    waterfalls::Viewer viewer(options);
    return viewer.visualize_report();
}
