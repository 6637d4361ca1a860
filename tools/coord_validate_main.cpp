// tools/coord_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "coord/config.h"
#include "coord/errors.h"
#include "coord/validator.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    std::string dir;
    std::string config_file;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") config_file = arg_value(i, argc, argv);
        else if (a == "-h" || a == "--help") {
            std::cerr << "Usage: coord_validate [<coordination_dir>] [--config FILE]\n";
            return 1;
        } else dir = a;
    }

    coord::ValidationResult vr;
    try {
        coord::Config cfg = coord::load_config(config_file, dir);
        vr = coord::validate_coordination_dir(cfg);
    } catch (const coord::CoordException& e) {
        std::cerr << "coord_validate failed: " << e.what() << "\n";
        return coord::exit_code_for(e.code());
    }

    nlohmann::json j;
    j["ok"] = vr.ok;
    j["errors"] = vr.errors;
    j["warnings"] = vr.warnings;

    std::cout << j.dump() << "\n";
    return vr.ok ? 0 : 2;
}
