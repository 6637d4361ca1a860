// include/coord/validator.h
#pragma once
#include <string>
#include <vector>

#include "coord/config.h"

namespace coord {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// Offline consistency check of a coordination directory: store and segment
// parsing, unique ids across store and archive, manifest vs segment files,
// checkpoint bounds, fast-log lines past the checkpoint.
ValidationResult validate_coordination_dir(const Config& cfg);

} // namespace coord
