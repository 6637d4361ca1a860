// src/manifest.cpp
#include "coord/manifest.h"
#include "coord/errors.h"
#include "coord/format.h"

#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace coord {

static const char* kManifestName = "archive_manifest.json";

static json read_manifest_json(const std::filesystem::path& p) {
    std::ifstream in(p);
    if (!in) return json::object();
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw CorruptStoreError("cannot parse " + p.string() + ": " + e.what());
    }
    if (!j.is_object()) throw CorruptStoreError(p.string() + ": root is not an object");
    return j;
}

Manifest load_manifest(const std::filesystem::path& archive_dir) {
    Manifest m;
    json j = read_manifest_json(archive_dir / kManifestName);
    if (!j.contains("segments") || !j["segments"].is_array()) return m;

    for (auto& e : j["segments"]) {
        if (!e.is_object()) continue;
        SegmentEntry se;
        se.segment_name = e.value("segment_name", "");
        se.path = e.value("path", "");
        se.built_at_utc = e.value("built_at_utc", "");
        auto st = e.value("stats", json::object());
        se.stats.items = st.value("items", (uint64_t)0);
        if (!se.segment_name.empty() && !se.path.empty()) {
            m.segments.push_back(std::move(se));
        }
    }
    return m;
}

void append_segment_to_manifest(const std::filesystem::path& archive_dir, const SegmentEntry& e) {
    const auto manifest_fin = archive_dir / kManifestName;

    json j = read_manifest_json(manifest_fin);
    if (!j.contains("segments") || !j["segments"].is_array()) {
        j["segments"] = json::array();
    }

    json entry;
    entry["segment_name"] = e.segment_name;
    entry["path"] = e.path;
    entry["built_at_utc"] = e.built_at_utc;
    entry["stats"] = {{"items", e.stats.items}};
    j["segments"].push_back(std::move(entry));

    write_file_atomic(manifest_fin, j.dump(2) + "\n");
}

} // namespace coord
