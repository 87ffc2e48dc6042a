#include "diffmap/diff/report.hpp"

namespace diffmap::diff {

using json = nlohmann::json;

namespace {

json breakdown(const SignificanceCounts& c) {
    return {
        {"all", c.all},
        {significance_to_string(Significance::FOREGROUND), c.foreground},
        {significance_to_string(Significance::BACKGROUND), c.background},
        {significance_to_string(Significance::ANTIALIAS), c.antialias}
    };
}

} // namespace

json to_json(const Box& box) {
    return {
        {"left", box.left},
        {"top", box.top},
        {"right", box.right},
        {"bottom", box.bottom}
    };
}

json to_json(const PixelCounts& counts) {
    json sig = breakdown(counts.significance);
    sig.erase("all");

    json similarity = json::object();
    for (Similarity s : {Similarity::IDENTICAL, Similarity::SIMILAR, Similarity::CHANGED}) {
        similarity[similarity_to_string(s)] = breakdown(counts.similarity(s));
    }
    return {
        {"all", counts.all},
        {"compared", counts.compared},
        {"diff", counts.diff},
        {"group", counts.group},
        {"significance", sig},
        {"similarity", similarity}
    };
}

json to_json(const DiffResult& result) {
    json regions = json::array();
    for (const auto& r : result.regions) {
        regions.push_back(to_json(r));
    }

    json outputs = json::array();
    for (const auto& kv : result.outputs) {
        outputs.push_back(kv.first);
    }

    return {
        {"status", diff_status_to_string(result.status)},
        {"width", result.flags.width()},
        {"height", result.flags.height()},
        {"counts", to_json(result.counts)},
        {"percent", {
            {"compared", result.percent.compared},
            {"diff", result.percent.diff},
            {"group", result.percent.group},
            {"diff_compared", result.percent.diff_compared}
        }},
        {"regions", regions},
        {"rendered", result.rendered},
        {"outputs", outputs},
        {"timings_ms", {
            {"classify", result.timings.classify_ms},
            {"group", result.timings.group_ms},
            {"render", result.timings.render_ms},
            {"total", result.timings.total_ms}
        }}
    };
}

} // namespace diffmap::diff
