#include "diffmap/config/configuration.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/core/utils.hpp"

#include <fstream>
#include <sstream>

namespace diffmap::config {

static bool is_channel(int v) {
    return v >= 0 && v <= 255;
}

static std::vector<std::string> read_string_list(const YAML::Node& n) {
    std::vector<std::string> out;
    if (n.IsSequence()) {
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    } else if (n.IsScalar()) {
        out.push_back(n.as<std::string>());
    }
    return out;
}

static render::OptionValue read_option_value(const std::string& key, const YAML::Node& n) {
    if (n.IsMap()) {
        if (!n["r"] || !n["g"] || !n["b"]) {
            throw ConfigError("output.options." + key + " colour needs r, g and b");
        }
        Rgba c;
        c.r = n["r"].as<int>();
        c.g = n["g"].as<int>();
        c.b = n["b"].as<int>();
        if (n["a"]) c.a = n["a"].as<int>();
        return c;
    }
    if (!n.IsScalar()) {
        throw ConfigError("output.options." + key + " must be a scalar or an {r,g,b,a} map");
    }
    bool b = false;
    if (YAML::convert<bool>::decode(n, b)) {
        return b;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(n, d)) {
        return d;
    }
    return n.as<std::string>();
}

static YAML::Node write_option_value(const render::OptionValue& v) {
    YAML::Node n;
    if (const bool* b = std::get_if<bool>(&v)) {
        n = *b;
    } else if (const double* d = std::get_if<double>(&v)) {
        n = *d;
    } else if (const std::string* s = std::get_if<std::string>(&v)) {
        n = *s;
    } else if (const Rgba* c = std::get_if<Rgba>(&v)) {
        n["r"] = c->r;
        n["g"] = c->g;
        n["b"] = c->b;
        n["a"] = c->a;
    }
    return n;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }

    try {
        if (node["classify"]) {
            auto c = node["classify"];
            if (c["changed_min_distance"]) cfg.classify.changed_min_distance = c["changed_min_distance"].as<double>();
            if (c["antialias_min_distance"]) cfg.classify.antialias_min_distance = c["antialias_min_distance"].as<double>();
            if (c["antialias_max_distance"]) cfg.classify.antialias_max_distance = c["antialias_max_distance"].as<double>();
            if (c["background_max_contrast"]) cfg.classify.background_max_contrast = c["background_max_contrast"].as<double>();
            if (c["include_foreground"]) cfg.classify.include_foreground = c["include_foreground"].as<bool>();
            if (c["include_background"]) cfg.classify.include_background = c["include_background"].as<bool>();
            if (c["include_antialias"]) cfg.classify.include_antialias = c["include_antialias"].as<bool>();
        }

        if (node["group"]) {
            auto g = node["group"];
            if (g["merge_max_gap_size"]) cfg.group.merge_max_gap_size = g["merge_max_gap_size"].as<int>();
            if (g["border_size"]) cfg.group.border_size = g["border_size"].as<int>();
            if (g["padding_size"]) cfg.group.padding_size = g["padding_size"].as<int>();
        }

        if (node["status"]) {
            auto s = node["status"];
            if (s["mismatch_min_percent"]) cfg.status.mismatch_min_percent = s["mismatch_min_percent"].as<double>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["names"]) cfg.output.names = read_string_list(o["names"]);
            if (o["render_when_status"]) cfg.output.render_when_status = read_string_list(o["render_when_status"]);
            if (o["options"] && o["options"].IsMap()) {
                for (const auto& kv : o["options"]) {
                    const std::string key = kv.first.as<std::string>();
                    cfg.output.options.set(key, read_option_value(key, kv.second));
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["classify"]["changed_min_distance"] = classify.changed_min_distance;
    node["classify"]["antialias_min_distance"] = classify.antialias_min_distance;
    node["classify"]["antialias_max_distance"] = classify.antialias_max_distance;
    node["classify"]["background_max_contrast"] = classify.background_max_contrast;
    node["classify"]["include_foreground"] = classify.include_foreground;
    node["classify"]["include_background"] = classify.include_background;
    node["classify"]["include_antialias"] = classify.include_antialias;

    node["group"]["merge_max_gap_size"] = group.merge_max_gap_size;
    node["group"]["border_size"] = group.border_size;
    node["group"]["padding_size"] = group.padding_size;

    node["status"]["mismatch_min_percent"] = status.mismatch_min_percent;

    node["output"]["names"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& n : output.names) {
        node["output"]["names"].push_back(n);
    }
    node["output"]["render_when_status"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& s : output.render_when_status) {
        node["output"]["render_when_status"].push_back(s);
    }
    node["output"]["options"] = YAML::Node(YAML::NodeType::Map);
    for (const auto& kv : output.options.values()) {
        node["output"]["options"][kv.first] = write_option_value(kv.second);
    }

    return node;
}

void Config::validate() const {
    auto in_distance_range = [](double v) { return v >= 0.0 && v <= 255.0; };

    if (!in_distance_range(classify.changed_min_distance)) {
        throw ValidationError("classify.changed_min_distance must be in [0,255]");
    }
    if (!in_distance_range(classify.antialias_min_distance) ||
        !in_distance_range(classify.antialias_max_distance)) {
        throw ValidationError("classify.antialias_min/max_distance must be in [0,255]");
    }
    if (classify.antialias_min_distance > classify.antialias_max_distance) {
        throw ValidationError("classify.antialias_min_distance must be <= classify.antialias_max_distance");
    }
    if (!in_distance_range(classify.background_max_contrast)) {
        throw ValidationError("classify.background_max_contrast must be in [0,255]");
    }

    if (group.merge_max_gap_size < 0) {
        throw ValidationError("group.merge_max_gap_size must be >= 0");
    }
    if (group.border_size < 0) {
        throw ValidationError("group.border_size must be >= 0");
    }
    if (group.padding_size < 0) {
        throw ValidationError("group.padding_size must be >= 0");
    }

    if (status.mismatch_min_percent < 0.0 || status.mismatch_min_percent > 100.0) {
        throw ValidationError("status.mismatch_min_percent must be in [0,100]");
    }

    for (const auto& n : output.names) {
        if (n.empty()) {
            throw ValidationError("output.names must not contain empty names");
        }
    }
    for (const auto& s : output.render_when_status) {
        if (core::to_lower(s) != "all" && !string_to_diff_status(s)) {
            throw ValidationError("output.render_when_status: unknown status '" + s +
                                  "' (identical|similar|different|mismatch|all)");
        }
    }
    for (const auto& kv : output.options.values()) {
        if (const Rgba* c = std::get_if<Rgba>(&kv.second)) {
            if (!is_channel(c->r) || !is_channel(c->g) || !is_channel(c->b) || !is_channel(c->a)) {
                throw ValidationError("output.options." + kv.first + " channels must be in [0,255]");
            }
        }
    }
}

diff::ClassifyOptions Config::classify_options() const {
    diff::ClassifyOptions o;
    o.changed_min_distance = classify.changed_min_distance;
    o.antialias_min_distance = classify.antialias_min_distance;
    o.antialias_max_distance = classify.antialias_max_distance;
    o.background_max_contrast = classify.background_max_contrast;
    o.include_foreground = classify.include_foreground;
    o.include_background = classify.include_background;
    o.include_antialias = classify.include_antialias;
    return o;
}

diff::GroupOptions Config::group_options() const {
    diff::GroupOptions o;
    o.merge_max_gap_size = group.merge_max_gap_size;
    o.border_size = group.border_size;
    o.padding_size = group.padding_size;
    return o;
}

bool Config::should_render(DiffStatus st) const {
    for (const auto& s : output.render_when_status) {
        if (core::to_lower(s) == "all") {
            return true;
        }
        auto parsed = string_to_diff_status(s);
        if (parsed && *parsed == st) {
            return true;
        }
    }
    return false;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "classify": {
      "type": "object",
      "properties": {
        "changed_min_distance": {"type": "number", "minimum": 0, "maximum": 255},
        "antialias_min_distance": {"type": "number", "minimum": 0, "maximum": 255},
        "antialias_max_distance": {"type": "number", "minimum": 0, "maximum": 255},
        "background_max_contrast": {"type": "number", "minimum": 0, "maximum": 255},
        "include_foreground": {"type": "boolean"},
        "include_background": {"type": "boolean"},
        "include_antialias": {"type": "boolean"}
      }
    },
    "group": {
      "type": "object",
      "properties": {
        "merge_max_gap_size": {"type": "integer", "minimum": 0},
        "border_size": {"type": "integer", "minimum": 0},
        "padding_size": {"type": "integer", "minimum": 0}
      }
    },
    "status": {
      "type": "object",
      "properties": {
        "mismatch_min_percent": {"type": "number", "minimum": 0, "maximum": 100}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "names": {"type": "array", "items": {"type": "string"}},
        "render_when_status": {
          "type": "array",
          "items": {"type": "string", "enum": ["identical", "similar", "different", "mismatch", "all"]}
        },
        "options": {
          "type": "object",
          "additionalProperties": {
            "oneOf": [
              {"type": "boolean"},
              {"type": "number"},
              {"type": "string"},
              {
                "type": "object",
                "properties": {
                  "r": {"type": "integer", "minimum": 0, "maximum": 255},
                  "g": {"type": "integer", "minimum": 0, "maximum": 255},
                  "b": {"type": "integer", "minimum": 0, "maximum": 255},
                  "a": {"type": "integer", "minimum": 0, "maximum": 255}
                },
                "required": ["r", "g", "b"]
              }
            ]
          }
        }
      }
    }
  }
})";
}

} // namespace diffmap::config
