#include "diffmap/config/configuration.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/core/events.hpp"
#include "diffmap/core/types.hpp"
#include "diffmap/core/utils.hpp"
#include "diffmap/diff/diff.hpp"
#include "diffmap/diff/report.hpp"
#include "diffmap/io/image_io.hpp"
#include "diffmap/render/programs.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kExitSame = 0;
constexpr int kExitDifferent = 1;
constexpr int kExitError = 2;

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

json option_to_json(const diffmap::render::OptionValue& v) {
    if (const bool* b = std::get_if<bool>(&v)) return *b;
    if (const double* d = std::get_if<double>(&v)) return *d;
    if (const std::string* s = std::get_if<std::string>(&v)) return *s;
    const diffmap::Rgba& c = std::get<diffmap::Rgba>(v);
    return {{"r", c.r}, {"g", c.g}, {"b", c.b}, {"a", c.a}};
}

struct DiffArgs {
    std::vector<std::string> images;
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> outputs; // name -> path
    std::string run_id;
    bool events = false;
};

DiffArgs parse_diff_args(int argc, char* argv[]) {
    DiffArgs args;
    for (int i = 2; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw diffmap::ConfigError(a + " requires a value");
            }
            return argv[++i];
        };
        if (a == "--config") {
            args.config_path = value();
        } else if (a == "--run-id") {
            args.run_id = value();
        } else if (a == "--out") {
            const std::string spec = value();
            const auto eq = spec.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
                throw diffmap::ConfigError("--out expects name=path, got '" + spec + "'");
            }
            args.outputs.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
        } else if (a == "--events") {
            args.events = true;
        } else if (!a.empty() && a[0] == '-') {
            throw diffmap::ConfigError("unknown option " + a);
        } else {
            args.images.push_back(a);
        }
    }
    return args;
}

int cmd_diff(const DiffArgs& args) {
    const std::string run_id = args.run_id.empty() ? diffmap::core::get_run_id() : args.run_id;
    std::ostringstream sink;
    diffmap::core::EventEmitter emitter(args.events ? std::cerr : sink, run_id);
    diffmap::core::EventEmitter* events = args.events ? &emitter : nullptr;

    json result;
    result["ok"] = false;
    result["run_id"] = run_id;
    bool diff_running = false;

    try {
        diffmap::config::Config cfg;
        if (!args.config_path.empty()) {
            cfg = diffmap::config::Config::load(args.config_path);
        }
        if (!args.outputs.empty()) {
            cfg.output.names.clear();
            for (const auto& o : args.outputs) {
                cfg.output.names.push_back(o.first);
            }
        }
        cfg.validate();

        if (args.images.size() < 2) {
            throw diffmap::InvalidInputError("diff requires at least 2 image paths");
        }

        if (events) {
            events->run_start({{"images", args.images},
                               {"config_path", args.config_path},
                               {"outputs", cfg.output.names}});
        }

        std::vector<cv::Mat> images;
        images.reserve(args.images.size());
        for (const auto& p : args.images) {
            images.push_back(diffmap::io::read_image(p));
        }

        diff_running = true;
        diffmap::diff::DiffResult res = diffmap::diff::diff(images, cfg, events);
        diff_running = false;

        json written = json::object();
        for (const auto& o : args.outputs) {
            auto it = res.outputs.find(o.first);
            if (it == res.outputs.end()) {
                continue;
            }
            diffmap::io::write_image(o.second, it->second);
            written[o.first] = o.second;
        }

        result["ok"] = true;
        result["report"] = diffmap::diff::to_json(res);
        result["written"] = written;
        print_json(result);

        if (events) events->run_end(true, diffmap::diff_status_to_string(res.status));

        const bool differs = res.status == diffmap::DiffStatus::DIFFERENT ||
                             res.status == diffmap::DiffStatus::MISMATCH;
        return differs ? kExitDifferent : kExitSame;
    } catch (const std::exception& e) {
        if (events) {
            // diff() has already emitted the error event for its own failures
            if (!diff_running) events->error(e.what());
            events->run_end(false, "error");
        }
        result["error"] = e.what();
        print_json(result);
        return kExitError;
    }
}

int cmd_get_schema() {
    std::cout << diffmap::config::get_schema_json() << std::endl;
    return 0;
}

int cmd_default_config() {
    diffmap::config::Config cfg;
    YAML::Emitter out;
    out << cfg.to_yaml();
    std::cout << out.c_str() << std::endl;
    return 0;
}

int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = diffmap::core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }

        YAML::Node node = YAML::Load(yaml_text);
        diffmap::config::Config cfg = diffmap::config::Config::from_yaml(node);
        cfg.validate();

        const auto catalog = diffmap::render::default_catalog();
        for (const auto& name : cfg.output.names) {
            if (!catalog.count(name)) {
                result["warnings"].push_back("output '" + name + "' is not a built-in program");
            }
        }
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

int cmd_list_programs() {
    json programs = json::array();
    for (const auto& kv : diffmap::render::default_catalog()) {
        json options = json::object();
        for (const auto& opt : kv.second.defaults.values()) {
            options[opt.first] = option_to_json(opt.second);
        }
        programs.push_back({{"name", kv.first},
                            {"dependencies", kv.second.dependencies},
                            {"options", options}});
    }
    print_json({{"programs", programs}});
    return 0;
}

void print_usage() {
    std::cout << "Usage: diffmap_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  diff <original> <changed> [<more>...]  Compare images\n"
              << "       [--config P] [--out name=path]... [--run-id ID] [--events]\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  default-config                  Print default config YAML\n"
              << "  validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]\n"
              << "  list-programs                   List built-in render programs\n"
              << "\nExit codes (diff): 0 identical/similar, 1 different/mismatch, 2 error\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitError;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    if (command == "diff") {
        DiffArgs args;
        try {
            args = parse_diff_args(argc, argv);
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return kExitError;
        }
        return cmd_diff(args);
    }

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "default-config") {
        return cmd_default_config();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "list-programs") {
        return cmd_list_programs();
    }

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return kExitError;
}
