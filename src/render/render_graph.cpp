#include "diffmap/render/render_graph.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/core/utils.hpp"

namespace diffmap::render {

std::string option_type_name(const OptionValue& v) {
    switch (v.index()) {
        case 0: return "bool";
        case 1: return "number";
        case 2: return "string";
        case 3: return "color";
        default: return "unknown";
    }
}

namespace {

template <typename T>
const T& typed(const RenderOptions& opts, const std::string& key, const char* expected) {
    const OptionValue& v = opts.get(key);
    const T* p = std::get_if<T>(&v);
    if (!p) {
        throw ValidationError("render option '" + key + "' must be " + expected + ", got " +
                              option_type_name(v));
    }
    return *p;
}

bool is_reference(const OptionValue& v, std::string& target) {
    const std::string* s = std::get_if<std::string>(&v);
    if (!s || !core::starts_with(*s, kOptionReferencePrefix)) {
        return false;
    }
    target = s->substr(std::string(kOptionReferencePrefix).size());
    return true;
}

class GraphResolver {
public:
    GraphResolver(RasterMap seeds, const ProgramCatalog& catalog, const RenderOptions& overrides)
        : resolved_(std::move(seeds)), catalog_(catalog), overrides_(overrides) {}

    const cv::Mat& resolve(const std::string& name) {
        auto hit = resolved_.find(name);
        if (hit != resolved_.end()) {
            return hit->second;
        }
        auto it = catalog_.find(name);
        if (it == catalog_.end()) {
            throw UnknownProgramError(name);
        }
        const RenderProgram& program = it->second;
        for (const auto& dep : program.dependencies) {
            resolve(dep);
        }
        cv::Mat out = program.generate(resolved_, resolve_options(program, overrides_));
        return resolved_.emplace(name, std::move(out)).first->second;
    }

private:
    RasterMap resolved_;
    const ProgramCatalog& catalog_;
    const RenderOptions& overrides_;
};

} // namespace

const OptionValue& RenderOptions::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw MissingOptionError(key);
    }
    return it->second;
}

bool RenderOptions::get_bool(const std::string& key) const {
    return typed<bool>(*this, key, "a bool");
}

double RenderOptions::get_number(const std::string& key) const {
    return typed<double>(*this, key, "a number");
}

std::string RenderOptions::get_string(const std::string& key) const {
    return typed<std::string>(*this, key, "a string");
}

Rgba RenderOptions::get_color(const std::string& key) const {
    return typed<Rgba>(*this, key, "a color");
}

RenderOptions RenderOptions::merged_with(const RenderOptions& overrides) const {
    RenderOptions out = *this;
    for (const auto& kv : overrides.values_) {
        out.values_[kv.first] = kv.second;
    }
    return out;
}

RenderOptions resolve_options(const RenderProgram& program, const RenderOptions& overrides) {
    RenderOptions merged = program.defaults.merged_with(overrides);
    RenderOptions out;
    for (const auto& kv : merged.values()) {
        std::string target;
        if (!is_reference(kv.second, target)) {
            out.set(kv.first, kv.second);
        } else if (overrides.has(target)) {
            out.set(kv.first, overrides.get(target));
        } else if (program.defaults.has(target)) {
            out.set(kv.first, program.defaults.get(target));
        } else {
            throw MissingOptionError(target + " (referenced by '" + kv.first + "')");
        }
    }
    return out;
}

std::vector<std::string> unknown_programs(const std::vector<std::string>& names,
                                          const RasterMap& seeds,
                                          const ProgramCatalog& catalog) {
    std::vector<std::string> unknown;
    for (const auto& n : names) {
        if (!seeds.count(n) && !catalog.count(n)) {
            unknown.push_back(n);
        }
    }
    return unknown;
}

RasterMap render_outputs(const std::vector<std::string>& names, RasterMap seeds,
                         const ProgramCatalog& catalog, const RenderOptions& overrides) {
    GraphResolver resolver(std::move(seeds), catalog, overrides);
    RasterMap outputs;
    for (const auto& name : names) {
        outputs[name] = resolver.resolve(name);
    }
    return outputs;
}

} // namespace diffmap::render
