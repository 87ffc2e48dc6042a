#pragma once

#include "diffmap/core/types.hpp"

#include <functional>
#include <initializer_list>
#include <map>
#include <opencv2/core.hpp>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace diffmap::render {

using OptionValue = std::variant<bool, double, std::string, Rgba>;

std::string option_type_name(const OptionValue& v);

/**
 * Named, typed options handed to a render program.
 * Getters throw MissingOptionError for absent keys and ValidationError when
 * the stored value has another type.
 */
class RenderOptions {
public:
    RenderOptions() = default;
    RenderOptions(std::initializer_list<std::pair<const std::string, OptionValue>> init)
        : values_(init) {}

    void set(const std::string& key, OptionValue value) { values_[key] = std::move(value); }
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    bool empty() const { return values_.empty(); }

    const OptionValue& get(const std::string& key) const;
    bool get_bool(const std::string& key) const;
    double get_number(const std::string& key) const;
    std::string get_string(const std::string& key) const;
    Rgba get_color(const std::string& key) const;

    const std::map<std::string, OptionValue>& values() const { return values_; }

    // Copy of this set with every key of `overrides` replacing ours
    RenderOptions merged_with(const RenderOptions& overrides) const;

private:
    std::map<std::string, OptionValue> values_;
};

// String values of this form are references to another option key.
constexpr const char* kOptionReferencePrefix = "@@";

using RasterMap = std::map<std::string, cv::Mat>;

using GenerateFn = std::function<cv::Mat(const RasterMap&, const RenderOptions&)>;

struct RenderProgram {
    RenderOptions defaults;
    std::vector<std::string> dependencies;
    GenerateFn generate;
};

using ProgramCatalog = std::map<std::string, RenderProgram>;

// Program defaults overlaid with caller overrides, "@@key" references
// substituted (overrides first, then program defaults).
RenderOptions resolve_options(const RenderProgram& program, const RenderOptions& overrides);

// Names from `names` that neither the seeds nor the catalog can produce
std::vector<std::string> unknown_programs(const std::vector<std::string>& names,
                                          const RasterMap& seeds,
                                          const ProgramCatalog& catalog);

// Resolve every requested name depth-first with memoization: each program
// runs at most once per call. Returns the requested rasters only. Cyclic
// catalogs are not detected.
RasterMap render_outputs(const std::vector<std::string>& names, RasterMap seeds,
                         const ProgramCatalog& catalog,
                         const RenderOptions& overrides = {});

} // namespace diffmap::render
