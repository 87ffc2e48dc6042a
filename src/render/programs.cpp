#include "diffmap/render/programs.hpp"
#include "diffmap/diff/flag_map.hpp"
#include "diffmap/image/pixel_ops.hpp"

namespace diffmap::render {

namespace {

using image::Palette;
using image::PaletteEntry;
using image::PaletteMatch;

PaletteEntry when(const diff::flag_bits::Field& field, const Rgba& color) {
    PaletteEntry entry;
    entry.match.push_back(PaletteMatch::masked(field.mask, field.value));
    entry.color = color;
    return entry;
}

PaletteEntry otherwise(const Rgba& color) {
    PaletteEntry entry;
    entry.color = color;
    return entry;
}

cv::Mat flags_of(const RasterMap& maps) {
    return maps.at(kSeedFlags);
}

RenderProgram changed_faded() {
    RenderProgram p;
    p.defaults = {{"fade", 0.5}};
    p.dependencies = {kSeedChanged};
    p.generate = [](const RasterMap& maps, const RenderOptions& opt) {
        return image::greyscale(maps.at(kSeedChanged), opt.get_number("fade"));
    };
    return p;
}

RenderProgram flags_diff_pixels() {
    RenderProgram p;
    p.defaults = {{"diff_pixel_color", Rgba{255, 128, 0, 255}}};
    p.dependencies = {kSeedFlags};
    p.generate = [](const RasterMap& maps, const RenderOptions& opt) {
        const Palette palette{
            when(diff::flag_bits::DIFF_DIFFERENT, opt.get_color("diff_pixel_color"))};
        return image::render_values(flags_of(maps), palette);
    };
    return p;
}

RenderProgram flags_diff_groups() {
    RenderProgram p;
    p.defaults = {{"group_border_color", Rgba{255, 0, 0, 255}},
                  {"group_fill_color", Rgba{255, 0, 255, 128}}};
    p.dependencies = {kSeedFlags};
    p.generate = [](const RasterMap& maps, const RenderOptions& opt) {
        const Palette palette{
            when(diff::flag_bits::GROUP_BORDER, opt.get_color("group_border_color")),
            when(diff::flag_bits::GROUP_FILL, opt.get_color("group_fill_color"))};
        return image::render_values(flags_of(maps), palette);
    };
    return p;
}

RenderProgram flags_similarity() {
    RenderProgram p;
    p.defaults = {{"identical_color", Rgba{0, 0, 0, 255}},
                  {"similar_color", Rgba{128, 128, 128, 255}},
                  {"changed_color", Rgba{255, 255, 255, 255}}};
    p.dependencies = {kSeedFlags};
    p.generate = [](const RasterMap& maps, const RenderOptions& opt) {
        const Palette palette{
            when(diff::flag_bits::CHANGED, opt.get_color("changed_color")),
            when(diff::flag_bits::SIMILAR, opt.get_color("similar_color")),
            otherwise(opt.get_color("identical_color"))};
        return image::render_values(flags_of(maps), palette);
    };
    return p;
}

RenderProgram flags_significance() {
    RenderProgram p;
    p.defaults = {{"antialias_color", Rgba{0, 0, 128, 255}},
                  {"background_color", Rgba{0, 0, 0, 255}},
                  {"foreground_color", Rgba{255, 255, 255, 255}}};
    p.dependencies = {kSeedFlags};
    p.generate = [](const RasterMap& maps, const RenderOptions& opt) {
        const Palette palette{
            when(diff::flag_bits::ANTIALIAS, opt.get_color("antialias_color")),
            when(diff::flag_bits::BACKGROUND, opt.get_color("background_color")),
            otherwise(opt.get_color("foreground_color"))};
        return image::render_values(flags_of(maps), palette);
    };
    return p;
}

} // namespace

ProgramCatalog default_catalog() {
    ProgramCatalog catalog;
    catalog["changedFaded"] = changed_faded();
    catalog["flagsDiffPixels"] = flags_diff_pixels();
    catalog["flagsDiffGroups"] = flags_diff_groups();
    catalog["flagsSimilarity"] = flags_similarity();
    catalog["flagsSignificance"] = flags_significance();

    catalog["groups"] = RenderProgram{
        {},
        {"changedFaded", "flagsDiffPixels", "flagsDiffGroups"},
        [](const RasterMap& maps, const RenderOptions&) {
            return image::blend(maps.at("changedFaded"), maps.at("flagsDiffGroups"));
        }};

    catalog["pixels"] = RenderProgram{
        {},
        {"changedFaded", "flagsDiffPixels"},
        [](const RasterMap& maps, const RenderOptions&) {
            return image::blend(maps.at("changedFaded"), maps.at("flagsDiffPixels"));
        }};

    catalog["flagsrgb"] = RenderProgram{
        {},
        {"flagsDiffPixels", "flagsDiffGroups", "flagsSignificance"},
        [](const RasterMap& maps, const RenderOptions&) {
            const cv::Mat base = image::blend(maps.at("flagsSignificance"),
                                              maps.at("flagsDiffPixels"));
            return image::blend(base, maps.at("flagsDiffGroups"));
        }};

    return catalog;
}

} // namespace diffmap::render
