#pragma once

#include "diffmap/render/render_graph.hpp"

namespace diffmap::render {

// Seed rasters available to every catalog
constexpr const char* kSeedFlags = "flags";
constexpr const char* kSeedOriginal = "original";
constexpr const char* kSeedChanged = "changed";

// Built-in programs:
//   changedFaded       changed image as faded greyscale
//   flagsDiffPixels    differing pixels
//   flagsDiffGroups    region borders and fills
//   flagsSimilarity    identical / similar / changed
//   flagsSignificance  background / foreground / antialias
//   groups, pixels     overlays on changedFaded
//   flagsrgb           significance with diff pixels and regions on top
ProgramCatalog default_catalog();

} // namespace diffmap::render
