#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>


///////////////////////////
///     DEMO  SIZES     ///
///////////////////////////
/**
 * @brief Size presets of the synthetic unconferences.
 *
 *  - S:  3 rooms x 3 timeslots (one blocked), 8 sessions
 *  - M:  5 rooms x 6 timeslots (one blocked), 36 sessions
 *  - L:  8 rooms x 10 timeslots (two blocked), 90 sessions
 *  - XL: 12 rooms x 14 timeslots (two blocked), 200 sessions
 */
enum class DemoSize { S, M, L, XL };

/**
 * @brief Build a deterministic synthetic unconference of the given size.
 *
 * Vote counts are drawn from a fixed-seed generator, so every call with the
 * same size returns an identical catalog.
 */
Catalog makeDemoInstance(DemoSize size);

/// Parse "S", "M", "L" or "XL" (case-insensitive).
bool parseDemoSize(const std::string& name, DemoSize& out);
