#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace Convida {

/**
 * \file
 * Cell is the state of a single grid position in the Universe.
 *
 * Stored as a byte so the host can read the cell buffer directly for pixel
 * rendering. The numeric values (Dead = 0, Alive = 1) are only relied upon by
 * neighbor counting; no arithmetic is defined on the type.
 */
enum class Cell : uint8_t {
    Dead = 0,
    Alive = 1,
};

// Flip Dead <-> Alive in place.
void toggle(Cell& cell);

bool isAlive(Cell cell);

/**
 * Get a human-readable name for a cell state ("DEAD" or "ALIVE").
 */
const char* getCellName(Cell cell);

/**
 * Glyph used by the text rendering.
 */
const char* getCellGlyph(Cell cell);

/**
 * JSON serialization support for Cell (ADL convention for nlohmann::json).
 */
void to_json(nlohmann::json& j, Cell cell);
void from_json(const nlohmann::json& j, Cell& cell);

} // namespace Convida
