#include "Cell.h"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace Convida {

static constexpr std::array<const char*, 2> CELL_NAMES = { "DEAD", "ALIVE" };

// White and black medium squares.
static constexpr std::array<const char*, 2> CELL_GLYPHS = { "◻", "◼" };

void toggle(Cell& cell)
{
    cell = (cell == Cell::Dead) ? Cell::Alive : Cell::Dead;
}

bool isAlive(Cell cell)
{
    return cell == Cell::Alive;
}

const char* getCellName(Cell cell)
{
    return CELL_NAMES[static_cast<size_t>(cell)];
}

const char* getCellGlyph(Cell cell)
{
    return CELL_GLYPHS[static_cast<size_t>(cell)];
}

void to_json(nlohmann::json& j, Cell cell)
{
    j = getCellName(cell);
}

void from_json(const nlohmann::json& j, Cell& cell)
{
    if (!j.is_string()) {
        throw std::runtime_error("Cell::from_json: JSON value must be a string");
    }

    const std::string name = j.get<std::string>();
    for (size_t i = 0; i < CELL_NAMES.size(); ++i) {
        if (name == CELL_NAMES[i]) {
            cell = static_cast<Cell>(i);
            return;
        }
    }

    throw std::runtime_error("Cell::from_json: Unknown cell state '" + name + "'");
}

} // namespace Convida
