#include "UniverseDiagramGenerator.h"
#include "Cell.h"
#include "Universe.h"

#include <sstream>

using namespace Convida;

std::string UniverseDiagramGenerator::generateDiagram(const Universe& universe)
{
    std::ostringstream diagram;

    const uint32_t width = universe.getWidth();
    const uint32_t height = universe.getHeight();
    const auto& cells = universe.getCells();

    for (uint32_t row = 0; row < height; ++row) {
        for (uint32_t col = 0; col < width; ++col) {
            diagram << getCellGlyph(cells[static_cast<size_t>(row) * width + col]);
        }
        diagram << "\n";
    }

    return diagram.str();
}

std::string UniverseDiagramGenerator::generateBorderedDiagram(const Universe& universe)
{
    std::ostringstream diagram;

    const uint32_t width = universe.getWidth();
    const uint32_t height = universe.getHeight();
    const auto& cells = universe.getCells();

    diagram << "Convida " << width << "x" << height << " generation "
            << universe.getGeneration() << "\n";

    // Top border.
    diagram << "┌";
    for (uint32_t col = 0; col < width; ++col) {
        diagram << "─";
    }
    diagram << "┐\n";

    // Each row.
    for (uint32_t row = 0; row < height; ++row) {
        diagram << "│";
        for (uint32_t col = 0; col < width; ++col) {
            diagram << getCellGlyph(cells[static_cast<size_t>(row) * width + col]);
        }
        diagram << "│\n";
    }

    // Bottom border.
    diagram << "└";
    for (uint32_t col = 0; col < width; ++col) {
        diagram << "─";
    }
    diagram << "┘\n";

    return diagram.str();
}
