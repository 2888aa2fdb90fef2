#ifndef UNIVERSE_DIAGRAM_GENERATOR_H
#define UNIVERSE_DIAGRAM_GENERATOR_H

#include <string>

namespace Convida {

class Universe;

class UniverseDiagramGenerator {
public:
    // One glyph per cell (◻ dead, ◼ alive), every row newline-terminated.
    static std::string generateDiagram(const Universe& universe);

    // Same grid inside a box-drawing frame, headed by size and generation.
    static std::string generateBorderedDiagram(const Universe& universe);
};

} // namespace Convida

#endif // UNIVERSE_DIAGRAM_GENERATOR_H
