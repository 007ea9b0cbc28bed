// solution_renderer.cpp - Text layout of minimized proofs

#include "relicrando/solution_renderer.hpp"

#include <stdexcept>

namespace relicrando {

SolutionRenderer::SolutionRenderer(TokenNamer namer) : namer_(std::move(namer)) {
    if (!namer_) {
        throw std::invalid_argument("SolutionRenderer requires a token namer");
    }
}

SolutionRenderer SolutionRenderer::for_model(const AccessibilityModel& model) {
    // The model is captured by pointer; it must outlive the renderer
    const AccessibilityModel* m = &model;
    return SolutionRenderer([m](TokenId token) { return m->token(token).name; });
}

void SolutionRenderer::render_node(const Solution& node, size_t indent, bool sub,
                                   std::vector<std::string>& lines) const {
    std::vector<std::string> names;
    for (TokenId token : node.tokens()) {
        names.push_back(namer_(token));
    }

    std::string line(indent, ' ');
    if (sub) line += "^ ";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) line += " < ";
        line += names[i];
    }
    lines.push_back(std::move(line));

    const auto& requirements = node.requirements();
    if (requirements.empty()) return;

    size_t child_indent = indent + (sub ? 2 : 0);
    for (size_t i = 0; i + 1 < names.size(); ++i) {
        child_indent += names[i].size() + 3;
    }
    for (const auto& requirement : requirements) {
        render_node(requirement, child_indent, true, lines);
    }
}

std::vector<std::string> SolutionRenderer::render_lines(const std::vector<Solution>& solutions) const {
    std::vector<std::string> lines;
    for (const auto& solution : solutions) {
        render_node(solution, 0, false, lines);
    }
    return lines;
}

std::string SolutionRenderer::render_text(const std::vector<Solution>& solutions) const {
    std::string text;
    for (const auto& line : render_lines(solutions)) {
        if (!text.empty()) text += '\n';
        text += line;
    }
    return text;
}

} // namespace relicrando
