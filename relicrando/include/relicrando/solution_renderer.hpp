#ifndef RELICRANDO_SOLUTION_RENDERER_HPP
#define RELICRANDO_SOLUTION_RENDERER_HPP

#include <relicrando/accessibility_model.hpp>
#include <relicrando/proof.hpp>
#include <functional>
#include <string>
#include <vector>

namespace relicrando {

using TokenNamer = std::function<std::string(TokenId)>;

/**
 * Renders a minimized proof as indented text.
 *
 * A chain prints its token names joined by " < ". Requirements of the
 * chain's last token follow, prefixed "^ " and indented so the caret sits
 * under that last name:
 *
 *   Soul of Bat < Form of Mist
 *                 ^ Jewel of Open
 */
class SolutionRenderer {
public:
    explicit SolutionRenderer(TokenNamer namer);

    // Names tokens by their display name in model
    static SolutionRenderer for_model(const AccessibilityModel& model);

    std::vector<std::string> render_lines(const std::vector<Solution>& solutions) const;

    // Lines joined by '\n', without a trailing newline
    std::string render_text(const std::vector<Solution>& solutions) const;

private:
    void render_node(const Solution& node, size_t indent, bool sub,
                     std::vector<std::string>& lines) const;

    TokenNamer namer_;
};

} // namespace relicrando

#endif // RELICRANDO_SOLUTION_RENDERER_HPP
