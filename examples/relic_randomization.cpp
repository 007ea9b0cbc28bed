/**
 * Relic Randomization Example
 *
 * Runs a full placement search over the relic catalog:
 * - Merging options into the accessibility model
 * - Searching with the parallel orchestrator
 * - Printing the assignment and the minimized progression proof
 *
 * Usage: relic_randomization [seed] [workers]
 */

#include <relicrando/catalog.hpp>
#include <relicrando/errors.hpp>
#include <relicrando/options.hpp>
#include <relicrando/orchestrator.hpp>
#include <relicrando/solution_minimizer.hpp>
#include <relicrando/solution_renderer.hpp>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace relicrando;

int main(int argc, char** argv) {
    const std::string seed = argc > 1 ? argv[1] : "example";
    const size_t workers = argc > 2 ? std::strtoul(argv[2], nullptr, 10) : 0;

    std::cout << "=== Relic Randomization Example ===\n\n";

    // Soul of Bat must sit at least four steps deep
    RandomizerOptions options;
    options.extension = ExtensionMode::Guarded;
    options.goal = RandomizerOptions::Goal{4, std::nullopt, std::vector<LockSpec>{LockSpec{"Soul of Bat"}}};
    options.placed["Jewel of Open"] = "Jewel of Open";

    try {
        auto model = build_model(options);
        std::cout << "Model: " << model->num_tokens() << " tokens, "
                  << model->num_locations() << " locations\n";

        RelicOrchestrator orchestrator(workers);
        orchestrator.set_rounds(8);
        std::cout << "Workers: " << orchestrator.num_workers() << "\n";
        std::cout << "Seed: \"" << seed << "\"\n\n";

        PlacementResult result = orchestrator.run(model, "1.0.0", options_fingerprint(options), seed);

        std::cout << "Accepted nonce " << result.nonce
                  << " with complexity " << result.complexity << "\n\n";

        std::cout << "Assignment:\n";
        for (LocationId l = 0; l < model->num_locations(); ++l) {
            const auto& location = model->location(l);
            const auto& token = model->token(result.assignment.token_at(l));
            std::cout << "  " << location.id << " -> " << token.name << "\n";
        }

        SolutionMinimizer minimizer;
        MinimizedProof proof = minimizer.minimize(result.proof);
        std::cout << "\nProgression (depth " << proof.depth << "):\n";
        for (const auto& line : SolutionRenderer::for_model(*model).render_lines(proof.solutions)) {
            std::cout << "  " << line << "\n";
        }
    } catch (const SearchExhausted& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const RandomizerError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Example completed ===\n";
    return 0;
}
