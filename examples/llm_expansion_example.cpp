#include "domain/domain_catalog.hpp"
#include "expansion/expansion_generator.hpp"
#include "expansion/expansion_service.hpp"
#include "llm/llm_provider.hpp"
#include "session/expansion_session.hpp"
#include <iostream>

using namespace kgx;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

int main(int argc, char* argv[]) {
    print_separator("LLM Expansion Example");

    const std::string domain = argc > 1 ? argv[1] : "wine";

    // =========================================================================
    // Example 1: Configure LLM Provider
    // =========================================================================

    print_separator("Example 1: LLM Provider Configuration");

    std::cout << "Configuration is read from the environment:\n";
    std::cout << "  export OPENAI_API_KEY=\"your-key-here\"\n";
    std::cout << "  export KGX_LLM_PROVIDER=\"openai\"   # or gemini with GEMINI_API_KEY\n";
    std::cout << "  export KGX_LLM_MODEL=\"gpt-4o-mini\" # optional\n\n";

    auto provider = LLMProviderFactory::create_from_env();
    if (!provider) {
        std::cerr << "No API key found. Set OPENAI_API_KEY or GEMINI_API_KEY.\n";
        return 1;
    }

    std::cout << "Provider: " << provider->get_provider_name() << "\n";
    std::cout << "Model: " << provider->get_model() << "\n";

    LLMExpansionGenerator generator(std::move(provider));
    DomainCatalog catalog = DomainCatalog::builtin(domain);

    // =========================================================================
    // Example 2: Prompts
    // =========================================================================

    print_separator("Example 2: Prompts for " + catalog.title());

    ExpansionRequest preview;
    preview.focus_node.id = catalog.root().id;
    preview.focus_node.label = catalog.root().label;
    preview.focus_node.kind = catalog.root().kind;
    preview.existing_element_ids = {catalog.root().id};

    std::cout << "System prompt:\n" << ExpansionPrompts::system_prompt(catalog) << "\n\n";
    std::cout << "User prompt:\n" << ExpansionPrompts::user_prompt(preview) << "\n";

    // =========================================================================
    // Example 3: One request through the service
    // =========================================================================

    print_separator("Example 3: Expansion service");

    ExpansionService service(generator, true);
    ServiceResponse response = service.handle(domain, preview.to_json());
    std::cout << "Status: " << response.status << "\n";
    std::cout << response.body.dump(2) << "\n";

    // =========================================================================
    // Example 4: Two-level session
    // =========================================================================

    print_separator("Example 4: Session");

    SessionOptions options;
    options.verbose = true;
    ExpansionSession session(catalog, generator, IncrementalLayout(), options);

    ExpansionOutcome root = session.start();
    if (!root.success()) {
        std::cerr << "Root expansion failed: " << root.error_message << "\n";
        return 1;
    }

    for (const auto& outcome : session.expand_frontier(2)) {
        std::cout << outcome.to_json().dump() << "\n";
    }

    session.graph().export_to_json("llm_graph.json");
    std::cout << "\nSaved llm_graph.json (" << session.graph().num_nodes() << " nodes)\n";
    return 0;
}
