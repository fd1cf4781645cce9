#include "expansion/expansion_service.hpp"
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace kgx {

std::string expansion_error_kind_to_string(ExpansionErrorKind kind) {
    switch (kind) {
        case ExpansionErrorKind::None: return "none";
        case ExpansionErrorKind::GeneratorFailed: return "generator_failed";
        case ExpansionErrorKind::InvalidModelJson: return "invalid_model_json";
        default: return "unknown";
    }
}

ExpansionService::ExpansionService(ExpansionGenerator& generator, bool verbose)
    : generator_(generator), verbose_(verbose) {}

ServiceResult ExpansionService::expand(const DomainCatalog& catalog, const ExpansionRequest& request) {
    ServiceResult result;

    GenerationResult generated;
    try {
        generated = generator_.generate(request, catalog);
    } catch (const std::exception& e) {
        generated.success = false;
        generated.error_message = e.what();
    }
    result.latency_ms = generated.latency_ms;

    if (!generated.success) {
        result.error_kind = ExpansionErrorKind::GeneratorFailed;
        result.error_message = generated.error_message.empty()
            ? "generator failed"
            : generated.error_message;
        if (verbose_) {
            std::cerr << "Generator " << generator_.get_name() << " failed for "
                      << request.focus_node.id << ": " << result.error_message << std::endl;
        }
        return result;
    }

    std::string parse_error;
    auto payload = parse_model_json(generated.text, parse_error);
    if (!payload) {
        result.error_kind = ExpansionErrorKind::InvalidModelJson;
        result.error_message = "invalid json from model";
        if (verbose_) {
            std::cerr << "Invalid JSON from model for " << request.focus_node.id
                      << ": " << parse_error << std::endl;
        }
        return result;
    }

    ExpansionSanitizer sanitizer(catalog);
    result.batch = sanitizer.sanitize(
        request.focus_node.id,
        request.focus_node.depth,
        request.used_identifiers(),
        *payload,
        &result.report
    );
    result.success = true;

    if (verbose_) {
        std::cout << "Sanitized expansion of " << request.focus_node.id << ": "
                  << result.batch.nodes.size() << " nodes, "
                  << result.batch.edges.size() << " edges" << std::endl;
    }

    return result;
}

ServiceResponse ExpansionService::handle(const std::string& domain, const json& body) {
    ServiceResponse response;

    DomainCatalog catalog;
    try {
        catalog = DomainCatalog::builtin(domain);
    } catch (const std::invalid_argument&) {
        response.status = 400;
        response.body = {{"error", "unknown domain: " + domain}};
        return response;
    }

    ExpansionRequest request;
    try {
        request = ExpansionRequest::from_json(body);
    } catch (const std::invalid_argument& e) {
        response.status = 400;
        response.body = {{"error", e.what()}};
        return response;
    }

    ServiceResult result = expand(catalog, request);
    if (!result.success) {
        response.status = 500;
        response.body = {{"error", result.error_message}};
        return response;
    }

    response.status = 200;
    response.body = result.batch.to_json();
    return response;
}

} // namespace kgx
