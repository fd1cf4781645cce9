#pragma once

#include "expansion/expansion_generator.hpp"
#include "expansion/expansion_sanitizer.hpp"
#include "domain/domain_catalog.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace kgx {

// ============================================================================
// Result Types
// ============================================================================

enum class ExpansionErrorKind {
    None,
    GeneratorFailed,        ///< Transport error or generator exception
    InvalidModelJson        ///< Generator answered but the text is not JSON
};

std::string expansion_error_kind_to_string(ExpansionErrorKind kind);

/**
 * @brief Outcome of generate + parse + sanitize for one request
 */
struct ServiceResult {
    bool success = false;
    ExpansionBatch batch;
    SanitizeReport report;
    ExpansionErrorKind error_kind = ExpansionErrorKind::None;
    std::string error_message;
    double latency_ms = 0.0;
};

/**
 * @brief HTTP-shaped response of handle()
 */
struct ServiceResponse {
    int status = 200;
    nlohmann::json body;
};

// ============================================================================
// Expansion Service
// ============================================================================

/**
 * @brief Generator front end: the only place model text is decoded
 *
 * expand() never throws for generator or model faults; they come back as a
 * failed ServiceResult and leave the caller free to keep its graph as is.
 */
class ExpansionService {
public:
    explicit ExpansionService(ExpansionGenerator& generator, bool verbose = false);

    /**
     * @brief Call the generator for a request and sanitize the answer
     *
     * Ids are checked against request.used_identifiers(), which falls back
     * to the legacy node id list when no element ids were sent.
     */
    ServiceResult expand(const DomainCatalog& catalog, const ExpansionRequest& request);

    /**
     * @brief Request/response entry point keyed by domain name
     *
     * - 400 {"error": ...} for an unknown domain or a missing focusNode.id
     * - 500 {"error": "invalid json from model"} for unparseable model text
     * - 500 {"error": ...} for generator failures
     * - 200 sanitized {"nodes": [...], "edges": [...]} otherwise
     */
    ServiceResponse handle(const std::string& domain, const nlohmann::json& body);

    ExpansionGenerator& generator() { return generator_; }

private:
    ExpansionGenerator& generator_;
    bool verbose_;
};

} // namespace kgx
