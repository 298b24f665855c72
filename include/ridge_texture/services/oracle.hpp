#pragma once

#include "ridge_texture/config/configuration.hpp"
#include "ridge_texture/core/cancellation.hpp"
#include "ridge_texture/core/types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace ridge_texture::services {

// Optional qualitative reviewer of a processed image. Implementations throw
// OracleUnavailable on any failure and give up early once `stop` is raised.
class QualityOracle {
public:
    virtual ~QualityOracle() = default;

    virtual OracleReport assess(const std::string& original_ref,
                                const std::string& processed_ref,
                                int64_t elapsed_ms,
                                const core::CancelToken& stop) = 0;
};

// Chat-completions style vision endpoint with a strict JSON-schema response.
class HttpQualityOracle : public QualityOracle {
public:
    explicit HttpQualityOracle(config::OracleConfig cfg);

    OracleReport assess(const std::string& original_ref,
                        const std::string& processed_ref,
                        int64_t elapsed_ms,
                        const core::CancelToken& stop) override;

    nlohmann::json build_request(const std::string& original_ref,
                                 const std::string& processed_ref,
                                 int64_t elapsed_ms) const;

private:
    config::OracleConfig cfg_;
};

// Parses the assistant message of a chat-completions response.
OracleReport parse_oracle_response(const std::string& body);

// http(s) and data: URLs pass through; file:// URLs and plain paths are
// inlined as base64 data URLs.
std::string to_image_url(const std::string& ref);

} // namespace ridge_texture::services
