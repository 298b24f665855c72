#pragma once

#include "ridge_texture/core/cancellation.hpp"

#include <string>

namespace ridge_texture::services {

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking JSON POST over Qt Network. Drives its own QEventLoop, so it may be
// called from any thread once a QCoreApplication exists. The request is
// aborted when `stop` is raised. Transport errors, timeouts and aborts throw
// IOError; HTTP error statuses are returned.
HttpResponse post_json(const std::string& url, const std::string& body,
                       const std::string& bearer_token, int timeout_ms,
                       const core::CancelToken* stop = nullptr);

// Value of the environment variable `name`, or empty.
std::string env_or_empty(const std::string& name);

} // namespace ridge_texture::services
