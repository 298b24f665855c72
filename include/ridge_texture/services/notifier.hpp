#pragma once

#include "ridge_texture/config/configuration.hpp"
#include "ridge_texture/core/cancellation.hpp"
#include "ridge_texture/run/run_record.hpp"

#include <cstddef>
#include <string>

namespace ridge_texture::services {

constexpr size_t kMaxNotificationTitle = 1200;
constexpr size_t kMaxNotificationContent = 20000;

struct Notification {
    std::string title;
    std::string content;
};

class Notifier {
public:
    virtual ~Notifier() = default;

    // Returns false when the endpoint rejected the message. Gives up early
    // once `stop` is raised.
    virtual bool notify(const std::string& title, const std::string& content,
                        const core::CancelToken& stop) = 0;
};

// Posts {"title","content"} with a bearer token.
class HttpNotifier : public Notifier {
public:
    explicit HttpNotifier(config::NotifierConfig cfg);

    bool notify(const std::string& title, const std::string& content,
                const core::CancelToken& stop) override;

private:
    config::NotifierConfig cfg_;
};

// Throws ValidationError for empty or oversized fields.
void validate_notification(const std::string& title, const std::string& content);

// Owner message for a terminal run. The headline score is the oracle
// confidence when a report exists, else the overall quality score.
Notification build_notification(const run::ProcessingRun& run, double perfect_threshold);

} // namespace ridge_texture::services
