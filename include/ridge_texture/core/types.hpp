#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace ridge_texture {

// Matrix types used for per-pixel statistics
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Red-channel intensity below this value is ridge, anything else valley.
constexpr int kRidgeThreshold = 128;

// Half-width of the additive ridge noise on the 0..255 scale.
constexpr int kNoiseHalfWidth = 20;

enum class PixelClass : uint8_t {
    Ridge,
    Valley
};

inline std::string pixel_class_to_string(PixelClass c) {
    return c == PixelClass::Ridge ? "ridge" : "valley";
}

inline PixelClass classify_intensity(int red) {
    return red < kRidgeThreshold ? PixelClass::Ridge : PixelClass::Valley;
}

// Per-pixel classification of one image, row-major.
struct ClassMap {
    int width = 0;
    int height = 0;
    std::vector<PixelClass> classes;

    PixelClass at(int x, int y) const {
        return classes[static_cast<size_t>(y) * static_cast<size_t>(width) +
                       static_cast<size_t>(x)];
    }

    size_t count(PixelClass c) const {
        return static_cast<size_t>(std::count(classes.begin(), classes.end(), c));
    }
};

struct QualityMetrics {
    double texture_uniformity = 0.0;
    double edge_preservation = 0.0;
    double contrast_ratio = 0.0;
    double ridge_clarity = 0.0;
    double background_cleanness = 0.0;
    double overall_score = 0.0;
};

// Qualitative opinion returned by the external vision oracle.
struct OracleReport {
    std::string assessment;
    std::vector<std::string> recommendations;
    std::string notes;
    double confidence = 0.0; // [0,1]
};

enum class RunStatus {
    Pending,
    Processing,
    Completed,
    Failed
};

inline std::string run_status_to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Pending: return "pending";
        case RunStatus::Processing: return "processing";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
        default: return "unknown";
    }
}

// Returns false for unknown names; `out` is untouched in that case.
inline bool string_to_run_status(const std::string& s, RunStatus& out) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (norm == "pending") { out = RunStatus::Pending; return true; }
    if (norm == "processing") { out = RunStatus::Processing; return true; }
    if (norm == "completed") { out = RunStatus::Completed; return true; }
    if (norm == "failed") { out = RunStatus::Failed; return true; }
    return false;
}

inline bool is_terminal(RunStatus s) {
    return s == RunStatus::Completed || s == RunStatus::Failed;
}

// Pipeline stage enumeration (event log phases)
enum class Stage {
    LOAD = 0,
    CLASSIFY = 1,
    SYNTHESIZE = 2,
    SHARPEN = 3,
    SCORE = 4,
    STORE = 5,
    ORACLE = 6,
    NOTIFY = 7,
    DONE = 8
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::LOAD: return "LOAD";
        case Stage::CLASSIFY: return "CLASSIFY";
        case Stage::SYNTHESIZE: return "SYNTHESIZE";
        case Stage::SHARPEN: return "SHARPEN";
        case Stage::SCORE: return "SCORE";
        case Stage::STORE: return "STORE";
        case Stage::ORACLE: return "ORACLE";
        case Stage::NOTIFY: return "NOTIFY";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace ridge_texture
