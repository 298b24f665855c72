#include "ridge_texture/core/errors.hpp"

namespace ridge_texture {

std::string error_kind_of(const std::exception& e) {
    if (dynamic_cast<const InvalidImage*>(&e)) return "invalid_image";
    if (dynamic_cast<const SynthesisError*>(&e)) return "synthesis_error";
    if (dynamic_cast<const StopRequested*>(&e)) return "stop_requested";
    if (dynamic_cast<const StoreUnavailable*>(&e)) return "store_unavailable";
    if (dynamic_cast<const StorageError*>(&e)) return "storage_error";
    if (dynamic_cast<const IOError*>(&e)) return "io_error";
    if (dynamic_cast<const ValidationError*>(&e)) return "validation_error";
    if (dynamic_cast<const StateError*>(&e)) return "state_error";
    return "internal_error";
}

} // namespace ridge_texture
