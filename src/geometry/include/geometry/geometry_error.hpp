#pragma once

namespace tg::geometry {

enum class GeometryError {
    MissingTrack,  // item layer names a track the project does not have
    UnknownItem    // no cached entry for the requested id
};

inline const char* to_string(GeometryError err) {
    switch (err) {
        case GeometryError::MissingTrack: return "missing track";
        case GeometryError::UnknownItem: return "unknown item";
    }
    return "unknown";
}

} // namespace tg::geometry
