#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

std::string_view to_string(ZoneType zone_type) noexcept {
    switch (zone_type) {
        case ZoneType::Polygon:
            return "polygon";
        case ZoneType::Circle:
            return "circle";
    }
    return "unknown";
}

std::string_view to_string(AccessLevel access_level) noexcept {
    switch (access_level) {
        case AccessLevel::FullAccess:
            return "fullAccess";
        case AccessLevel::ViewingOnly:
            return "viewingOnly";
        case AccessLevel::NoAccess:
            return "noAccess";
    }
    return "unknown";
}

std::string_view to_string(LocationPermission permission) noexcept {
    switch (permission) {
        case LocationPermission::WhileInUse:
            return "whileInUse";
        case LocationPermission::Always:
            return "always";
        case LocationPermission::Denied:
            return "denied";
        case LocationPermission::DeniedForever:
            return "deniedForever";
    }
    return "unknown";
}

}  // namespace delivery_geofence
