#include "nearshare/transport/permission_gate.hpp"

namespace nearshare::transport {

StaticPermissionGate::StaticPermissionGate(bool radio_granted, bool group_granted) {
    granted_[TransportKind::SHORT_RANGE_RADIO] = radio_granted;
    granted_[TransportKind::LOCAL_WIRELESS_GROUP] = group_granted;
}

bool StaticPermissionGate::has_required_permissions(TransportKind medium) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = granted_.find(medium);
    return it != granted_.end() && it->second;
}

void StaticPermissionGate::grant(TransportKind medium) {
    std::lock_guard<std::mutex> lock(mutex_);
    granted_[medium] = true;
}

void StaticPermissionGate::revoke(TransportKind medium) {
    std::lock_guard<std::mutex> lock(mutex_);
    granted_[medium] = false;
}

} // namespace nearshare::transport
