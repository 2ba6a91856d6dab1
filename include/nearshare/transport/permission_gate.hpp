#pragma once

#include "nearshare/transport/transport_kind.hpp"
#include <map>
#include <mutex>

namespace nearshare::transport {

class PermissionGate {
public:
    virtual ~PermissionGate() = default;
    virtual bool has_required_permissions(TransportKind medium) const = 0;
};

class StaticPermissionGate : public PermissionGate {
public:
    StaticPermissionGate() = default;
    StaticPermissionGate(bool radio_granted, bool group_granted);

    bool has_required_permissions(TransportKind medium) const override;

    void grant(TransportKind medium);
    void revoke(TransportKind medium);

private:
    mutable std::mutex mutex_;
    std::map<TransportKind, bool> granted_;
};

} // namespace nearshare::transport
