#include "nearshare/session/transport_selector.hpp"
#include "nearshare/core/logger.hpp"
#include <algorithm>

namespace nearshare::session {

using core::TransferError;
using transport::TransportKind;
using transport::TransportSelection;

namespace {
    // Highest throughput first.
    constexpr TransportKind AUTO_PREFERENCE[] = {
        TransportKind::LOCAL_WIRELESS_GROUP,
        TransportKind::SHORT_RANGE_RADIO
    };
}

void TransportSelector::add(std::shared_ptr<transport::Transport> transport) {
    if (transport) {
        transports_.push_back(std::move(transport));
    }
}

std::shared_ptr<transport::Transport> TransportSelector::find(TransportKind kind) const {
    auto it = std::find_if(transports_.begin(), transports_.end(),
                           [kind](const auto& t) { return t->kind() == kind; });
    return it != transports_.end() ? *it : nullptr;
}

bool TransportSelector::is_usable(const transport::Transport& transport) {
    return transport.is_available() && transport.is_enabled();
}

core::Result<std::shared_ptr<transport::Transport>> TransportSelector::select(TransportSelection selection) const {
    if (selection == TransportSelection::AUTO) {
        for (auto kind : AUTO_PREFERENCE) {
            auto candidate = find(kind);
            if (candidate && is_usable(*candidate)) {
                LOG_INFO("Auto strategy selected {} transport", transport::to_string(kind));
                return candidate;
            }
            LOG_DEBUG("Auto strategy skipped {} transport", transport::to_string(kind));
        }
        return TransferError::unsupported("No supported transport is available");
    }

    auto kind = selection == TransportSelection::SHORT_RANGE_RADIO ? TransportKind::SHORT_RANGE_RADIO
                                                                   : TransportKind::LOCAL_WIRELESS_GROUP;
    auto candidate = find(kind);
    if (!candidate || !candidate->is_available()) {
        return TransferError::unsupported(std::string(transport::to_string(kind)) + " transport is not available");
    }
    if (!candidate->is_enabled()) {
        return TransferError::unsupported(std::string(transport::to_string(kind)) + " transport is disabled");
    }
    return candidate;
}

} // namespace nearshare::session
