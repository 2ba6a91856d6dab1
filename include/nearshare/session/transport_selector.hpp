#pragma once

#include "nearshare/core/result.hpp"
#include "nearshare/transport/transport.hpp"
#include <memory>
#include <vector>

namespace nearshare::session {

// Resolves a TransportSelection against the registered transports. AUTO
// prefers the highest-throughput medium that is available and enabled.
class TransportSelector {
public:
    void add(std::shared_ptr<transport::Transport> transport);

    core::Result<std::shared_ptr<transport::Transport>> select(transport::TransportSelection selection) const;

    std::shared_ptr<transport::Transport> find(transport::TransportKind kind) const;
    const std::vector<std::shared_ptr<transport::Transport>>& transports() const { return transports_; }

    static bool is_usable(const transport::Transport& transport);

private:
    std::vector<std::shared_ptr<transport::Transport>> transports_;
};

} // namespace nearshare::session
