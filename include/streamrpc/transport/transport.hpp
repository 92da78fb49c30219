#pragma once

namespace streamrpc {

class CallDispatcher;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start accepting calls for `dispatcher`. Blocks until shutdown.
    virtual void start(CallDispatcher& dispatcher) = 0;

    /// Graceful shutdown.
    virtual void shutdown() = 0;

    /// Check if transport is accepting connections.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace streamrpc
