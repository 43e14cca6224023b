#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <optional>
#include <string>

// A message transport, such as a WebSocket. Implementations must be safe to close from another thread.
class IConnection {
public:
    virtual ~IConnection() = default;

    // Returns false when the message could not be sent
    virtual bool send(const std::string& message) = 0;

    // Blocks until a message arrives. Returns nothing once the connection is closed.
    virtual std::optional<std::string> receive() = 0;

    virtual void close() = 0;
};

#endif // CONNECTION_HPP
