#ifndef REMOTE_DECISION_PROVIDER_HPP
#define REMOTE_DECISION_PROVIDER_HPP

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "remote/connection.hpp"
#include "util/channel.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Synchronous facade over a remote player.
// A connection task owns the transport on its own thread. The engine thread hands it requests through a
// channel and blocks on a future for each bet. A closed transport or an expired timeout yields no decision.
class RemoteDecisionProvider : public IDecisionProvider, public IEventSink {
public:
    // A zero timeout waits forever
    RemoteDecisionProvider(std::shared_ptr<IConnection> connection, std::chrono::milliseconds timeout);
    ~RemoteDecisionProvider() override;

    RemoteDecisionProvider(const RemoteDecisionProvider&) = delete;
    RemoteDecisionProvider& operator=(const RemoteDecisionProvider&) = delete;

    std::optional<Bet> decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) override;
    void notify(const GameEvent& event) override;

    bool isConnected() const;

private:
    struct Request {
        std::string message;
        std::optional<std::promise<std::optional<Bet>>> reply; // Only set for bet requests
    };

    void runConnectionTask();
    std::optional<Bet> receiveBet();

    std::shared_ptr<IConnection> m_connection;
    std::chrono::milliseconds m_timeout;
    Channel<Request> m_requests;
    std::thread m_task;
};

#endif // REMOTE_DECISION_PROVIDER_HPP
