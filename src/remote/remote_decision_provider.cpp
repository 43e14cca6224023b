#include "remote/remote_decision_provider.hpp"

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "io/messages.hpp"
#include "remote/connection.hpp"
#include "util/result.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

RemoteDecisionProvider::RemoteDecisionProvider(std::shared_ptr<IConnection> connection, std::chrono::milliseconds timeout) :
    m_connection{ std::move(connection) },
    m_timeout{ timeout },
    m_task{ [this]() { runConnectionTask(); } } {}

RemoteDecisionProvider::~RemoteDecisionProvider() {
    m_requests.close();
    m_connection->close();
    if (m_task.joinable()) {
        m_task.join();
    }
}

std::optional<Bet> RemoteDecisionProvider::decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) {
    std::promise<std::optional<Bet>> reply;
    std::future<std::optional<Bet>> future = reply.get_future();
    if (!m_requests.push(Request{ .message = encodeBetRequest(args, holeCards, bankRoll), .reply = std::move(reply) })) {
        return std::nullopt;
    }

    if (m_timeout.count() > 0 && future.wait_for(m_timeout) == std::future_status::timeout) {
        std::cerr << "Error: Remote player did not answer within " << m_timeout.count() << " ms.\n";
        return std::nullopt;
    }
    return future.get();
}

void RemoteDecisionProvider::notify(const GameEvent& event) {
    if (!m_requests.push(Request{ .message = encodeEvent(event), .reply = std::nullopt })) {
        std::cerr << "Error: Dropped an event for a closed connection.\n";
    }
}

bool RemoteDecisionProvider::isConnected() const {
    return !m_requests.isClosed();
}

void RemoteDecisionProvider::runConnectionTask() {
    while (std::optional<Request> request = m_requests.pop()) {
        if (!m_connection->send(request->message)) {
            m_requests.close();
            if (request->reply) {
                request->reply->set_value(std::nullopt);
            }
            continue;
        }

        if (request->reply) {
            request->reply->set_value(receiveBet());
        }
    }
}

std::optional<Bet> RemoteDecisionProvider::receiveBet() {
    std::optional<std::string> message = m_connection->receive();
    if (!message) {
        m_requests.close();
        return std::nullopt;
    }

    Result<Bet> bet = decodeBet(*message);
    if (bet.isError()) {
        std::cerr << "Error: " << bet.getError() << "\n";
        return std::nullopt;
    }
    return bet.getValue();
}
