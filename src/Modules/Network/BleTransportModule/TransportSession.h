#pragma once
/**
 * @file TransportSession.h
 * @brief Connection lifecycle and time-sync state of the current peer.
 */

#include <stdint.h>

enum class SessionState : uint8_t { Disconnected, ConnectedUnsynced, ConnectedSynced };

/**
 * @brief Disconnected -> ConnectedUnsynced -> ConnectedSynced -> Disconnected.
 *
 * The synced flag only means "this connection delivered a time value": it
 * is cleared on every connect and every disconnect.
 */
class TransportSession {
public:
    void onConnected();
    void onDisconnected();
    /** @brief Record a time sync. Returns false (no transition) when not connected. */
    bool onTimeSync();

    SessionState state() const { return state_; }
    bool isConnected() const { return state_ != SessionState::Disconnected; }
    bool isTimeSynced() const { return state_ == SessionState::ConnectedSynced; }
    uint32_t connectCount() const { return connects_; }

private:
    SessionState state_ = SessionState::Disconnected;
    uint32_t connects_ = 0;
};

const char* sessionStateStr(SessionState s);

/**
 * @brief Remembers a link change that the event queue could not take.
 *
 * A link event queued afterwards supersedes the lost one. Otherwise the
 * consumer replays the current link state once, after the queue drains.
 */
class LinkEventLatch {
public:
    void onQueued() { pending_ = false; }
    void onLost() { pending_ = true; }
    /** @brief True once per lost change that no later queued event superseded. */
    bool takePending() {
        const bool p = pending_;
        pending_ = false;
        return p;
    }

private:
    volatile bool pending_ = false;
};
