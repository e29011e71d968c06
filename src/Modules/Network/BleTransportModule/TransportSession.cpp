/**
 * @file TransportSession.cpp
 * @brief Implementation file.
 */

#include "Modules/Network/BleTransportModule/TransportSession.h"

void TransportSession::onConnected()
{
    state_ = SessionState::ConnectedUnsynced;
    ++connects_;
}

void TransportSession::onDisconnected()
{
    state_ = SessionState::Disconnected;
}

bool TransportSession::onTimeSync()
{
    if (state_ == SessionState::Disconnected) return false;
    state_ = SessionState::ConnectedSynced;
    return true;
}

const char* sessionStateStr(SessionState s)
{
    switch (s) {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::ConnectedUnsynced: return "connected";
    case SessionState::ConnectedSynced: return "synced";
    }
    return "?";
}
