#include "avrdeck/discovery/DiscoverySession.h"

namespace avrdeck::discovery {

std::string_view toString(SessionState state) {
    switch (state) {
    case SessionState::Created:
        return "created";
    case SessionState::Searching:
        return "searching";
    case SessionState::Stopped:
        return "stopped";
    case SessionState::Destroyed:
        return "destroyed";
    }
    return "unknown";
}

bool isTransitionAllowed(SessionState from, SessionState to) {
    if (from == SessionState::Destroyed) {
        return false;
    }
    if (to == SessionState::Destroyed) {
        return true;
    }
    switch (from) {
    case SessionState::Created:
        return to == SessionState::Searching;
    case SessionState::Searching:
        return to == SessionState::Stopped;
    case SessionState::Stopped:
        return to == SessionState::Searching;
    case SessionState::Destroyed:
        break;
    }
    return false;
}

}  // namespace avrdeck::discovery
