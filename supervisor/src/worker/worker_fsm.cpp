#include "worker/worker_fsm.hpp"

namespace rtmp2rtsp::worker {

WorkerFSM::WorkerFSM() : current_state_(State::STOPPED) {}

void WorkerFSM::TransitionTo(State next_state) {
    current_state_.store(next_state);
}

bool WorkerFSM::TransitionFrom(State expected, State next_state) {
    return current_state_.compare_exchange_strong(expected, next_state);
}

State WorkerFSM::GetCurrentState() const {
    return current_state_.load();
}

std::string WorkerFSM::StateToString(State state) {
    switch (state) {
        case State::STOPPED: return "STOPPED";
        case State::STARTING: return "STARTING";
        case State::RUNNING: return "RUNNING";
        case State::STOPPING: return "STOPPING";
        case State::EXITED: return "EXITED";
        default: return "UNKNOWN";
    }
}

} // namespace rtmp2rtsp::worker
