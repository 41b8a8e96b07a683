#pragma once
#include <string>
#include <atomic>

namespace rtmp2rtsp::worker {

enum class State {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING,
    EXITED
};

class WorkerFSM {
public:
    WorkerFSM();

    void TransitionTo(State next_state);
    // Moves to next_state only if the current state is expected.
    bool TransitionFrom(State expected, State next_state);
    State GetCurrentState() const;
    static std::string StateToString(State state);

private:
    std::atomic<State> current_state_;
};

} // namespace rtmp2rtsp::worker
