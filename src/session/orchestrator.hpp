#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "errors.hpp"
#include "remote.hpp"
#include "transfer_router.hpp"

namespace haul {

struct DumpConfig {
    std::string app;
    std::string output{"dump"};
    bool override_existing{false};
    std::string agent_source;
    std::string cmod_source;
    // Process hosting the validation check for app extensions.
    std::string bypass_service{"pkd"};
};

enum class DumpState {
    Idle,
    MainAttached,
    MainPrepared,
    MainDumping,
    ValidationBypassed,
    ChildEnumerated,
    ChildDumping,
    Cleanup,
    Done,
    Aborted
};

const char* dump_state_name(DumpState state);

// How loudly an unexpected detach is reported.
enum class DetachSeverity { Silent, ReasonOnly, WithCrashReport };

DetachSeverity detach_severity(DetachReason reason);

struct ChildOutcome {
    uint32_t pid{0};
    bool dumped{false};
    ErrorKind error{ErrorKind::None};
    std::string message;
};

// Drives a whole dump: the main app, then every app extension it launches,
// each in its own session with its own TransferRouter.
class SessionOrchestrator {
public:
    SessionOrchestrator(Device& device, DumpConfig cfg);
    ~SessionOrchestrator();
    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // Returns the Payload directory that received the artifacts.
    std::filesystem::path run();

    DumpState state() const { return state_; }
    const std::vector<ChildOutcome>& children() const { return children_; }
    const std::filesystem::path& working_dir() const { return cwd_; }

    // Returns the number of lines written.
    static size_t log_detached(const std::string& label, DetachReason reason,
                               const nlohmann::json& crash);

private:
    struct Endpoint {
        std::string label;
        std::unique_ptr<Session> session;
        std::unique_ptr<Script> script;
        std::unique_ptr<TransferRouter> router;
    };

    void transition(DumpState next);
    std::filesystem::path check_destination() const;
    void open_script(Endpoint& ep, std::unique_ptr<Session> session, const std::string& label);
    void attach_router(Endpoint& ep);
    void call_checked(Endpoint& ep, const std::string& name,
                      const nlohmann::json& args = nlohmann::json::array());
    void dump_children();
    void dump_child(uint32_t pid);
    void close(Endpoint& ep);
    void teardown(Endpoint& ep);

    Device& device_;
    DumpConfig cfg_;
    DumpState state_{DumpState::Idle};
    std::filesystem::path root_;
    std::filesystem::path cwd_;
    Endpoint main_;
    Endpoint bypass_;
    std::vector<ChildOutcome> children_;
};

} // namespace haul
