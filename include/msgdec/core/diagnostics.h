#pragma once
#include <msgdec/core/config.h>
#include <msgdec/core/error.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace msgdec::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// One decoder event. call is the 1-based decode call that produced it and
// byte_offset the number of input bytes consumed when it was emitted.
struct DiagnosticEvent {
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t call = 0;
    std::uint64_t byte_offset = 0;
};

// "[error] decoder/read (call 2 @ byte 17): ..."
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Event sink shared by the decoders of one caller. begin_call() opens a
// decode call; every event emitted until the next begin_call() is stamped
// with it. History keeps the newest `capacity` events.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t capacity = config::kDefaultDiagnosticCapacity);

    void begin_call(std::uint64_t call);
    std::uint64_t current_call() const { return call_; }

    void emit(Severity severity, std::string_view module, std::string_view stage,
              std::string message, std::uint64_t byte_offset);

    void set_min_severity(Severity min) { min_severity_ = min; }
    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_for_call(std::uint64_t call) const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(std::string_view stage) const;

    std::size_t size() const { return history_.size(); }
    std::size_t capacity() const { return capacity_; }

private:
    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;

    std::deque<DiagnosticEvent> history_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t capacity_;
    std::uint64_t call_ = 0;
    Severity min_severity_ = Severity::Info;
};

// Report for one failed decode call: the fault, the stage that raised it,
// the call's own events, and caller-supplied key=value context.
struct FailureTrace {
    std::uint64_t call = 0;
    std::string stage;
    DecodeResult fault;
    std::vector<DiagnosticEvent> events;
    std::vector<std::pair<std::string, std::string>> context;

    void add_context(std::string key, std::string value);
    std::string format() const;
};

// The stage is taken from the call's last Error event ("value" when the
// emitter recorded none).
FailureTrace capture_failure(const DiagnosticEmitter& emitter, std::uint64_t call,
                             const DecodeResult& fault);

}  // namespace msgdec::core
