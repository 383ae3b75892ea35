#include <msgdec/core/diagnostics.h>

#include <sstream>
#include <utility>

namespace msgdec::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "] " << event.module << "/" << event.stage
        << " (call " << event.call << " @ byte " << event.byte_offset << "): " << event.message;
    return oss.str();
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void DiagnosticEmitter::begin_call(std::uint64_t call) {
    call_ = call;
}

void DiagnosticEmitter::emit(Severity severity, std::string_view module, std::string_view stage,
                             std::string message, std::uint64_t byte_offset) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent& event = history_.emplace_back();
    event.severity = severity;
    event.module = std::string(module);
    event.stage = std::string(stage);
    event.message = std::move(message);
    event.call = call_;
    event.byte_offset = byte_offset;

    for (const auto& observer : observers_) {
        observer(event);
    }
    if (history_.size() > capacity_) {
        history_.pop_front();
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::vector<DiagnosticEvent> out;
    for (const auto& e : history_) {
        if (pred(e)) {
            out.push_back(e);
        }
    }
    return out;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    return {history_.begin(), history_.end()};
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_call(std::uint64_t call) const {
    return select([call](const DiagnosticEvent& e) { return e.call == call; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(std::string_view stage) const {
    return select([stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

void FailureTrace::add_context(std::string key, std::string value) {
    context.emplace_back(std::move(key), std::move(value));
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "decode call " << call << " failed at stage " << stage << "\n";
    oss << "  " << format_result(fault) << "\n";
    for (const auto& [key, value] : context) {
        oss << "  " << key << ": " << value << "\n";
    }
    for (const auto& e : events) {
        oss << "  | " << format_diagnostic(e) << "\n";
    }
    return oss.str();
}

FailureTrace capture_failure(const DiagnosticEmitter& emitter, std::uint64_t call,
                             const DecodeResult& fault) {
    FailureTrace trace;
    trace.call = call;
    trace.fault = fault;
    trace.events = emitter.events_for_call(call);
    trace.stage = "value";
    for (const auto& e : trace.events) {
        if (e.severity == Severity::Error) {
            trace.stage = e.stage;
        }
    }
    return trace;
}

}  // namespace msgdec::core
