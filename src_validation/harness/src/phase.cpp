#include "valsim_harness/phase.hpp"

#include <stdexcept>
#include <string>

namespace valsim::harness {

const std::array<Phase, 3>& tracked_phases() noexcept {
    static const std::array<Phase, 3> phases{Phase::Prepare, Phase::Run, Phase::Check};
    return phases;
}

std::string_view to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::Prepare: return "prepare";
        case Phase::Run:     return "run";
        case Phase::Check:   return "test";
        case Phase::Report:  return "report";
        case Phase::Cleanup: return "cleanup";
    }
    return "unknown";
}

std::string_view to_string(PhaseStatus status) noexcept {
    switch (status) {
        case PhaseStatus::NotRun:      return "Not run";
        case PhaseStatus::Ok:          return "OK";
        case PhaseStatus::Failed:      return "FAILED";
        case PhaseStatus::Error:       return "Error";
        case PhaseStatus::Interrupted: return "Interrupted";
    }
    return "UNKNOWN";
}

std::string_view status_key(PhaseStatus status) noexcept {
    switch (status) {
        case PhaseStatus::NotRun:      return "not_run";
        case PhaseStatus::Ok:          return "ok";
        case PhaseStatus::Failed:      return "failed";
        case PhaseStatus::Error:       return "error";
        case PhaseStatus::Interrupted: return "interrupted";
    }
    return "not_run";
}

std::optional<PhaseStatus> parse_status_key(std::string_view key) noexcept {
    if (key == "not_run") return PhaseStatus::NotRun;
    if (key == "ok") return PhaseStatus::Ok;
    if (key == "failed") return PhaseStatus::Failed;
    if (key == "error") return PhaseStatus::Error;
    if (key == "interrupted") return PhaseStatus::Interrupted;
    return std::nullopt;
}

std::string_view phase_key(Phase phase) noexcept {
    switch (phase) {
        case Phase::Prepare: return "prepare";
        case Phase::Run:     return "run";
        case Phase::Check:   return "check";
        case Phase::Report:  return "report";
        case Phase::Cleanup: return "cleanup";
    }
    return "unknown";
}

PhaseSelection PhaseSelection::defaults() {
    PhaseSelection selection;
    selection.add(Phase::Prepare).add(Phase::Run).add(Phase::Check).add(Phase::Report);
    return selection;
}

PhaseSelection PhaseSelection::parse(std::string_view letters) {
    if (letters.empty()) {
        throw std::runtime_error("Empty phase selection");
    }
    PhaseSelection selection;
    for (char letter : letters) {
        switch (letter) {
            case 'p': selection.add(Phase::Prepare); break;
            case 'r': selection.add(Phase::Run); break;
            case 't': selection.add(Phase::Check); break;
            case 's': selection.add(Phase::Report); break;
            case 'c': selection.add(Phase::Cleanup); break;
            default:
                throw std::runtime_error("Unknown phase letter '" + std::string(1, letter) +
                                         "' in '" + std::string{letters} +
                                         "' (valid: p, r, t, s, c)");
        }
    }
    return selection;
}

PhaseSelection& PhaseSelection::add(Phase phase) {
    phases_.insert(phase);
    return *this;
}

}  // namespace valsim::harness
