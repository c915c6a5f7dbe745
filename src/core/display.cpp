#include <fnr/core/display.hpp>

namespace fnr {

const char* decision_name(Decision d) {
    switch (d) {
        case Decision::Yes:  return "yes";
        case Decision::No:   return "no";
        case Decision::All:  return "all";
        case Decision::Quit: return "quit";
    }
    return "unknown";
}

Decision ScriptedDecisionSource::decide(const Match& m, const std::filesystem::path& dest) {
    (void)m;
    (void)dest;
    size_t i = asked_++;
    return i < script_.size() ? script_[i] : fallback_;
}

} // namespace fnr
