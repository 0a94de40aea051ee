#pragma once

#include <cstddef>
#include <string>

#include "types.hpp"

namespace road_tracer
{

// Replay cursor over an already materialised trace. Pacing (timers, pause) belongs
// to whoever drives it.
class TracePlayer
{
public:
    TracePlayer() = default;
    explicit TracePlayer(StepTrace trace);

    bool has_next() const { return position_ < trace_.size(); }
    const SearchStep &next();
    const SearchStep &peek() const;
    void reset() { position_ = 0; }

    std::size_t position() const { return position_; }
    std::size_t size() const { return trace_.size(); }
    const SearchStep &at(std::size_t index) const;
    const StepTrace &trace() const { return trace_; }

private:
    StepTrace trace_;
    std::size_t position_{0};
};

std::string describe_step(const SearchStep &step);

// One-line summary of a search outcome, with per-segment distances for a found path.
std::string describe_result(const SearchResult &result);

} // namespace road_tracer
