#pragma once

#include <cstdint>
#include <functional>
#include <motionline/element.hpp>
#include <string>
#include <vector>

namespace motionline
{

// Receives the evaluated state of one element for the current frame.
using ElementStateSink = std::function<void(const std::string& element_id, const PropertyMap& state)>;

// KeyframeInterpolator — turns (initial state, animation descriptor, time)
// into the property values to render.
//
// Evaluation is a pure function of its arguments: no caches, no counters,
// so repeated calls with the same (element, time) return identical maps and
// may run concurrently from any thread. Cost is linear in the number of
// properties of the element.
class KeyframeInterpolator
{
   public:
    KeyframeInterpolator() = default;

    // ─── Evaluation ──────────────────────────────────────────────────────

    // State of one element at the given time. Never throws: times before the
    // animation (or non-finite times) yield the initial state, times at or
    // past the end yield the end state merged over the initial state.
    PropertyMap state_at(const AnimatedElement& element, double time) const;

    // Evaluate every element at time and hand each result to sink, in order.
    void evaluate(const std::vector<AnimatedElement>& elements,
                  double                              time,
                  const ElementStateSink&             sink) const;

    // Eased progress in [0, 1] of the element's animation at time
    // (0 before the start, 1 at and past the end, 0 without an animation).
    double progress_at(const AnimatedElement& element, double time) const;

    // ─── Queries ─────────────────────────────────────────────────────────

    // Sample one numeric property at sample_count evenly spaced times in
    // [start, end] for curve display. Missing or text properties sample as 0.
    std::vector<double> sample(const AnimatedElement& element,
                               const std::string&     property,
                               double                 start,
                               double                 end,
                               uint32_t               sample_count) const;

    // Contract violations of an element descriptor, one message each.
    // Empty when the element is well formed.
    static std::vector<std::string> validate(const AnimatedElement& element);

    // Time at which the element reaches its end state (start + duration),
    // or 0 for an element without animation.
    static double end_time(const AnimatedElement& element);

    // Latest end_time over a set of elements.
    static double duration(const std::vector<AnimatedElement>& elements);

   private:
    static PropertyValue blend(const PropertyValue& from, const PropertyValue& to, double eased);
};

}   // namespace motionline
