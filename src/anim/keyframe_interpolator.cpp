#include "anim/keyframe_interpolator.hpp"

#include <algorithm>
#include <cmath>
#include <motionline/easing.hpp>
#include <motionline/logger.hpp>

namespace motionline
{

namespace
{

double lerp(double a, double b, double t)
{
    return a + (b - a) * t;
}

// End state layered over the initial state: end values win, properties the
// end state omits keep their initial value.
PropertyMap merged_end_state(const AnimatedElement& element)
{
    PropertyMap result = element.initial_state;
    for (const auto& [name, value] : element.animation->end_state)
    {
        result[name] = value;
    }
    return result;
}

}   // anonymous namespace

// ─── Evaluation ──────────────────────────────────────────────────────────────

PropertyValue KeyframeInterpolator::blend(const PropertyValue& from,
                                          const PropertyValue& to,
                                          double               eased)
{
    if (is_numeric(from) && is_numeric(to))
    {
        return lerp(std::get<double>(from), std::get<double>(to), eased);
    }
    // Text (or mixed) values switch discretely once past the halfway point.
    return eased > 0.5 ? to : from;
}

double KeyframeInterpolator::progress_at(const AnimatedElement& element, double time) const
{
    if (!element.animation || !std::isfinite(time))
        return 0.0;

    const auto& anim = *element.animation;
    if (time < anim.start_time)
        return 0.0;
    if (!(anim.duration > 0.0) || time >= anim.start_time + anim.duration)
        return 1.0;

    double progress = (time - anim.start_time) / anim.duration;
    return apply_easing(anim.easing, progress);
}

PropertyMap KeyframeInterpolator::state_at(const AnimatedElement& element, double time) const
{
    if (!element.animation || !std::isfinite(time))
    {
        return element.initial_state;
    }

    const auto& anim = *element.animation;
    if (time < anim.start_time)
    {
        return element.initial_state;
    }

    // A non-positive duration is a jump cut at start_time.
    if (!(anim.duration > 0.0) || time >= anim.start_time + anim.duration)
    {
        return merged_end_state(element);
    }

    double progress = (time - anim.start_time) / anim.duration;
    double eased    = apply_easing(anim.easing, progress);

    PropertyMap state = element.initial_state;
    for (auto& [name, value] : state)
    {
        auto it = anim.end_state.find(name);
        if (it == anim.end_state.end())
            continue;
        value = blend(value, it->second, eased);
    }
    return state;
}

void KeyframeInterpolator::evaluate(const std::vector<AnimatedElement>& elements,
                                    double                              time,
                                    const ElementStateSink&             sink) const
{
    if (!sink)
        return;
    for (const auto& element : elements)
    {
        sink(element.id, state_at(element, time));
    }
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::vector<double> KeyframeInterpolator::sample(const AnimatedElement& element,
                                                 const std::string&     property,
                                                 double                 start,
                                                 double                 end,
                                                 uint32_t               sample_count) const
{
    std::vector<double> result;
    if (sample_count == 0)
        return result;

    result.reserve(sample_count);
    double step = sample_count > 1 ? (end - start) / static_cast<double>(sample_count - 1) : 0.0;

    for (uint32_t i = 0; i < sample_count; ++i)
    {
        double t     = start + step * static_cast<double>(i);
        auto   state = state_at(element, t);
        auto   it    = state.find(property);
        if (it != state.end() && is_numeric(it->second))
            result.push_back(std::get<double>(it->second));
        else
            result.push_back(0.0);
    }
    return result;
}

std::vector<std::string> KeyframeInterpolator::validate(const AnimatedElement& element)
{
    std::vector<std::string> problems;
    if (!element.animation)
        return problems;

    const auto& anim = *element.animation;
    if (!(anim.duration > 0.0))
    {
        problems.push_back("element '" + element.id + "': duration must be > 0");
    }
    if (!std::isfinite(anim.start_time))
    {
        problems.push_back("element '" + element.id + "': start time is not finite");
    }
    if (!parse_easing(anim.easing))
    {
        problems.push_back("element '" + element.id + "': unknown easing '" + anim.easing + "'");
    }
    for (const auto& [name, value] : anim.end_state)
    {
        auto it = element.initial_state.find(name);
        if (it == element.initial_state.end())
        {
            problems.push_back("element '" + element.id + "': end-state property '" + name
                               + "' has no initial value");
        }
        else if (it->second.index() != value.index())
        {
            problems.push_back("element '" + element.id + "': property '" + name
                               + "' changes type between initial and end state");
        }
    }

    if (!problems.empty())
    {
        MOTIONLINE_LOG_DEBUG("interp", "element '{}' has {} descriptor problem(s)", element.id, problems.size());
    }
    return problems;
}

double KeyframeInterpolator::end_time(const AnimatedElement& element)
{
    if (!element.animation)
        return 0.0;
    return element.animation->start_time + std::max(0.0, element.animation->duration);
}

double KeyframeInterpolator::duration(const std::vector<AnimatedElement>& elements)
{
    double result = 0.0;
    for (const auto& e : elements)
    {
        result = std::max(result, end_time(e));
    }
    return result;
}

}   // namespace motionline
