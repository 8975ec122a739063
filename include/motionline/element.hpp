#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace motionline
{

// A property value: numeric properties interpolate, text properties switch
// discretely at the halfway point of the eased progress.
using PropertyValue = std::variant<double, std::string>;

// Property name ("x", "y", "width", "height", "opacity", "rotation",
// "scale", ...) to value. Ordered so evaluation output is deterministic.
using PropertyMap = std::map<std::string, PropertyValue>;

// (startTime, duration, easing, endState) for one element.
struct AnimationDescriptor
{
    double      start_time = 0.0;
    double      duration   = 1.0;
    std::string easing     = "linear";
    PropertyMap end_state;
};

// Input contract of the interpolator, produced by the description
// converter. Every key of animation->end_state must also be present in
// initial_state; keys absent from end_state stay constant.
struct AnimatedElement
{
    std::string                        id;
    PropertyMap                        initial_state;
    std::optional<AnimationDescriptor> animation;
};

inline bool is_numeric(const PropertyValue& v)
{
    return std::holds_alternative<double>(v);
}

}   // namespace motionline
