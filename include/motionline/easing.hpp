#pragma once

#include <optional>
#include <string_view>

namespace motionline
{

// Normalized progress remapping curves. Every function maps [0, 1] onto a
// curve with f(0) == 0 and f(1) == 1 exactly; inputs outside [0, 1] are
// clamped first.
namespace ease
{
double linear(double t);
double ease_in(double t);       // t^2
double ease_out(double t);      // 1 - (1 - t)^2
double ease_in_out(double t);   // 2t^2 below 0.5, 1 - 2(1 - t)^2 above
double bounce(double t);        // four-band bounce ease-out
}   // namespace ease

using EasingFn = double (*)(double);

enum class Easing
{
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    Bounce,
};

// Canonical snake_case name ("ease_in_out").
const char* easing_name(Easing easing);

// Accepts the canonical names and the camelCase spellings ("easeInOut").
std::optional<Easing> parse_easing(std::string_view name);

EasingFn easing_fn(Easing easing);

// Apply a named easing. Unknown names degrade to linear; the fallback is
// reported once per distinct name on the "easing" log category.
double apply_easing(std::string_view name, double t);
double apply_easing(Easing easing, double t);

}   // namespace motionline
