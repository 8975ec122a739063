#include <algorithm>
#include <cmath>
#include <motionline/easing.hpp>
#include <motionline/logger.hpp>
#include <mutex>
#include <set>
#include <string>

namespace motionline
{

namespace ease
{

namespace
{

// Clamp into [0, 1]; NaN maps to 0 so a bad time never produces NaN output.
double clamp_unit(double t)
{
    if (!(t > 0.0))
        return 0.0;
    if (t > 1.0)
        return 1.0;
    return t;
}

}   // anonymous namespace

double linear(double t)
{
    return clamp_unit(t);
}

double ease_in(double t)
{
    t = clamp_unit(t);
    return t * t;
}

double ease_out(double t)
{
    t        = clamp_unit(t);
    double u = 1.0 - t;
    return 1.0 - u * u;
}

double ease_in_out(double t)
{
    t = clamp_unit(t);
    if (t < 0.5)
    {
        return 2.0 * t * t;
    }
    double u = 1.0 - t;
    return 1.0 - 2.0 * u * u;
}

double bounce(double t)
{
    // Bounce ease-out: four parabolic bands of equal curvature, each lifted
    // by the offset the previous bands already covered.
    constexpr double n1 = 7.5625;
    constexpr double d1 = 2.75;

    t = clamp_unit(t);
    if (t >= 1.0)
        return 1.0;

    if (t < 1.0 / d1)
    {
        return n1 * t * t;
    }
    else if (t < 2.0 / d1)
    {
        t -= 1.5 / d1;
        return n1 * t * t + 0.75;
    }
    else if (t < 2.5 / d1)
    {
        t -= 2.25 / d1;
        return n1 * t * t + 0.9375;
    }
    else
    {
        t -= 2.625 / d1;
        return n1 * t * t + 0.984375;
    }
}

}   // namespace ease

const char* easing_name(Easing easing)
{
    switch (easing)
    {
        case Easing::Linear:
            return "linear";
        case Easing::EaseIn:
            return "ease_in";
        case Easing::EaseOut:
            return "ease_out";
        case Easing::EaseInOut:
            return "ease_in_out";
        case Easing::Bounce:
            return "bounce";
    }
    return "linear";
}

std::optional<Easing> parse_easing(std::string_view name)
{
    if (name == "linear")
        return Easing::Linear;
    if (name == "ease_in" || name == "easeIn")
        return Easing::EaseIn;
    if (name == "ease_out" || name == "easeOut")
        return Easing::EaseOut;
    if (name == "ease_in_out" || name == "easeInOut")
        return Easing::EaseInOut;
    if (name == "bounce")
        return Easing::Bounce;
    return std::nullopt;
}

EasingFn easing_fn(Easing easing)
{
    switch (easing)
    {
        case Easing::Linear:
            return ease::linear;
        case Easing::EaseIn:
            return ease::ease_in;
        case Easing::EaseOut:
            return ease::ease_out;
        case Easing::EaseInOut:
            return ease::ease_in_out;
        case Easing::Bounce:
            return ease::bounce;
    }
    return ease::linear;
}

double apply_easing(Easing easing, double t)
{
    return easing_fn(easing)(t);
}

double apply_easing(std::string_view name, double t)
{
    if (auto easing = parse_easing(name))
    {
        return apply_easing(*easing, t);
    }

    // Warn once per distinct name; this runs on the render path.
    static std::mutex            warned_mutex;
    static std::set<std::string> warned;
    bool                         first = false;
    {
        std::lock_guard lock(warned_mutex);
        first = warned.emplace(name).second;
    }
    if (first)
    {
        MOTIONLINE_LOG_DEBUG("easing", "unknown easing '{}', falling back to linear", std::string(name));
    }
    return ease::linear(t);
}

}   // namespace motionline
