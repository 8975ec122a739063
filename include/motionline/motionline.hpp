#pragma once

#include <motionline/color.hpp>
#include <motionline/easing.hpp>
#include <motionline/element.hpp>
#include <motionline/errors.hpp>
#include <motionline/fwd.hpp>
#include <motionline/logger.hpp>

// ─── Engine components ───────────────────────────────────────────────────────
// The timeline model, interaction controller, playback clock and
// interpolator live under src/ and are included by area:
//
//   #include "timeline/timeline_model.hpp"
//   #include "ui/timeline_interaction.hpp"
//   #include "anim/playback_clock.hpp"
//   #include "anim/keyframe_interpolator.hpp"
