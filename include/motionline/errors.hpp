#pragma once

#include <stdexcept>
#include <string>

#include <motionline/fwd.hpp>

namespace motionline
{

// Base class for failures surfaced by timeline mutations.
class TimelineError : public std::runtime_error
{
   public:
    explicit TimelineError(const std::string& what) : std::runtime_error(what) {}
};

// Time bounds violate 0 <= start < end <= duration, or a duration is <= 0.
class InvalidRangeError : public TimelineError
{
   public:
    explicit InvalidRangeError(const std::string& what) : TimelineError(what) {}
};

// An operation referenced a segment id the model does not hold.
class NotFoundError : public TimelineError
{
   public:
    explicit NotFoundError(SegmentId id)
        : TimelineError("segment " + std::to_string(id) + " not found"), id_(id)
    {
    }

    SegmentId id() const { return id_; }

   private:
    SegmentId id_;
};

}   // namespace motionline
