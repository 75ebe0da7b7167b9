#include "core/generators.hpp"
#include "core/guarded_call.hpp"

GuardedCall::GuardedCall(std::string service_name,
                         std::shared_ptr<RateLimiter> limiter,
                         std::shared_ptr<RetryPolicy> retry)
    : service_name_(std::move(service_name)), limiter_(std::move(limiter)), retry_(std::move(retry))
{
    if (!retry_)
    {
        retry_ = std::make_shared<RetryPolicy>();
    }
}

void GeneratorSuite::validate() const
{
    if (!text || !image || !video || !frame_grabber)
    {
        throw ConfigError("Generator suite is incomplete: text, image, video and frame grabber are all required");
    }
    if (!text_guard || !image_guard || !video_guard || !frame_guard)
    {
        throw ConfigError("Generator suite is missing a call guard");
    }
}
