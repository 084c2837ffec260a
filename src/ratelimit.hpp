#ifndef __PROXNET_RATE_LIMIT_H__
#define __PROXNET_RATE_LIMIT_H__

#include <chrono>
#include <mutex>
#include <unordered_map>

#include "basic.hpp"



namespace ProxNet
{



// Admission check consulted before every discovery request.
class IRateLimiter
{
public:

    virtual ~IRateLimiter() {}

    // Return false if the user exhausted its quota on the channel in the current window
    virtual bool TryAcquire(const UserId &userId, Channel channel) = 0;
};



// Count requests per user and channel in fixed windows started by the first request of the key.
class FixedWindowRateLimiter : public IRateLimiter
{
    struct Window
    {
        size_t      count;
        Timestamp   resetAt;
    };

    size_t                      _maxRequests;
    std::chrono::milliseconds   _window;
    Clock                       _clock;

    std::mutex                  _mutex;
    std::unordered_map<std::string, Window> _windows;
    Timestamp                   _nextPurge;

    void PurgeExpired(Timestamp now);

public:

    FixedWindowRateLimiter(size_t maxRequests, std::chrono::milliseconds window, Clock clock);

    bool TryAcquire(const UserId &userId, Channel channel) override;

    size_t trackedKeyCount();
};



} // namespace ProxNet


#endif // __PROXNET_RATE_LIMIT_H__
