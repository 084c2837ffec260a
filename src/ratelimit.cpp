#include <sstream>

#include <easylogging++.h>

#include "ratelimit.hpp"

using namespace std;



namespace ProxNet
{



FixedWindowRateLimiter::FixedWindowRateLimiter(size_t maxRequests, chrono::milliseconds window, Clock clock) :
    _maxRequests(maxRequests), _window(window), _clock(clock), _mutex(), _windows(), _nextPurge()
{
    if (! _clock)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No clock instantiated"); }
    if ( _window.count() <= 0 )
        { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Rate limit window must be positive"); }
}


void FixedWindowRateLimiter::PurgeExpired(Timestamp now)
{
    for (auto it = _windows.begin(); it != _windows.end(); )
    {
        if (it->second.resetAt <= now)
             { it = _windows.erase(it); }
        else { ++it; }
    }
    _nextPurge = now + _window;
}


bool FixedWindowRateLimiter::TryAcquire(const UserId &userId, Channel channel)
{
    ostringstream keyStream;
    keyStream << userId << ":" << channel;
    string key = keyStream.str();

    lock_guard<mutex> lock(_mutex);
    Timestamp now = _clock();

    if (_nextPurge <= now)
        { PurgeExpired(now); }

    auto it = _windows.find(key);
    if ( it == _windows.end() || it->second.resetAt <= now )
    {
        Window fresh = { 0, now + _window };
        it = _windows.insert( make_pair(key, fresh) ).first;
        it->second = fresh;
    }

    if (it->second.count >= _maxRequests)
    {
        LOG(DEBUG) << "Rate limit exceeded for " << key;
        return false;
    }

    ++it->second.count;
    return true;
}


size_t FixedWindowRateLimiter::trackedKeyCount()
{
    lock_guard<mutex> lock(_mutex);
    return _windows.size();
}



} // namespace ProxNet
