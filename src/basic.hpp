#ifndef __PROXNET_BASIC_TYPES_H__
#define __PROXNET_BASIC_TYPES_H__

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>



namespace ProxNet
{


// Type definition of essential types used on multiple interfaces
typedef double      GpsCoordinate;
typedef double      Distance;

typedef std::string UserId;
typedef std::string DeviceId;
typedef std::string Address;
typedef uint16_t    TcpPort;

typedef std::string SessionId;

typedef std::chrono::system_clock::time_point Timestamp;
typedef std::function<Timestamp()> Clock;

Clock SystemClock();

int64_t ToUnixMillis(Timestamp timestamp);
Timestamp FromUnixMillis(int64_t millis);



enum class ErrorCode : uint16_t
{
    // Problems with incoming message
    ERROR_UNSUPPORTED = 1,          // Unknown request version or protocol
    ERROR_PROTOCOL_VIOLATION = 2,   // Requests are not sent or responses not received as expected
    ERROR_BAD_REQUEST = 3,          // Request is in invalid format or cannot be properly interpreted
    ERROR_INVALID_VALUE = 4,        // Invalid data provided as an argument of an operation

    // Problems with the caller
    ERROR_UNAUTHORIZED = 10,        // Missing or unverifiable caller identity
    ERROR_NOT_FOUND = 11,           // Referenced user record does not exist
    ERROR_PERMISSION_DENIED = 12,   // Capability refused on the caller side, e.g. positioning permission
    ERROR_RATE_LIMITED = 13,        // Too many discovery requests in the current window, retry later

    // Problems with consumed services
    ERROR_UPSTREAM = 96,            // Signal store or relationship oracle unreachable or timed out

    // Problems inside the server
    ERROR_INTERNAL = 128,           // Implementation problem: this shouldn't happen, we are not well prepared for this error.
};

// Retrying the same request later may succeed for these codes
bool IsRetryable(ErrorCode code);


class ProximityError : public std::runtime_error
{
    ErrorCode _code;

public:

    ProximityError(ErrorCode code, const std::string &reason);
    ProximityError(ErrorCode code, const char *reason);

    ErrorCode code() const;
};



// Data holder class for a network endpoint to connect to.
class NetworkEndpoint
{
    Address     _address;
    TcpPort     _port;

public:

    NetworkEndpoint(const NetworkEndpoint &other);
    NetworkEndpoint(const Address &address, TcpPort port);

    Address address() const;
    TcpPort port() const;

    // NOTE Following functions are implemented in network.cpp as being library-specific (currently with asio)
    bool isLoopback() const;
};

std::ostream& operator<<(std::ostream& out, const NetworkEndpoint &value);



// Data holder class for a GPS position (2D Latitude/longitude pair without height data).
class GpsLocation
{
    GpsCoordinate _latitude;
    GpsCoordinate _longitude;

    void Validate();

public:

    GpsLocation(const GpsLocation &other);
    GpsLocation(GpsCoordinate latitude, GpsCoordinate longitude);

    GpsCoordinate latitude() const;
    GpsCoordinate longitude() const;

    bool operator==(const GpsLocation &other) const;
    bool operator!=(const GpsLocation &other) const;
};

std::ostream& operator<<(std::ostream& out, const GpsLocation &value);



// Positioning channels, a single discovery request always uses exactly one of them.
enum class Channel : uint8_t
{
    Gps         = 1,
    Wifi        = 2,
    Bluetooth   = 3,
};

std::ostream& operator<<(std::ostream& out, Channel value);


// Utility class to enable enum classes to be used as a hash key until fixed in C++ standard
struct EnumHasher
{
    template <typename EnumType>
    std::size_t operator()(EnumType e) const
        { return static_cast<std::size_t>(e); }
};



// Hardware addresses (WiFi access point BSSIDs and Bluetooth device ids) are stored
// in the canonical XX:XX:XX:XX:XX:XX uppercase form, hyphens are accepted on input.
bool IsValidMacAddress(const std::string &address);
DeviceId NormalizeMacAddress(const std::string &address);



// RAII-style scope guard with a custom functor to avoid creating a new class for every resource release action.
// based on http://stackoverflow.com/questions/36644263/is-there-a-c-standard-class-to-set-a-variable-to-a-value-at-scope-exit
struct scope_exit
{
    std::function<void()> _fun;

    // Store function and execute it on destruction, ie. when end of scope is reached
    explicit scope_exit(std::function<void()> fun) :
        _fun( std::move(fun) ) {}
    ~scope_exit() { if (_fun) { _fun(); } }

    // Disable copies
    scope_exit(scope_exit const&) = delete;
    scope_exit& operator=(const scope_exit&) = delete;
    scope_exit& operator=(scope_exit&& rhs) = delete;
};


struct scope_error : public scope_exit
{
    explicit scope_error(std::function<void()> fun) :
        scope_exit( [fun] { if( std::uncaught_exception() ) { fun(); } } ) {}
};

struct scope_success : public scope_exit
{
    explicit scope_success(std::function<void()> fun) :
        scope_exit( [fun] { if( ! std::uncaught_exception() ) { fun(); } } ) {}
};



} // namespace ProxNet


#endif // __PROXNET_BASIC_TYPES_H__
