#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include "basic.hpp"

using namespace std;



namespace ProxNet
{



Clock SystemClock()
    { return [] { return chrono::system_clock::now(); }; }

int64_t ToUnixMillis(Timestamp timestamp)
{
    return chrono::duration_cast<chrono::milliseconds>(
        timestamp.time_since_epoch() ).count();
}

Timestamp FromUnixMillis(int64_t millis)
    { return Timestamp( chrono::duration_cast<Timestamp::duration>( chrono::milliseconds(millis) ) ); }



bool IsRetryable(ErrorCode code)
{
    return code == ErrorCode::ERROR_UPSTREAM ||
           code == ErrorCode::ERROR_RATE_LIMITED;
}


ProximityError::ProximityError(ErrorCode code, const char* reason) :
    runtime_error(reason), _code(code) {}

ProximityError::ProximityError(ErrorCode code, const string& reason) :
    runtime_error(reason), _code(code) {}

ErrorCode ProximityError::code() const
    { return _code; }




NetworkEndpoint::NetworkEndpoint(const NetworkEndpoint& other) :
    _address(other._address), _port(other._port) {}

NetworkEndpoint::NetworkEndpoint(const Address& address, TcpPort port) :
    _address(address), _port(port) {}

Address NetworkEndpoint::address() const { return _address; }
TcpPort NetworkEndpoint::port() const { return _port; }


ostream& operator<<(ostream &out, const NetworkEndpoint &value)
    { return out << value.address() << ":" << value.port(); }




GpsLocation::GpsLocation(const GpsLocation &other) :
    _latitude( other.latitude() ), _longitude( other.longitude() ) {}

GpsLocation::GpsLocation(GpsCoordinate latitude, GpsCoordinate longitude) :
    _latitude(latitude), _longitude(longitude)
    { Validate(); }

GpsCoordinate GpsLocation::latitude()  const { return _latitude; }
GpsCoordinate GpsLocation::longitude() const { return _longitude; }

void GpsLocation::Validate()
{
    // Both ranges are inclusive, NaN fails every comparison so it is rejected too
    if ( ! ( -90. <= _latitude  && _latitude  <= 90. ) ||
         ! ( -180. <= _longitude && _longitude <= 180. ) )
        { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Invalid GPS location"); }
}

bool GpsLocation::operator==(const GpsLocation& other) const
{
    return abs(_latitude  - other._latitude)  < 0.00001 &&
           abs(_longitude - other._longitude) < 0.00001;
}

bool GpsLocation::operator!=(const GpsLocation& other) const
    { return ! operator==(other); }


std::ostream& operator<<(std::ostream& out, const GpsLocation &value)
{
    return out << value.latitude() << "," << value.longitude();
}



std::ostream& operator<<(std::ostream& out, Channel value)
{
    switch(value)
    {
        case Channel::Gps:          return out << "GPS";
        case Channel::Wifi:         return out << "WiFi";
        case Channel::Bluetooth:    return out << "Bluetooth";
        default:                    return out << "Unknown(" << static_cast<uint32_t>(value) << ")";
    }
}



static const size_t MAC_ADDRESS_OCTETS = 6;
static const size_t MAC_ADDRESS_LENGTH = 3 * MAC_ADDRESS_OCTETS - 1;

bool IsValidMacAddress(const string &address)
{
    if ( address.size() != MAC_ADDRESS_LENGTH )
        { return false; }

    // Separators may be colons or dashes but not mixed
    char separator = address[2];
    if ( separator != ':' && separator != '-' )
        { return false; }

    for (size_t idx = 0; idx < address.size(); ++idx)
    {
        char c = address[idx];
        if ( idx % 3 == 2 )
        {
            if (c != separator)
                { return false; }
        }
        else if ( ! isxdigit( static_cast<unsigned char>(c) ) )
            { return false; }
    }
    return true;
}


DeviceId NormalizeMacAddress(const string &address)
{
    if ( ! IsValidMacAddress(address) )
        { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Invalid hardware address format: " + address); }

    DeviceId result(address);
    for (char &c : result)
    {
        if (c == '-')
            { c = ':'; }
        else { c = static_cast<char>( toupper( static_cast<unsigned char>(c) ) ); }
    }
    return result;
}



} // namespace ProxNet
