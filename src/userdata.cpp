#include "userdata.hpp"

using namespace std;



namespace ProxNet
{



PrivacySettings::PrivacySettings() :
    _showAge(true), _showLocation(true), _showLastSeen(true) {}

PrivacySettings::PrivacySettings(bool showAge, bool showLocation, bool showLastSeen) :
    _showAge(showAge), _showLocation(showLocation), _showLastSeen(showLastSeen) {}

bool PrivacySettings::showAge()      const { return _showAge; }
bool PrivacySettings::showLocation() const { return _showLocation; }
bool PrivacySettings::showLastSeen() const { return _showLastSeen; }

bool PrivacySettings::operator==(const PrivacySettings& other) const
{
    return _showAge      == other._showAge &&
           _showLocation == other._showLocation &&
           _showLastSeen == other._showLastSeen;
}



const uint32_t DiscoverabilityProfile::DEFAULT_RANGE_METERS = 5000;

DiscoverabilityProfile::DiscoverabilityProfile() :
    _discoverable(true), _active(true), _rangeMeters(DEFAULT_RANGE_METERS), _privacy() {}

DiscoverabilityProfile::DiscoverabilityProfile( bool discoverable, bool active,
        uint32_t rangeMeters, const PrivacySettings &privacy ) :
    _discoverable(discoverable), _active(active), _rangeMeters(rangeMeters), _privacy(privacy) {}

bool DiscoverabilityProfile::isDiscoverable() const { return _discoverable; }
bool DiscoverabilityProfile::isActive() const { return _active; }
uint32_t DiscoverabilityProfile::rangeMeters() const { return _rangeMeters; }
const PrivacySettings& DiscoverabilityProfile::privacy() const { return _privacy; }

void DiscoverabilityProfile::discoverable(bool value) { _discoverable = value; }
void DiscoverabilityProfile::rangeMeters(uint32_t value) { _rangeMeters = value; }



GpsSignal::GpsSignal(const GpsLocation& location, Timestamp updatedAt) :
    _location(location), _updatedAt(updatedAt) {}

const GpsLocation& GpsSignal::location() const { return _location; }
Timestamp GpsSignal::updatedAt() const { return _updatedAt; }


RadioSignal::RadioSignal(const DeviceId& id, Timestamp updatedAt) :
    _id(id), _updatedAt(updatedAt) {}

const DeviceId& RadioSignal::id() const { return _id; }
Timestamp RadioSignal::updatedAt() const { return _updatedAt; }



UserRecord::UserRecord( const UserId& id, const UserDisplayInfo& display,
                        const DiscoverabilityProfile& discovery ) :
    _id(id), _display(display), _discovery(discovery)
{
    if ( _id.empty() )
        { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Missing user id"); }
}

const UserId& UserRecord::id() const { return _id; }
const UserDisplayInfo& UserRecord::display() const { return _display; }
const DiscoverabilityProfile& UserRecord::discovery() const { return _discovery; }
DiscoverabilityProfile& UserRecord::discovery() { return _discovery; }

shared_ptr<GpsSignal> UserRecord::gpsSignal() const { return _gps; }
shared_ptr<WifiSignal> UserRecord::wifiSignal() const { return _wifi; }
shared_ptr<BluetoothSignal> UserRecord::bluetoothSignal() const { return _bluetooth; }

void UserRecord::gpsSignal(shared_ptr<GpsSignal> signal) { _gps = signal; }
void UserRecord::wifiSignal(shared_ptr<WifiSignal> signal) { _wifi = signal; }
void UserRecord::bluetoothSignal(shared_ptr<BluetoothSignal> signal) { _bluetooth = signal; }
void UserRecord::lastSeen(Timestamp value) { _display.lastSeen = value; }


shared_ptr<Timestamp> UserRecord::signalUpdatedAt(Channel channel) const
{
    switch (channel)
    {
        case Channel::Gps:
            return _gps ? make_shared<Timestamp>( _gps->updatedAt() ) : shared_ptr<Timestamp>();
        case Channel::Wifi:
            return _wifi ? make_shared<Timestamp>( _wifi->updatedAt() ) : shared_ptr<Timestamp>();
        case Channel::Bluetooth:
            return _bluetooth ? make_shared<Timestamp>( _bluetooth->updatedAt() ) : shared_ptr<Timestamp>();
        default: throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Unknown positioning channel");
    }
}


ostream& operator<<(ostream& out, const UserRecord& value)
{
    return out << "User " << value.id() << " (" << value.display().username << ")"
               << ( value.discovery().isDiscoverable() ? ", discoverable" : ", hidden" )
               << ( value.discovery().isActive() ? "" : ", inactive" );
}



} // namespace ProxNet
