#ifndef __PROXNET_USER_DATA_H__
#define __PROXNET_USER_DATA_H__

#include <memory>
#include <vector>

#include "basic.hpp"



namespace ProxNet
{



// Per-user switches controlling which profile fields other users may see.
class PrivacySettings
{
    bool _showAge;
    bool _showLocation;
    bool _showLastSeen;

public:

    PrivacySettings();
    PrivacySettings(bool showAge, bool showLocation, bool showLastSeen);

    bool showAge() const;
    bool showLocation() const;
    bool showLastSeen() const;

    bool operator==(const PrivacySettings &other) const;
};



class DiscoverabilityProfile
{
    bool            _discoverable;
    bool            _active;
    uint32_t        _rangeMeters;
    PrivacySettings _privacy;

public:

    static const uint32_t DEFAULT_RANGE_METERS;

    DiscoverabilityProfile();
    DiscoverabilityProfile( bool discoverable, bool active, uint32_t rangeMeters,
                            const PrivacySettings &privacy = PrivacySettings() );

    bool isDiscoverable() const;
    bool isActive() const;
    uint32_t rangeMeters() const;
    const PrivacySettings& privacy() const;

    void discoverable(bool value);
    void rangeMeters(uint32_t value);
};



// Latest satellite position reported by a user, overwritten on every update.
class GpsSignal
{
    GpsLocation _location;
    Timestamp   _updatedAt;

public:

    GpsSignal(const GpsLocation &location, Timestamp updatedAt);

    const GpsLocation& location() const;
    Timestamp updatedAt() const;
};


// Latest hardware address seen on a short range channel, the BSSID of the
// connected access point for WiFi or the own device address for Bluetooth.
class RadioSignal
{
    DeviceId    _id;
    Timestamp   _updatedAt;

public:

    RadioSignal(const DeviceId &id, Timestamp updatedAt);

    const DeviceId& id() const;
    Timestamp updatedAt() const;
};

typedef RadioSignal WifiSignal;
typedef RadioSignal BluetoothSignal;



// Profile fields exposed to other users, owned by the external profile store.
struct UserDisplayInfo
{
    std::string username;
    std::string firstName;
    std::string lastName;
    std::string profilePicture;
    std::string bio;
    std::vector<std::string> interests;
    uint16_t    age = 0;            // 0 if not provided
    bool        isOnline = false;
    Timestamp   lastSeen;
};



// Data holder class for everything the engine knows about a single user.
class UserRecord
{
    UserId                  _id;
    UserDisplayInfo         _display;
    DiscoverabilityProfile  _discovery;

    std::shared_ptr<GpsSignal>       _gps;
    std::shared_ptr<WifiSignal>      _wifi;
    std::shared_ptr<BluetoothSignal> _bluetooth;

public:

    UserRecord( const UserId &id, const UserDisplayInfo &display,
                const DiscoverabilityProfile &discovery = DiscoverabilityProfile() );

    const UserId& id() const;
    const UserDisplayInfo& display() const;
    const DiscoverabilityProfile& discovery() const;
    DiscoverabilityProfile& discovery();

    std::shared_ptr<GpsSignal> gpsSignal() const;
    std::shared_ptr<WifiSignal> wifiSignal() const;
    std::shared_ptr<BluetoothSignal> bluetoothSignal() const;

    void gpsSignal(std::shared_ptr<GpsSignal> signal);
    void wifiSignal(std::shared_ptr<WifiSignal> signal);
    void bluetoothSignal(std::shared_ptr<BluetoothSignal> signal);
    void lastSeen(Timestamp value);

    // Channel specific update time, null if no signal was reported on the channel
    std::shared_ptr<Timestamp> signalUpdatedAt(Channel channel) const;
};

std::ostream& operator<<(std::ostream& out, const UserRecord &value);



} // namespace ProxNet


#endif // __PROXNET_USER_DATA_H__
