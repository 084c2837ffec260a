#ifndef __PROXNET_CANDIDATES_H__
#define __PROXNET_CANDIDATES_H__

#include <memory>
#include <vector>

#include "config.hpp"
#include "signalstore.hpp"



namespace ProxNet
{



// A single device seen during a Bluetooth scan, signal strength is optional.
class BluetoothObservation
{
    DeviceId    _deviceId;
    bool        _hasRssi;
    int32_t     _rssi;

public:

    explicit BluetoothObservation(const DeviceId &deviceId);
    BluetoothObservation(const DeviceId &deviceId, int32_t rssiDbm);

    const DeviceId& deviceId() const;
    bool hasRssi() const;
    int32_t rssi() const;
};



// Transient request to find users around the requester on exactly one channel.
class DiscoveryRequest
{
    UserId      _requesterId;
    Channel     _channel;
    Distance    _radiusMeters;
    std::vector<BluetoothObservation> _observations;

    DiscoveryRequest(const UserId &requesterId, Channel channel);

public:

    static DiscoveryRequest ForGps(const UserId &requesterId, Distance radiusMeters);
    static DiscoveryRequest ForWifi(const UserId &requesterId);
    static DiscoveryRequest ForBluetooth( const UserId &requesterId,
                                          const std::vector<BluetoothObservation> &observations );

    // Only for decoding untrusted input, the channel is validated when dispatching
    static DiscoveryRequest ForChannel(const UserId &requesterId, Channel channel);

    const UserId& requesterId() const;
    Channel channel() const;
    Distance radiusMeters() const;
    const std::vector<BluetoothObservation>& observations() const;
};



// Candidate found by a channel query with its channel specific proximity estimate.
struct ProximityMatch
{
    UserRecord                  user;
    std::shared_ptr<Distance>   distanceMeters;         // GPS: great-circle distance
    std::shared_ptr<Distance>   estimatedDistanceMeters; // Bluetooth: advisory, only if RSSI was observed
    std::shared_ptr<Timestamp>  signalUpdatedAt;

    explicit ProximityMatch(const UserRecord &user);
};



// Channel specific metadata of a discovery, reported back to the requester.
struct ChannelContext
{
    Channel                         channel;
    std::shared_ptr<GpsLocation>    center;
    Distance                        radiusMeters = 0;
    DeviceId                        networkId;
    size_t                          scannedDeviceCount = 0;

    explicit ChannelContext(Channel channel);
};


struct CandidateSearch
{
    std::vector<ProximityMatch> matches;
    ChannelContext              context;
    std::string                 message;    // Guidance for the user if the search was skipped

    explicit CandidateSearch(Channel channel);
};



// Retrieve candidates satisfying adjacency, discoverability, freshness and active status on a single channel.
class ICandidateQuery
{
public:

    virtual ~ICandidateQuery() {}

    // Check channel parameters without touching the store, throws ERROR_INVALID_VALUE
    virtual void Validate(const DiscoveryRequest &request) const = 0;
    virtual CandidateSearch Find(const DiscoveryRequest &request) const = 0;
};



class GpsCandidateQuery : public ICandidateQuery
{
    std::shared_ptr<Config>         _config;
    std::shared_ptr<ISignalStore>   _store;

public:

    GpsCandidateQuery(std::shared_ptr<Config> config, std::shared_ptr<ISignalStore> store);

    void Validate(const DiscoveryRequest &request) const override;
    CandidateSearch Find(const DiscoveryRequest &request) const override;
};


class WifiCandidateQuery : public ICandidateQuery
{
    std::shared_ptr<Config>         _config;
    std::shared_ptr<ISignalStore>   _store;
    Clock                           _clock;

public:

    WifiCandidateQuery(std::shared_ptr<Config> config, std::shared_ptr<ISignalStore> store, Clock clock);

    void Validate(const DiscoveryRequest &request) const override;
    CandidateSearch Find(const DiscoveryRequest &request) const override;
};


class BluetoothCandidateQuery : public ICandidateQuery
{
    std::shared_ptr<Config>         _config;
    std::shared_ptr<ISignalStore>   _store;
    Clock                           _clock;

public:

    BluetoothCandidateQuery(std::shared_ptr<Config> config, std::shared_ptr<ISignalStore> store, Clock clock);

    void Validate(const DiscoveryRequest &request) const override;
    CandidateSearch Find(const DiscoveryRequest &request) const override;
};



} // namespace ProxNet


#endif // __PROXNET_CANDIDATES_H__
