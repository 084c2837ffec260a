#ifndef __PROXNET_DISCOVERY_H__
#define __PROXNET_DISCOVERY_H__

#include <memory>
#include <unordered_map>

#include "assembler.hpp"
#include "ratelimit.hpp"



namespace ProxNet
{



// Positioning update of a single channel reported by a user.
class SignalUpdate
{
    UserId                          _userId;
    Channel                         _channel;
    std::shared_ptr<GpsLocation>    _location;
    DeviceId                        _deviceId;

    SignalUpdate(const UserId &userId, Channel channel);

public:

    static SignalUpdate ForGps(const UserId &userId, const GpsLocation &location);
    static SignalUpdate ForWifi(const UserId &userId, const DeviceId &networkId);
    static SignalUpdate ForBluetooth(const UserId &userId, const DeviceId &deviceId);

    const UserId& userId() const;
    Channel channel() const;
    std::shared_ptr<GpsLocation> location() const;
    const DeviceId& deviceId() const;
};


struct SignalAck
{
    bool        accepted;
    Timestamp   updatedAt;
    bool        isDiscoverable;
};



// Operations served to authenticated clients
class IProximityMethods
{
public:

    virtual ~IProximityMethods() {}

    virtual SignalAck UpdateSignal(const SignalUpdate &update) = 0;
    virtual DiscoveryResult Discover(const DiscoveryRequest &request) = 0;

    virtual UserRecord GetSignalStatus(const UserId &userId) const = 0;
    // Null arguments keep the current value
    virtual DiscoverabilityProfile UpdateDiscoverySettings( const UserId &userId,
        std::shared_ptr<bool> isDiscoverable, std::shared_ptr<uint32_t> rangeMeters ) = 0;
};



// Proximity discovery engine: ingests positioning signals and answers discovery
// requests on exactly one channel per request. Holds no per-request state.
class ProximityEngine : public IProximityMethods
{
    std::shared_ptr<Config>                 _config;
    std::shared_ptr<ISignalStore>           _store;
    std::shared_ptr<IRelationshipOracle>    _oracle;
    std::shared_ptr<IRateLimiter>           _rateLimiter;
    Clock                                   _clock;

    std::unordered_map<Channel, std::shared_ptr<ICandidateQuery>, EnumHasher> _queries;
    PrivacyAnnotator                        _annotator;
    ResultAssembler                         _assembler;

    std::shared_ptr<UserRecord> LoadExisting(const UserId &userId) const;

public:

    ProximityEngine( std::shared_ptr<Config> config,
                     std::shared_ptr<ISignalStore> store,
                     std::shared_ptr<IRelationshipOracle> oracle,
                     std::shared_ptr<IRateLimiter> rateLimiter,
                     Clock clock = SystemClock() );

    SignalAck UpdateSignal(const SignalUpdate &update) override;
    DiscoveryResult Discover(const DiscoveryRequest &request) override;

    UserRecord GetSignalStatus(const UserId &userId) const override;
    DiscoverabilityProfile UpdateDiscoverySettings( const UserId &userId,
        std::shared_ptr<bool> isDiscoverable, std::shared_ptr<uint32_t> rangeMeters ) override;
};



} // namespace ProxNet


#endif // __PROXNET_DISCOVERY_H__
