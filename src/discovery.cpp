#include <easylogging++.h>

#include "discovery.hpp"

using namespace std;



namespace ProxNet
{



SignalUpdate::SignalUpdate(const UserId &userId, Channel channel) :
    _userId(userId), _channel(channel), _location(), _deviceId() {}

SignalUpdate SignalUpdate::ForGps(const UserId &userId, const GpsLocation &location)
{
    SignalUpdate result(userId, Channel::Gps);
    result._location = make_shared<GpsLocation>(location);
    return result;
}

SignalUpdate SignalUpdate::ForWifi(const UserId &userId, const DeviceId &networkId)
{
    SignalUpdate result(userId, Channel::Wifi);
    result._deviceId = networkId;
    return result;
}

SignalUpdate SignalUpdate::ForBluetooth(const UserId &userId, const DeviceId &deviceId)
{
    SignalUpdate result(userId, Channel::Bluetooth);
    result._deviceId = deviceId;
    return result;
}

const UserId& SignalUpdate::userId() const { return _userId; }
Channel SignalUpdate::channel() const { return _channel; }
shared_ptr<GpsLocation> SignalUpdate::location() const { return _location; }
const DeviceId& SignalUpdate::deviceId() const { return _deviceId; }



ProximityEngine::ProximityEngine( shared_ptr<Config> config,
                                  shared_ptr<ISignalStore> store,
                                  shared_ptr<IRelationshipOracle> oracle,
                                  shared_ptr<IRateLimiter> rateLimiter,
                                  Clock clock ) :
    _config(config), _store(store), _oracle(oracle), _rateLimiter(rateLimiter), _clock(clock),
    _queries(), _annotator(oracle), _assembler( config ? config->maxResultCount() : 0 )
{
    if (_config == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No config instantiated"); }
    if (_store == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No signal store instantiated"); }
    if (_rateLimiter == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No rate limiter instantiated"); }
    if (! _clock)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No clock instantiated"); }

    _queries[Channel::Gps]       = make_shared<GpsCandidateQuery>(_config, _store);
    _queries[Channel::Wifi]      = make_shared<WifiCandidateQuery>(_config, _store, _clock);
    _queries[Channel::Bluetooth] = make_shared<BluetoothCandidateQuery>(_config, _store, _clock);
}


shared_ptr<UserRecord> ProximityEngine::LoadExisting(const UserId &userId) const
{
    if ( userId.empty() )
        { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Missing user id"); }

    shared_ptr<UserRecord> user = _store->Load(userId);
    if (! user)
        { throw ProximityError(ErrorCode::ERROR_NOT_FOUND, "Unknown user " + userId); }
    return user;
}



SignalAck ProximityEngine::UpdateSignal(const SignalUpdate &update)
{
    shared_ptr<UserRecord> user = LoadExisting( update.userId() );
    Timestamp now = _clock();

    switch ( update.channel() )
    {
        case Channel::Gps:
        {
            if (! update.location())
                { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Missing GPS location"); }
            _store->UpdateGpsSignal( update.userId(), GpsSignal( *update.location(), now ) );
            break;
        }

        case Channel::Wifi:
        {
            DeviceId networkId = NormalizeMacAddress( update.deviceId() );
            _store->UpdateWifiSignal( update.userId(), WifiSignal(networkId, now) );
            break;
        }

        case Channel::Bluetooth:
        {
            DeviceId deviceId = NormalizeMacAddress( update.deviceId() );
            _store->UpdateBluetoothSignal( update.userId(), BluetoothSignal(deviceId, now) );
            break;
        }

        default:
            throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Unknown positioning channel");
    }

    LOG(DEBUG) << "Updated " << update.channel() << " signal of " << update.userId();
    return SignalAck{ true, now, user->discovery().isDiscoverable() };
}



DiscoveryResult ProximityEngine::Discover(const DiscoveryRequest &request)
{
    if ( request.requesterId().empty() )
        { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Missing requester id"); }

    auto queryIt = _queries.find( request.channel() );
    if ( queryIt == _queries.end() )
        { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Unknown positioning channel"); }

    // Malformed requests must not consume quota
    queryIt->second->Validate(request);
    if ( ! _rateLimiter->TryAcquire( request.requesterId(), request.channel() ) )
    {
        throw ProximityError( ErrorCode::ERROR_RATE_LIMITED,
            "Too many discovery requests, please try again later" );
    }

    CandidateSearch search = queryIt->second->Find(request);
    vector<CandidateUser> candidates = _annotator.Annotate( request.requesterId(), search.matches );
    DiscoveryResult result = _assembler.Assemble( search, move(candidates), _clock() );

    LOG(DEBUG) << request.channel() << " discovery of " << request.requesterId()
               << " found " << result.totalFound << " users";
    return result;
}



UserRecord ProximityEngine::GetSignalStatus(const UserId &userId) const
    { return *LoadExisting(userId); }


DiscoverabilityProfile ProximityEngine::UpdateDiscoverySettings( const UserId &userId,
    shared_ptr<bool> isDiscoverable, shared_ptr<uint32_t> rangeMeters )
{
    if (rangeMeters)
    {
        Distance range = *rangeMeters;
        if ( range < _config->minRadiusMeters() || _config->maxRadiusMeters() < range )
        {
            throw ProximityError( ErrorCode::ERROR_INVALID_VALUE, "Discovery range must be between " +
                to_string( static_cast<int>( _config->minRadiusMeters() ) ) + " and " +
                to_string( static_cast<int>( _config->maxRadiusMeters() ) ) + " meters" );
        }
    }

    shared_ptr<UserRecord> user = LoadExisting(userId);
    DiscoverabilityProfile &profile = user->discovery();
    if (isDiscoverable)
        { profile.discoverable(*isDiscoverable); }
    if (rangeMeters)
        { profile.rangeMeters(*rangeMeters); }

    _store->UpdateDiscoverability( userId, profile.isDiscoverable(), profile.rangeMeters() );
    LOG(DEBUG) << "Updated discovery settings of " << userId << ": "
               << ( profile.isDiscoverable() ? "discoverable" : "hidden" )
               << ", range " << profile.rangeMeters() << "m";
    return profile;
}



} // namespace ProxNet
