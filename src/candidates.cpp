#include <algorithm>
#include <unordered_map>

#include <easylogging++.h>

#include "candidates.hpp"
#include "proximity.hpp"

using namespace std;



namespace ProxNet
{


static const string MESSAGE_NO_GPS_LOCATION       = "No GPS location available. Please update your location first.";
static const string MESSAGE_NO_WIFI_NETWORK       = "No WiFi network detected. Please connect to a WiFi network.";
static const string MESSAGE_NO_BLUETOOTH_DEVICES  = "No Bluetooth devices detected in range.";

// The store prefilters with some tolerance, ask for more rows than the cap to fill it after exact filtering
static const size_t GPS_PREFILTER_OVERFETCH = 2;



BluetoothObservation::BluetoothObservation(const DeviceId &deviceId) :
    _deviceId(deviceId), _hasRssi(false), _rssi(0) {}

BluetoothObservation::BluetoothObservation(const DeviceId &deviceId, int32_t rssiDbm) :
    _deviceId(deviceId), _hasRssi(true), _rssi(rssiDbm) {}

const DeviceId& BluetoothObservation::deviceId() const { return _deviceId; }
bool BluetoothObservation::hasRssi() const { return _hasRssi; }
int32_t BluetoothObservation::rssi() const { return _rssi; }



DiscoveryRequest::DiscoveryRequest(const UserId &requesterId, Channel channel) :
    _requesterId(requesterId), _channel(channel), _radiusMeters(0), _observations() {}

DiscoveryRequest DiscoveryRequest::ForGps(const UserId &requesterId, Distance radiusMeters)
{
    DiscoveryRequest result(requesterId, Channel::Gps);
    result._radiusMeters = radiusMeters;
    return result;
}

DiscoveryRequest DiscoveryRequest::ForWifi(const UserId &requesterId)
    { return DiscoveryRequest(requesterId, Channel::Wifi); }

DiscoveryRequest DiscoveryRequest::ForBluetooth( const UserId &requesterId,
                                                 const vector<BluetoothObservation> &observations )
{
    DiscoveryRequest result(requesterId, Channel::Bluetooth);
    result._observations = observations;
    return result;
}

DiscoveryRequest DiscoveryRequest::ForChannel(const UserId &requesterId, Channel channel)
    { return DiscoveryRequest(requesterId, channel); }

const UserId& DiscoveryRequest::requesterId() const { return _requesterId; }
Channel DiscoveryRequest::channel() const { return _channel; }
Distance DiscoveryRequest::radiusMeters() const { return _radiusMeters; }
const vector<BluetoothObservation>& DiscoveryRequest::observations() const { return _observations; }



ProximityMatch::ProximityMatch(const UserRecord &user) :
    user(user), distanceMeters(), estimatedDistanceMeters(), signalUpdatedAt() {}

ChannelContext::ChannelContext(Channel channel) :
    channel(channel), center(), networkId() {}

CandidateSearch::CandidateSearch(Channel channel) :
    matches(), context(channel), message() {}



static shared_ptr<UserRecord> LoadRequester(const ISignalStore &store, const UserId &requesterId)
{
    shared_ptr<UserRecord> requester = store.Load(requesterId);
    if (! requester)
        { throw ProximityError(ErrorCode::ERROR_NOT_FOUND, "Unknown requester " + requesterId); }
    return requester;
}



GpsCandidateQuery::GpsCandidateQuery(shared_ptr<Config> config, shared_ptr<ISignalStore> store) :
    _config(config), _store(store)
{
    if (_config == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No config instantiated"); }
    if (_store == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No signal store instantiated"); }
}


void GpsCandidateQuery::Validate(const DiscoveryRequest &request) const
{
    Distance radius = request.radiusMeters();
    // Negated comparisons reject NaN as well
    if ( ! ( _config->minRadiusMeters() <= radius && radius <= _config->maxRadiusMeters() ) )
    {
        throw ProximityError( ErrorCode::ERROR_INVALID_VALUE, "Search radius must be between " +
            to_string( static_cast<int>( _config->minRadiusMeters() ) ) + " and " +
            to_string( static_cast<int>( _config->maxRadiusMeters() ) ) + " meters" );
    }
}


CandidateSearch GpsCandidateQuery::Find(const DiscoveryRequest &request) const
{
    Validate(request);
    Distance radius = request.radiusMeters();

    CandidateSearch result(Channel::Gps);
    result.context.radiusMeters = radius;

    shared_ptr<UserRecord> requester = LoadRequester(*_store, request.requesterId());
    shared_ptr<GpsSignal> requesterGps = requester->gpsSignal();
    if (! requesterGps)
    {
        LOG(DEBUG) << "Requester " << request.requesterId() << " has no GPS location, skipping search";
        result.message = MESSAGE_NO_GPS_LOCATION;
        return result;
    }

    const GpsLocation &center = requesterGps->location();
    result.context.center = make_shared<GpsLocation>(center);

    vector<UserRecord> users = _store->GetUsersNearLocation( center, radius,
        request.requesterId(), _config->maxResultCount() * GPS_PREFILTER_OVERFETCH );

    for (const auto &user : users)
    {
        shared_ptr<GpsSignal> gps = user.gpsSignal();
        if (! gps || user.id() == request.requesterId() )
            { continue; }

        Distance distance = HaversineDistanceMeters( center, gps->location() );
        if (distance > radius)
            { continue; }

        ProximityMatch match(user);
        match.distanceMeters  = make_shared<Distance>(distance);
        match.signalUpdatedAt = make_shared<Timestamp>( gps->updatedAt() );
        result.matches.push_back(match);
    }

    LOG(DEBUG) << "Found " << result.matches.size() << " users within "
               << radius << "m of " << center;
    return result;
}



WifiCandidateQuery::WifiCandidateQuery(shared_ptr<Config> config, shared_ptr<ISignalStore> store, Clock clock) :
    _config(config), _store(store), _clock(clock)
{
    if (_config == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No config instantiated"); }
    if (_store == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No signal store instantiated"); }
    if (! _clock)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No clock instantiated"); }
}


// The network id comes from the stored signal, nothing to check in the request
void WifiCandidateQuery::Validate(const DiscoveryRequest &) const {}


CandidateSearch WifiCandidateQuery::Find(const DiscoveryRequest &request) const
{
    CandidateSearch result(Channel::Wifi);

    shared_ptr<UserRecord> requester = LoadRequester(*_store, request.requesterId());
    shared_ptr<WifiSignal> requesterWifi = requester->wifiSignal();
    if (! requesterWifi)
    {
        LOG(DEBUG) << "Requester " << request.requesterId() << " has no WiFi network, skipping search";
        result.message = MESSAGE_NO_WIFI_NETWORK;
        return result;
    }

    const DeviceId &networkId = requesterWifi->id();
    result.context.networkId = networkId;

    Timestamp freshSince = _clock() - _config->wifiFreshnessWindow();
    vector<UserRecord> users = _store->GetUsersOnNetwork( networkId, freshSince,
        request.requesterId(), _config->maxResultCount() );

    for (const auto &user : users)
    {
        shared_ptr<WifiSignal> wifi = user.wifiSignal();
        if ( ! wifi || wifi->id() != networkId || wifi->updatedAt() < freshSince ||
             user.id() == request.requesterId() )
            { continue; }

        ProximityMatch match(user);
        match.signalUpdatedAt = make_shared<Timestamp>( wifi->updatedAt() );
        result.matches.push_back(match);
    }

    LOG(DEBUG) << "Found " << result.matches.size() << " users on the network of " << request.requesterId();
    return result;
}



BluetoothCandidateQuery::BluetoothCandidateQuery(shared_ptr<Config> config, shared_ptr<ISignalStore> store, Clock clock) :
    _config(config), _store(store), _clock(clock)
{
    if (_config == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No config instantiated"); }
    if (_store == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No signal store instantiated"); }
    if (! _clock)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No clock instantiated"); }
}


void BluetoothCandidateQuery::Validate(const DiscoveryRequest &request) const
{
    const vector<BluetoothObservation> &observations = request.observations();
    if ( observations.size() > _config->maxObservedDevices() )
    {
        throw ProximityError( ErrorCode::ERROR_INVALID_VALUE, "Too many observed devices, maximum is " +
            to_string( _config->maxObservedDevices() ) );
    }
    for (const auto &observation : observations)
    {
        if ( ! IsValidMacAddress( observation.deviceId() ) )
        {
            throw ProximityError( ErrorCode::ERROR_INVALID_VALUE,
                "Invalid hardware address format: " + observation.deviceId() );
        }
    }
}


CandidateSearch BluetoothCandidateQuery::Find(const DiscoveryRequest &request) const
{
    Validate(request);
    CandidateSearch result(Channel::Bluetooth);

    const vector<BluetoothObservation> &observations = request.observations();
    if ( observations.empty() )
    {
        LOG(DEBUG) << "Empty Bluetooth scan from " << request.requesterId() << ", skipping search";
        result.message = MESSAGE_NO_BLUETOOTH_DEVICES;
        return result;
    }

    // Normalize ids, collapse duplicates keeping the strongest signal seen for each device
    vector<DeviceId> deviceIds;
    unordered_map<DeviceId, BluetoothObservation> strongest;
    for (const auto &observation : observations)
    {
        DeviceId deviceId = NormalizeMacAddress( observation.deviceId() );
        auto it = strongest.find(deviceId);
        if ( it == strongest.end() )
        {
            deviceIds.push_back(deviceId);
            strongest.emplace(deviceId, observation);
        }
        else if ( observation.hasRssi() &&
                  ( ! it->second.hasRssi() || it->second.rssi() < observation.rssi() ) )
            { it->second = observation; }
    }
    result.context.scannedDeviceCount = deviceIds.size();

    // Requester must exist even if its own Bluetooth id is not needed here
    LoadRequester(*_store, request.requesterId());

    Timestamp freshSince = _clock() - _config->bluetoothFreshnessWindow();
    vector<UserRecord> users = _store->GetUsersWithDevices( deviceIds, freshSince,
        request.requesterId(), _config->maxResultCount() );

    for (const auto &user : users)
    {
        shared_ptr<BluetoothSignal> bluetooth = user.bluetoothSignal();
        if ( ! bluetooth || bluetooth->updatedAt() < freshSince || user.id() == request.requesterId() )
            { continue; }

        auto observationIt = strongest.find( bluetooth->id() );
        if ( observationIt == strongest.end() )
            { continue; }

        ProximityMatch match(user);
        match.signalUpdatedAt = make_shared<Timestamp>( bluetooth->updatedAt() );
        if ( observationIt->second.hasRssi() )
        {
            match.estimatedDistanceMeters = make_shared<Distance>(
                EstimateBluetoothDistanceMeters( observationIt->second.rssi() ) );
        }
        result.matches.push_back(match);
    }

    LOG(DEBUG) << "Found " << result.matches.size() << " users among "
               << deviceIds.size() << " scanned devices";
    return result;
}



} // namespace ProxNet
