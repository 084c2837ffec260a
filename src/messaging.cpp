#include <cmath>

#include <easylogging++.h>

#include "messaging.hpp"

using namespace std;



namespace ProxNet
{


const GpsCoordinate GPS_COORDINATE_PROTOBUF_INT_MULTIPLIER = 1000000.;

static const string PROTOCOL_VERSION{1, 0, 0};



ErrorCode Converter::FromProtoBuf(proxnet::protocol::Status value)
{
    switch(value)
    {
        case proxnet::protocol::Status::ERROR_UNSUPPORTED:          return ErrorCode::ERROR_UNSUPPORTED;
        case proxnet::protocol::Status::ERROR_PROTOCOL_VIOLATION:   return ErrorCode::ERROR_PROTOCOL_VIOLATION;
        case proxnet::protocol::Status::ERROR_INVALID_VALUE:        return ErrorCode::ERROR_INVALID_VALUE;
        case proxnet::protocol::Status::ERROR_UNAUTHORIZED:         return ErrorCode::ERROR_UNAUTHORIZED;
        case proxnet::protocol::Status::ERROR_NOT_FOUND:            return ErrorCode::ERROR_NOT_FOUND;
        case proxnet::protocol::Status::ERROR_PERMISSION_DENIED:    return ErrorCode::ERROR_PERMISSION_DENIED;
        case proxnet::protocol::Status::ERROR_RATE_LIMITED:         return ErrorCode::ERROR_RATE_LIMITED;
        case proxnet::protocol::Status::ERROR_UPSTREAM:             return ErrorCode::ERROR_UPSTREAM;
        case proxnet::protocol::Status::ERROR_INTERNAL:             return ErrorCode::ERROR_INTERNAL;
        default: throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Missing or unknown status code");
    }
}


proxnet::protocol::Status Converter::ToProtoBuf(ErrorCode value)
{
    switch(value)
    {
        case ErrorCode::ERROR_UNSUPPORTED:          return proxnet::protocol::Status::ERROR_UNSUPPORTED;
        case ErrorCode::ERROR_PROTOCOL_VIOLATION:   return proxnet::protocol::Status::ERROR_PROTOCOL_VIOLATION;
        case ErrorCode::ERROR_BAD_REQUEST:          return proxnet::protocol::Status::ERROR_PROTOCOL_VIOLATION;
        case ErrorCode::ERROR_INVALID_VALUE:        return proxnet::protocol::Status::ERROR_INVALID_VALUE;
        case ErrorCode::ERROR_UNAUTHORIZED:         return proxnet::protocol::Status::ERROR_UNAUTHORIZED;
        case ErrorCode::ERROR_NOT_FOUND:            return proxnet::protocol::Status::ERROR_NOT_FOUND;
        case ErrorCode::ERROR_PERMISSION_DENIED:    return proxnet::protocol::Status::ERROR_PERMISSION_DENIED;
        case ErrorCode::ERROR_RATE_LIMITED:         return proxnet::protocol::Status::ERROR_RATE_LIMITED;
        case ErrorCode::ERROR_UPSTREAM:             return proxnet::protocol::Status::ERROR_UPSTREAM;
        case ErrorCode::ERROR_INTERNAL:             return proxnet::protocol::Status::ERROR_INTERNAL;
        default: throw ProximityError(ErrorCode::ERROR_INTERNAL, "Conversion for error code not implemented");
    }
}



Channel Converter::FromProtoBuf(proxnet::protocol::Channel value)
{
    switch(value)
    {
        case proxnet::protocol::Channel::GPS:       return Channel::Gps;
        case proxnet::protocol::Channel::WIFI:      return Channel::Wifi;
        case proxnet::protocol::Channel::BLUETOOTH: return Channel::Bluetooth;
        default: throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Missing or unknown channel");
    }
}

proxnet::protocol::Channel Converter::ToProtoBuf(Channel value)
{
    switch(value)
    {
        case Channel::Gps:          return proxnet::protocol::Channel::GPS;
        case Channel::Wifi:         return proxnet::protocol::Channel::WIFI;
        case Channel::Bluetooth:    return proxnet::protocol::Channel::BLUETOOTH;
        default: throw ProximityError(ErrorCode::ERROR_INTERNAL, "Conversion for channel not implemented");
    }
}



GpsLocation Converter::FromProtoBuf(const proxnet::protocol::GpsLocation& value)
{
    return GpsLocation(
        value.latitude()  / GPS_COORDINATE_PROTOBUF_INT_MULTIPLIER,
        value.longitude() / GPS_COORDINATE_PROTOBUF_INT_MULTIPLIER );
}


void Converter::FillProtoBuf(proxnet::protocol::GpsLocation* target, const GpsLocation& source)
{
    target->set_latitude( static_cast<google::protobuf::int32>(
        round( source.latitude()  * GPS_COORDINATE_PROTOBUF_INT_MULTIPLIER ) ) );
    target->set_longitude( static_cast<google::protobuf::int32>(
        round( source.longitude() * GPS_COORDINATE_PROTOBUF_INT_MULTIPLIER ) ) );
}


proxnet::protocol::GpsLocation* Converter::ToProtoBuf(const GpsLocation &location)
{
    auto result = new proxnet::protocol::GpsLocation();
    FillProtoBuf(result, location);
    return result;
}



vector<BluetoothObservation> Converter::FromProtoBuf(const proxnet::protocol::DiscoverBluetoothRequest &value)
{
    vector<BluetoothObservation> result;
    for (int idx = 0; idx < value.observed_devices_size(); ++idx)
    {
        const proxnet::protocol::ObservedDevice &device = value.observed_devices(idx);
        if ( device.has_rssi() )
             { result.push_back( BluetoothObservation( device.device_id(), device.rssi() ) ); }
        else { result.push_back( BluetoothObservation( device.device_id() ) ); }
    }
    return result;
}



void Converter::FillProtoBuf(proxnet::protocol::NearbyUser *target, const CandidateUser &source)
{
    target->set_id(source.id);
    target->set_username(source.username);
    target->set_first_name(source.firstName);
    target->set_last_name(source.lastName);
    target->set_profile_picture(source.profilePicture);
    target->set_bio(source.bio);
    for (const auto &interest : source.interests)
        { target->add_interests(interest); }
    target->set_is_online(source.isOnline);

    if (source.age)
        { target->set_age(*source.age); }
    if (source.lastSeen)
        { target->set_last_seen( ToUnixMillis(*source.lastSeen) ); }
    if (source.distanceMeters)
        { target->set_distance_meters( static_cast<uint32_t>( round(*source.distanceMeters) ) ); }
    if (source.estimatedDistanceMeters)
        { target->set_estimated_distance_meters(*source.estimatedDistanceMeters); }
    if (source.signalUpdatedAt)
        { target->set_signal_updated_at( ToUnixMillis(*source.signalUpdatedAt) ); }

    target->set_is_friend(source.isFriend);
    target->set_has_pending_request(source.hasPendingRequest);

    target->set_show_age( source.visibility.showAge() );
    target->set_show_location( source.visibility.showLocation() );
    target->set_show_last_seen( source.visibility.showLastSeen() );
}


CandidateUser Converter::FromProtoBuf(const proxnet::protocol::NearbyUser &value)
{
    CandidateUser result;
    result.id               = value.id();
    result.username         = value.username();
    result.firstName        = value.first_name();
    result.lastName         = value.last_name();
    result.profilePicture   = value.profile_picture();
    result.bio              = value.bio();
    result.interests.assign( value.interests().begin(), value.interests().end() );
    result.isOnline         = value.is_online();

    if ( value.has_age() )
        { result.age = make_shared<uint16_t>( static_cast<uint16_t>( value.age() ) ); }
    if ( value.has_last_seen() )
        { result.lastSeen = make_shared<Timestamp>( FromUnixMillis( value.last_seen() ) ); }
    if ( value.has_distance_meters() )
        { result.distanceMeters = make_shared<Distance>( value.distance_meters() ); }
    if ( value.has_estimated_distance_meters() )
        { result.estimatedDistanceMeters = make_shared<Distance>( value.estimated_distance_meters() ); }
    if ( value.has_signal_updated_at() )
        { result.signalUpdatedAt = make_shared<Timestamp>( FromUnixMillis( value.signal_updated_at() ) ); }

    result.isFriend          = value.is_friend();
    result.hasPendingRequest = value.has_pending_request();
    result.visibility = PrivacySettings( value.show_age(), value.show_location(), value.show_last_seen() );
    return result;
}



void Converter::FillProtoBuf(proxnet::protocol::DiscoveryResponse *target, const DiscoveryResult &source)
{
    target->set_channel( ToProtoBuf(source.context.channel) );
    for (const auto &user : source.users)
        { FillProtoBuf( target->add_users(), user ); }
    target->set_total_found( static_cast<uint32_t>(source.totalFound) );
    target->set_timestamp( ToUnixMillis(source.timestamp) );
    if ( ! source.message.empty() )
        { target->set_message(source.message); }

    switch (source.context.channel)
    {
        case Channel::Gps:
            if (source.context.center)
                { target->set_allocated_center( ToProtoBuf(*source.context.center) ); }
            target->set_radius_meters( static_cast<uint32_t>(source.context.radiusMeters) );
            break;
        case Channel::Wifi:
            target->set_network_id(source.context.networkId);
            break;
        case Channel::Bluetooth:
            target->set_scanned_device_count( static_cast<uint32_t>(source.context.scannedDeviceCount) );
            break;
        default: throw ProximityError(ErrorCode::ERROR_INTERNAL, "Conversion for channel not implemented");
    }
}


DiscoveryResult Converter::FromProtoBuf(const proxnet::protocol::DiscoveryResponse &value)
{
    DiscoveryResult result( FromProtoBuf( value.channel() ) );
    for (int idx = 0; idx < value.users_size(); ++idx)
        { result.users.push_back( FromProtoBuf( value.users(idx) ) ); }
    result.totalFound = value.total_found();
    result.timestamp  = FromUnixMillis( value.timestamp() );
    result.message    = value.message();

    if ( value.has_center() )
        { result.context.center = make_shared<GpsLocation>( FromProtoBuf( value.center() ) ); }
    result.context.radiusMeters       = value.radius_meters();
    result.context.networkId          = value.network_id();
    result.context.scannedDeviceCount = value.scanned_device_count();
    return result;
}



void Converter::FillProtoBuf(proxnet::protocol::SignalStatusResponse *target, const UserRecord &source)
{
    shared_ptr<GpsSignal> gps = source.gpsSignal();
    if (gps)
    {
        FillProtoBuf( target->mutable_gps_location(), gps->location() );
        target->set_gps_updated_at( ToUnixMillis( gps->updatedAt() ) );
    }

    shared_ptr<WifiSignal> wifi = source.wifiSignal();
    if (wifi)
    {
        target->set_wifi_network_id( wifi->id() );
        target->set_wifi_updated_at( ToUnixMillis( wifi->updatedAt() ) );
    }

    shared_ptr<BluetoothSignal> bluetooth = source.bluetoothSignal();
    if (bluetooth)
    {
        target->set_bluetooth_device_id( bluetooth->id() );
        target->set_bluetooth_updated_at( ToUnixMillis( bluetooth->updatedAt() ) );
    }

    target->set_is_discoverable( source.discovery().isDiscoverable() );
    target->set_discovery_range_meters( source.discovery().rangeMeters() );
}



IncomingRequestDispatcher::IncomingRequestDispatcher( shared_ptr<IProximityMethods> iProximity,
        shared_ptr<IAuthenticator> authenticator, const Address &remoteAddress,
        Distance defaultRadiusMeters ) :
    _iProximity(iProximity), _authenticator(authenticator),
    _remoteAddress(remoteAddress), _defaultRadiusMeters(defaultRadiusMeters)
{
    if (_iProximity == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No proximity logic instantiated"); }
    if (_authenticator == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No authenticator instantiated"); }
}


static void FillSignalAck(proxnet::protocol::Response *response, const SignalAck &ack)
{
    auto responseContent = response->mutable_update_signal();
    responseContent->set_accepted(ack.accepted);
    responseContent->set_updated_at( ToUnixMillis(ack.updatedAt) );
    responseContent->set_is_discoverable(ack.isDiscoverable);
}


// TODO Dispatchers simply translate between different data formats, ideally this should be generated.
unique_ptr<proxnet::protocol::Response> IncomingRequestDispatcher::Dispatch(
    unique_ptr<proxnet::protocol::Request> &&request)
{
    if (! request)
        { throw ProximityError(ErrorCode::ERROR_BAD_REQUEST, "Missing request"); }
    if ( request->version().empty() || request->version()[0] != 1 )
        { throw ProximityError(ErrorCode::ERROR_UNSUPPORTED, "Missing or unknown request version"); }

    UserId userId = _authenticator->Authenticate( request->user_id(), _remoteAddress );
    unique_ptr<proxnet::protocol::Response> result( new proxnet::protocol::Response() );

    switch ( request->request_type_case() )
    {
        case proxnet::protocol::Request::kUpdateGpsSignal:
        {
            auto const &updateRequest = request->update_gps_signal();
            if ( ! updateRequest.has_location() )
                { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Missing GPS location"); }

            GpsLocation location = Converter::FromProtoBuf( updateRequest.location() );
            SignalAck ack = _iProximity->UpdateSignal( SignalUpdate::ForGps(userId, location) );
            LOG(DEBUG) << "Served UpdateGpsSignal(" << userId << ", " << location << ")";

            FillSignalAck(result.get(), ack);
            break;
        }

        case proxnet::protocol::Request::kUpdateWifiSignal:
        {
            auto const &updateRequest = request->update_wifi_signal();
            SignalAck ack = _iProximity->UpdateSignal(
                SignalUpdate::ForWifi( userId, updateRequest.network_id() ) );
            LOG(DEBUG) << "Served UpdateWifiSignal(" << userId << ")";

            FillSignalAck(result.get(), ack);
            break;
        }

        case proxnet::protocol::Request::kUpdateBluetoothSignal:
        {
            auto const &updateRequest = request->update_bluetooth_signal();
            SignalAck ack = _iProximity->UpdateSignal(
                SignalUpdate::ForBluetooth( userId, updateRequest.device_id() ) );
            LOG(DEBUG) << "Served UpdateBluetoothSignal(" << userId << ")";

            FillSignalAck(result.get(), ack);
            break;
        }

        case proxnet::protocol::Request::kDiscoverGps:
        {
            auto const &discoverRequest = request->discover_gps();
            Distance radius = discoverRequest.has_radius_meters() ?
                discoverRequest.radius_meters() : _defaultRadiusMeters;

            DiscoveryResult discovery = _iProximity->Discover( DiscoveryRequest::ForGps(userId, radius) );
            LOG(DEBUG) << "Served DiscoverGps(" << userId << ", " << radius
                       << "), user count: " << discovery.totalFound;

            Converter::FillProtoBuf( result->mutable_discovery(), discovery );
            break;
        }

        case proxnet::protocol::Request::kDiscoverWifi:
        {
            DiscoveryResult discovery = _iProximity->Discover( DiscoveryRequest::ForWifi(userId) );
            LOG(DEBUG) << "Served DiscoverWifi(" << userId << "), user count: " << discovery.totalFound;

            Converter::FillProtoBuf( result->mutable_discovery(), discovery );
            break;
        }

        case proxnet::protocol::Request::kDiscoverBluetooth:
        {
            vector<BluetoothObservation> observations = Converter::FromProtoBuf( request->discover_bluetooth() );
            DiscoveryResult discovery = _iProximity->Discover(
                DiscoveryRequest::ForBluetooth(userId, observations) );
            LOG(DEBUG) << "Served DiscoverBluetooth(" << userId << ", " << observations.size()
                       << " devices), user count: " << discovery.totalFound;

            Converter::FillProtoBuf( result->mutable_discovery(), discovery );
            break;
        }

        case proxnet::protocol::Request::kGetSignalStatus:
        {
            UserRecord user = _iProximity->GetSignalStatus(userId);
            LOG(DEBUG) << "Served GetSignalStatus(" << userId << ")";

            Converter::FillProtoBuf( result->mutable_signal_status(), user );
            break;
        }

        case proxnet::protocol::Request::kUpdateDiscoverySettings:
        {
            auto const &settingsRequest = request->update_discovery_settings();
            shared_ptr<bool> isDiscoverable;
            if ( settingsRequest.has_is_discoverable() )
                { isDiscoverable = make_shared<bool>( settingsRequest.is_discoverable() ); }
            shared_ptr<uint32_t> rangeMeters;
            if ( settingsRequest.has_discovery_range_meters() )
                { rangeMeters = make_shared<uint32_t>( settingsRequest.discovery_range_meters() ); }

            DiscoverabilityProfile profile = _iProximity->UpdateDiscoverySettings(
                userId, isDiscoverable, rangeMeters );
            LOG(DEBUG) << "Served UpdateDiscoverySettings(" << userId << ")";

            auto responseContent = result->mutable_discovery_settings();
            responseContent->set_is_discoverable( profile.isDiscoverable() );
            responseContent->set_discovery_range_meters( profile.rangeMeters() );
            break;
        }

        default: throw ProximityError(ErrorCode::ERROR_BAD_REQUEST, "Missing or unknown request type");
    }

    return result;
}



ProximityMethodsProtoBufClient::ProximityMethodsProtoBufClient(shared_ptr<IBlockingRequestDispatcher> dispatcher) :
    _dispatcher(dispatcher)
{
    if (_dispatcher == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No dispatcher instantiated"); }
}


unique_ptr<proxnet::protocol::Response> ProximityMethodsProtoBufClient::DispatchChecked(
    unique_ptr<proxnet::protocol::Request> &&request ) const
{
    request->set_version(PROTOCOL_VERSION);
    unique_ptr<proxnet::protocol::Response> response = _dispatcher->Dispatch( move(request) );
    if (! response)
        { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Got no response"); }
    if ( response->status() != proxnet::protocol::Status::STATUS_OK )
        { throw ProximityError( Converter::FromProtoBuf( response->status() ), response->details() ); }
    return response;
}


SignalAck ProximityMethodsProtoBufClient::UpdateSignal(const SignalUpdate &update)
{
    unique_ptr<proxnet::protocol::Request> request( new proxnet::protocol::Request() );
    request->set_user_id( update.userId() );
    switch ( update.channel() )
    {
        case Channel::Gps:
            if (! update.location())
                { throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Missing GPS location"); }
            request->mutable_update_gps_signal()->set_allocated_location(
                Converter::ToProtoBuf( *update.location() ) );
            break;
        case Channel::Wifi:
            request->mutable_update_wifi_signal()->set_network_id( update.deviceId() );
            break;
        case Channel::Bluetooth:
            request->mutable_update_bluetooth_signal()->set_device_id( update.deviceId() );
            break;
        default: throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Unknown positioning channel");
    }

    unique_ptr<proxnet::protocol::Response> response = DispatchChecked( move(request) );
    if ( ! response->has_update_signal() )
        { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Unexpected response type for signal update"); }

    auto const &ack = response->update_signal();
    return SignalAck{ ack.accepted(), FromUnixMillis( ack.updated_at() ), ack.is_discoverable() };
}


DiscoveryResult ProximityMethodsProtoBufClient::Discover(const DiscoveryRequest &discovery)
{
    unique_ptr<proxnet::protocol::Request> request( new proxnet::protocol::Request() );
    request->set_user_id( discovery.requesterId() );
    switch ( discovery.channel() )
    {
        case Channel::Gps:
            request->mutable_discover_gps()->set_radius_meters(
                static_cast<uint32_t>( discovery.radiusMeters() ) );
            break;
        case Channel::Wifi:
            request->mutable_discover_wifi();
            break;
        case Channel::Bluetooth:
        {
            auto requestContent = request->mutable_discover_bluetooth();
            for (const auto &observation : discovery.observations())
            {
                proxnet::protocol::ObservedDevice *device = requestContent->add_observed_devices();
                device->set_device_id( observation.deviceId() );
                if ( observation.hasRssi() )
                    { device->set_rssi( observation.rssi() ); }
            }
            break;
        }
        default: throw ProximityError(ErrorCode::ERROR_INVALID_VALUE, "Unknown positioning channel");
    }

    unique_ptr<proxnet::protocol::Response> response = DispatchChecked( move(request) );
    if ( ! response->has_discovery() )
        { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Unexpected response type for discovery"); }
    return Converter::FromProtoBuf( response->discovery() );
}


UserRecord ProximityMethodsProtoBufClient::GetSignalStatus(const UserId &userId) const
{
    unique_ptr<proxnet::protocol::Request> request( new proxnet::protocol::Request() );
    request->set_user_id(userId);
    request->mutable_get_signal_status();

    unique_ptr<proxnet::protocol::Response> response = DispatchChecked( move(request) );
    if ( ! response->has_signal_status() )
        { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Unexpected response type for signal status"); }

    // Only the signals and discoverability of the user are transferred
    auto const &status = response->signal_status();
    UserRecord result( userId, UserDisplayInfo(), DiscoverabilityProfile(
        status.is_discoverable(), true, status.discovery_range_meters() ) );
    if ( status.has_gps_location() && status.has_gps_updated_at() )
    {
        result.gpsSignal( make_shared<GpsSignal>( Converter::FromProtoBuf( status.gps_location() ),
            FromUnixMillis( status.gps_updated_at() ) ) );
    }
    if ( status.has_wifi_network_id() )
    {
        result.wifiSignal( make_shared<WifiSignal>( status.wifi_network_id(),
            FromUnixMillis( status.wifi_updated_at() ) ) );
    }
    if ( status.has_bluetooth_device_id() )
    {
        result.bluetoothSignal( make_shared<BluetoothSignal>( status.bluetooth_device_id(),
            FromUnixMillis( status.bluetooth_updated_at() ) ) );
    }
    return result;
}


DiscoverabilityProfile ProximityMethodsProtoBufClient::UpdateDiscoverySettings( const UserId &userId,
    shared_ptr<bool> isDiscoverable, shared_ptr<uint32_t> rangeMeters )
{
    unique_ptr<proxnet::protocol::Request> request( new proxnet::protocol::Request() );
    request->set_user_id(userId);
    auto requestContent = request->mutable_update_discovery_settings();
    if (isDiscoverable)
        { requestContent->set_is_discoverable(*isDiscoverable); }
    if (rangeMeters)
        { requestContent->set_discovery_range_meters(*rangeMeters); }

    unique_ptr<proxnet::protocol::Response> response = DispatchChecked( move(request) );
    if ( ! response->has_discovery_settings() )
        { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Unexpected response type for discovery settings"); }

    auto const &settings = response->discovery_settings();
    return DiscoverabilityProfile( settings.is_discoverable(), true, settings.discovery_range_meters() );
}



} // namespace ProxNet
