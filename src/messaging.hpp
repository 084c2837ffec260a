#ifndef __PROXNET_PROTOBUF_MESSAGING_H__
#define __PROXNET_PROTOBUF_MESSAGING_H__

#include <memory>

#include <google/protobuf/text_format.h>

#include "ProxNet.pb.h"
#include "auth.hpp"
#include "discovery.hpp"


namespace ProxNet
{


// Utility class to convert between the data representation
// of the business logic and the messages of the protobuf protocol definition.
struct Converter
{
    // Functions that convert from protobuf to internal representation, creating a new object
    static ErrorCode FromProtoBuf(proxnet::protocol::Status value);
    static Channel FromProtoBuf(proxnet::protocol::Channel value);
    static GpsLocation FromProtoBuf(const proxnet::protocol::GpsLocation &value);
    static std::vector<BluetoothObservation> FromProtoBuf(const proxnet::protocol::DiscoverBluetoothRequest &value);
    static CandidateUser FromProtoBuf(const proxnet::protocol::NearbyUser &value);
    static DiscoveryResult FromProtoBuf(const proxnet::protocol::DiscoveryResponse &value);

    // Functions that fill up an existing protobuf object from the internal representation
    static void FillProtoBuf(proxnet::protocol::GpsLocation *target, const GpsLocation &source);
    static void FillProtoBuf(proxnet::protocol::NearbyUser *target, const CandidateUser &source);
    static void FillProtoBuf(proxnet::protocol::DiscoveryResponse *target, const DiscoveryResult &source);
    static void FillProtoBuf(proxnet::protocol::SignalStatusResponse *target, const UserRecord &source);

    // Functions that convert from the internal representation to protobuf, creating a new object
    static proxnet::protocol::Status ToProtoBuf(ErrorCode value);
    static proxnet::protocol::Channel ToProtoBuf(Channel value);
    static proxnet::protocol::GpsLocation* ToProtoBuf(const GpsLocation &location);
};



// Interface to dispatch messages to serve incoming requests directly in a blocking way.
// Implementation should translate incoming protobuf requests to internal representation,
// serve the request with our business logic and translate the result into a protobuf response.
class IBlockingRequestDispatcher
{
public:

    virtual ~IBlockingRequestDispatcher() {}

    virtual std::unique_ptr<proxnet::protocol::Response> Dispatch(std::unique_ptr<proxnet::protocol::Request> &&request) = 0;
};



// Dispatch requests of a single client connection to the proximity engine.
// The asserted identity of every request is verified before serving it.
class IncomingRequestDispatcher : public IBlockingRequestDispatcher
{
    std::shared_ptr<IProximityMethods>  _iProximity;
    std::shared_ptr<IAuthenticator>     _authenticator;
    Address                             _remoteAddress;
    Distance                            _defaultRadiusMeters;

public:

    IncomingRequestDispatcher( std::shared_ptr<IProximityMethods> iProximity,
        std::shared_ptr<IAuthenticator> authenticator, const Address &remoteAddress,
        Distance defaultRadiusMeters );

    std::unique_ptr<proxnet::protocol::Response> Dispatch(std::unique_ptr<proxnet::protocol::Request> &&request) override;
};



// Create a proxy interface that communicates with a server through protobuf messages.
// Translate methods into protobuf requests, send the request to the server,
// then translate its response into our internal representation.
class ProximityMethodsProtoBufClient : public IProximityMethods
{
    std::shared_ptr<IBlockingRequestDispatcher> _dispatcher;

    std::unique_ptr<proxnet::protocol::Response> DispatchChecked(
        std::unique_ptr<proxnet::protocol::Request> &&request ) const;

public:

    ProximityMethodsProtoBufClient(std::shared_ptr<IBlockingRequestDispatcher> dispatcher);

    SignalAck UpdateSignal(const SignalUpdate &update) override;
    DiscoveryResult Discover(const DiscoveryRequest &request) override;

    UserRecord GetSignalStatus(const UserId &userId) const override;
    DiscoverabilityProfile UpdateDiscoverySettings( const UserId &userId,
        std::shared_ptr<bool> isDiscoverable, std::shared_ptr<uint32_t> rangeMeters ) override;
};



} // namespace ProxNet


#endif // __PROXNET_PROTOBUF_MESSAGING_H__
