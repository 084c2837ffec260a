#include <catch.hpp>
#include <easylogging++.h>

#include "messaging.hpp"
#include "testdata.hpp"
#include "testimpls.hpp"

using namespace std;
using namespace ProxNet;



static unique_ptr<proxnet::protocol::Request> NewRequest(const UserId &userId)
{
    unique_ptr<proxnet::protocol::Request> request( new proxnet::protocol::Request() );
    request->set_version({1,0,0});
    request->set_user_id(userId);
    return request;
}


static ErrorCode DispatchError(IBlockingRequestDispatcher &dispatcher, unique_ptr<proxnet::protocol::Request> &&request)
{
    try { dispatcher.Dispatch( move(request) ); }
    catch (ProximityError &ex)
        { return ex.code(); }
    FAIL("Request was served");
    return ErrorCode::ERROR_INTERNAL;
}



SCENARIO("ProtoBuf data conversions", "[messaging]")
{
    GIVEN("A GPS location") {
        THEN("its coordinates are properly transformed to and back from ProtoBuf int representation") {
            proxnet::protocol::GpsLocation protoBufNewYork;
            Converter::FillProtoBuf(&protoBufNewYork, TestData::NewYork);

            REQUIRE( protoBufNewYork.latitude() == 40712800 );
            REQUIRE( protoBufNewYork.longitude() == -74006000 );

            GpsLocation converted( Converter::FromProtoBuf(protoBufNewYork) );
            REQUIRE( converted.latitude() == Approx( TestData::NewYork.latitude() ) );
            REQUIRE( converted.longitude() == Approx( TestData::NewYork.longitude() ) );
        }
    }

    GIVEN("Error codes") {
        THEN("they are mapped to status codes") {
            REQUIRE( Converter::ToProtoBuf(ErrorCode::ERROR_INVALID_VALUE) == proxnet::protocol::ERROR_INVALID_VALUE );
            REQUIRE( Converter::ToProtoBuf(ErrorCode::ERROR_BAD_REQUEST) == proxnet::protocol::ERROR_PROTOCOL_VIOLATION );
            REQUIRE( Converter::ToProtoBuf(ErrorCode::ERROR_RATE_LIMITED) == proxnet::protocol::ERROR_RATE_LIMITED );
            REQUIRE( Converter::FromProtoBuf(proxnet::protocol::ERROR_NOT_FOUND) == ErrorCode::ERROR_NOT_FOUND );
            REQUIRE( Converter::FromProtoBuf(proxnet::protocol::ERROR_UPSTREAM) == ErrorCode::ERROR_UPSTREAM );
        }
    }

    GIVEN("A candidate with hidden fields") {
        CandidateUser user;
        user.id         = "carol";
        user.firstName  = "Carol";
        user.interests  = { "chess" };
        user.isFriend   = true;
        user.visibility = PrivacySettings(false, false, false);
        user.rankDistance = 1234.5;

        THEN("hidden fields stay unset on the wire") {
            proxnet::protocol::NearbyUser protoBufUser;
            Converter::FillProtoBuf(&protoBufUser, user);
            REQUIRE( protoBufUser.id() == "carol" );
            REQUIRE( protoBufUser.interests_size() == 1 );
            REQUIRE( protoBufUser.is_friend() );
            REQUIRE( ! protoBufUser.has_age() );
            REQUIRE( ! protoBufUser.has_distance_meters() );
            REQUIRE( ! protoBufUser.has_last_seen() );
            REQUIRE( ! protoBufUser.show_location() );

            CandidateUser converted( Converter::FromProtoBuf(protoBufUser) );
            REQUIRE( converted.id == "carol" );
            REQUIRE( ! converted.age );
            REQUIRE( ! converted.distanceMeters );
            REQUIRE( converted.isFriend );
        }
    }
}



SCENARIO("Serving requests with the ProtoBuf dispatcher", "[messaging]")
{
    GIVEN("A dispatcher of a local front end") {
        shared_ptr<TestConfig> config( new TestConfig() );
        config->testMode = false;
        shared_ptr<InMemorySignalStore> store( new InMemorySignalStore() );
        shared_ptr<InMemoryRelationshipOracle> oracle( new InMemoryRelationshipOracle() );
        TestClock clock(TestData::Now);
        shared_ptr<IRateLimiter> limiter( new FixedWindowRateLimiter(
            config->rateLimitMaxRequests(), config->rateLimitWindow(), clock.clock() ) );
        store->Store(TestData::Alice);
        store->Store(TestData::Bob);
        oracle->AddFriendRequest("alice", "bob");

        shared_ptr<IProximityMethods> engine( new ProximityEngine( config, store, oracle, limiter, clock.clock() ) );
        shared_ptr<IAuthenticator> authenticator( new TrustedFrontendAuthenticator( config->isTestMode() ) );
        IncomingRequestDispatcher dispatcher( engine, authenticator, "127.0.0.1", config->defaultRadiusMeters() );

        THEN("signal updates of all channels are served") {
            unique_ptr<proxnet::protocol::Request> gpsRequest = NewRequest("alice");
            gpsRequest->mutable_update_gps_signal()->set_allocated_location( Converter::ToProtoBuf(TestData::NewYork) );
            unique_ptr<proxnet::protocol::Response> gpsResponse = dispatcher.Dispatch( move(gpsRequest) );
            REQUIRE( gpsResponse->has_update_signal() );
            REQUIRE( gpsResponse->update_signal().accepted() );
            REQUIRE( gpsResponse->update_signal().is_discoverable() );
            REQUIRE( gpsResponse->update_signal().updated_at() == static_cast<uint64_t>( ToUnixMillis(TestData::Now) ) );

            unique_ptr<proxnet::protocol::Request> wifiRequest = NewRequest("alice");
            wifiRequest->mutable_update_wifi_signal()->set_network_id("aa:bb:cc:dd:ee:01");
            REQUIRE( dispatcher.Dispatch( move(wifiRequest) )->update_signal().accepted() );

            unique_ptr<proxnet::protocol::Request> bluetoothRequest = NewRequest("alice");
            bluetoothRequest->mutable_update_bluetooth_signal()->set_device_id(TestData::AlicePhone);
            REQUIRE( dispatcher.Dispatch( move(bluetoothRequest) )->update_signal().accepted() );

            unique_ptr<proxnet::protocol::Request> statusRequest = NewRequest("alice");
            statusRequest->mutable_get_signal_status();
            unique_ptr<proxnet::protocol::Response> statusResponse = dispatcher.Dispatch( move(statusRequest) );
            REQUIRE( statusResponse->has_signal_status() );
            const proxnet::protocol::SignalStatusResponse &status = statusResponse->signal_status();
            REQUIRE( Converter::FromProtoBuf( status.gps_location() ) == TestData::NewYork );
            REQUIRE( status.wifi_network_id() == TestData::HomeNetwork );
            REQUIRE( status.bluetooth_device_id() == TestData::AlicePhone );
            REQUIRE( status.is_discoverable() );
            REQUIRE( status.discovery_range_meters() == 5000 );
        }

        THEN("discoveries of all channels are served") {
            engine->UpdateSignal( SignalUpdate::ForGps("alice", TestData::NewYork) );
            engine->UpdateSignal( SignalUpdate::ForGps("bob", TestData::NearNewYork) );
            engine->UpdateSignal( SignalUpdate::ForWifi("alice", TestData::HomeNetwork) );
            engine->UpdateSignal( SignalUpdate::ForWifi("bob", TestData::HomeNetwork) );
            engine->UpdateSignal( SignalUpdate::ForBluetooth("bob", TestData::BobPhone) );

            unique_ptr<proxnet::protocol::Request> gpsRequest = NewRequest("alice");
            gpsRequest->mutable_discover_gps();
            unique_ptr<proxnet::protocol::Response> gpsResponse = dispatcher.Dispatch( move(gpsRequest) );
            REQUIRE( gpsResponse->has_discovery() );
            const proxnet::protocol::DiscoveryResponse &gpsDiscovery = gpsResponse->discovery();
            REQUIRE( gpsDiscovery.channel() == proxnet::protocol::GPS );
            REQUIRE( gpsDiscovery.radius_meters() == 5000 );
            REQUIRE( gpsDiscovery.total_found() == 1 );
            REQUIRE( gpsDiscovery.users(0).id() == "bob" );
            REQUIRE( gpsDiscovery.users(0).has_pending_request() );
            REQUIRE( gpsDiscovery.users(0).has_distance_meters() );
            REQUIRE( gpsDiscovery.timestamp() == static_cast<uint64_t>( ToUnixMillis(TestData::Now) ) );

            unique_ptr<proxnet::protocol::Request> wifiRequest = NewRequest("alice");
            wifiRequest->mutable_discover_wifi();
            unique_ptr<proxnet::protocol::Response> wifiResponse = dispatcher.Dispatch( move(wifiRequest) );
            REQUIRE( wifiResponse->discovery().channel() == proxnet::protocol::WIFI );
            REQUIRE( wifiResponse->discovery().network_id() == TestData::HomeNetwork );
            REQUIRE( wifiResponse->discovery().users_size() == 1 );

            unique_ptr<proxnet::protocol::Request> bluetoothRequest = NewRequest("alice");
            auto device = bluetoothRequest->mutable_discover_bluetooth()->add_observed_devices();
            device->set_device_id(TestData::BobPhone);
            device->set_rssi(-20);
            unique_ptr<proxnet::protocol::Response> bluetoothResponse = dispatcher.Dispatch( move(bluetoothRequest) );
            const proxnet::protocol::DiscoveryResponse &bluetoothDiscovery = bluetoothResponse->discovery();
            REQUIRE( bluetoothDiscovery.channel() == proxnet::protocol::BLUETOOTH );
            REQUIRE( bluetoothDiscovery.scanned_device_count() == 1 );
            REQUIRE( bluetoothDiscovery.users_size() == 1 );
            REQUIRE( bluetoothDiscovery.users(0).estimated_distance_meters() == Approx(10) );
        }

        THEN("a custom GPS radius is validated") {
            unique_ptr<proxnet::protocol::Request> request = NewRequest("alice");
            request->mutable_discover_gps()->set_radius_meters(99);
            REQUIRE( DispatchError( dispatcher, move(request) ) == ErrorCode::ERROR_INVALID_VALUE );
        }

        THEN("discovery settings are served") {
            unique_ptr<proxnet::protocol::Request> request = NewRequest("bob");
            request->mutable_update_discovery_settings()->set_is_discoverable(false);
            unique_ptr<proxnet::protocol::Response> response = dispatcher.Dispatch( move(request) );
            REQUIRE( response->has_discovery_settings() );
            REQUIRE( ! response->discovery_settings().is_discoverable() );
            REQUIRE( response->discovery_settings().discovery_range_meters() == 5000 );
            REQUIRE( ! store->Load("bob")->discovery().isDiscoverable() );
        }

        THEN("invalid requests are refused") {
            unique_ptr<proxnet::protocol::Request> noVersion( new proxnet::protocol::Request() );
            noVersion->set_user_id("alice");
            noVersion->mutable_discover_wifi();
            REQUIRE( DispatchError( dispatcher, move(noVersion) ) == ErrorCode::ERROR_UNSUPPORTED );

            unique_ptr<proxnet::protocol::Request> noIdentity = NewRequest("");
            noIdentity->mutable_discover_wifi();
            REQUIRE( DispatchError( dispatcher, move(noIdentity) ) == ErrorCode::ERROR_UNAUTHORIZED );

            unique_ptr<proxnet::protocol::Request> noType = NewRequest("alice");
            REQUIRE( DispatchError( dispatcher, move(noType) ) == ErrorCode::ERROR_BAD_REQUEST );

            unique_ptr<proxnet::protocol::Request> noLocation = NewRequest("alice");
            noLocation->mutable_update_gps_signal();
            REQUIRE( DispatchError( dispatcher, move(noLocation) ) == ErrorCode::ERROR_INVALID_VALUE );

            unique_ptr<proxnet::protocol::Request> unknownUser = NewRequest("nobody");
            unknownUser->mutable_get_signal_status();
            REQUIRE( DispatchError( dispatcher, move(unknownUser) ) == ErrorCode::ERROR_NOT_FOUND );
        }
    }

    GIVEN("A dispatcher of a remote peer") {
        shared_ptr<TestConfig> config( new TestConfig() );
        shared_ptr<InMemorySignalStore> store( new InMemorySignalStore() );
        shared_ptr<InMemoryRelationshipOracle> oracle( new InMemoryRelationshipOracle() );
        shared_ptr<IRateLimiter> limiter( new FixedWindowRateLimiter(
            config->rateLimitMaxRequests(), config->rateLimitWindow(), SystemClock() ) );
        store->Store(TestData::Alice);
        shared_ptr<IProximityMethods> engine( new ProximityEngine(config, store, oracle, limiter) );
        shared_ptr<IAuthenticator> authenticator( new TrustedFrontendAuthenticator(false) );
        IncomingRequestDispatcher dispatcher( engine, authenticator, "192.168.1.20", config->defaultRadiusMeters() );

        THEN("asserted identities are not trusted") {
            unique_ptr<proxnet::protocol::Request> request = NewRequest("alice");
            request->mutable_get_signal_status();
            REQUIRE( DispatchError( dispatcher, move(request) ) == ErrorCode::ERROR_UNAUTHORIZED );
        }
    }
}



SCENARIO("ProtoBuf client interface", "[messaging]")
{
    GIVEN("A client using an in-process dispatcher") {
        shared_ptr<TestConfig> config( new TestConfig() );
        shared_ptr<InMemorySignalStore> store( new InMemorySignalStore() );
        shared_ptr<InMemoryRelationshipOracle> oracle( new InMemoryRelationshipOracle() );
        TestClock clock(TestData::Now);
        shared_ptr<IRateLimiter> limiter( new FixedWindowRateLimiter(
            config->rateLimitMaxRequests(), config->rateLimitWindow(), clock.clock() ) );
        store->Store(TestData::Alice);
        store->Store(TestData::Bob);
        store->Store(TestData::Carol);

        shared_ptr<IProximityMethods> engine( new ProximityEngine( config, store, oracle, limiter, clock.clock() ) );
        shared_ptr<IAuthenticator> authenticator( new TrustedFrontendAuthenticator(true) );
        shared_ptr<IBlockingRequestDispatcher> dispatcher( new IncomingRequestDispatcher(
            engine, authenticator, "127.0.0.1", config->defaultRadiusMeters() ) );
        ProximityMethodsProtoBufClient client(dispatcher);

        THEN("operations are transparently served") {
            SignalAck ack = client.UpdateSignal( SignalUpdate::ForGps("alice", TestData::NewYork) );
            REQUIRE( ack.accepted );
            REQUIRE( ack.updatedAt == TestData::Now );
            client.UpdateSignal( SignalUpdate::ForGps("bob",   TestData::NearNewYork) );
            client.UpdateSignal( SignalUpdate::ForGps("carol", TestData::London) );

            DiscoveryResult result = client.Discover( DiscoveryRequest::ForGps("alice", 5000) );
            REQUIRE( result.context.channel == Channel::Gps );
            REQUIRE( result.totalFound == 1 );
            REQUIRE( result.users[0].id == "bob" );
            REQUIRE( *result.users[0].age == 31 );
            REQUIRE( *result.context.center == TestData::NewYork );

            UserRecord status = client.GetSignalStatus("carol");
            REQUIRE( status.gpsSignal()->location() == TestData::London );

            DiscoverabilityProfile profile = client.UpdateDiscoverySettings(
                "carol", shared_ptr<bool>(), make_shared<uint32_t>(20000) );
            REQUIRE( profile.rangeMeters() == 20000 );
        }

        THEN("error responses are thrown as errors with the same code") {
            try {
                client.Discover( DiscoveryRequest::ForGps("alice", 60000) );
                FAIL("Invalid radius was accepted");
            } catch (ProximityError &ex) {
                REQUIRE( ex.code() == ErrorCode::ERROR_INVALID_VALUE );
            }
        }
    }
}
