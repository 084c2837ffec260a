#include <chrono>
#include <thread>

#include <asio.hpp>
#include <catch.hpp>

#include "server.hpp"
#include "testimpls.hpp"
#include "testdata.hpp"

#include <easylogging++.h>

using namespace std;
using namespace ProxNet;
using namespace asio::ip;



static asio::error_code SendRawAndAwaitClose(TcpPort port, const string &bytes)
{
    tcp::socket socket( Reactor::Instance().AsioService() );
    socket.connect( tcp::endpoint( make_address("127.0.0.1"), port ) );
    asio::write( socket, asio::buffer(bytes) );

    char byte;
    asio::error_code error;
    asio::read( socket, asio::buffer(&byte, 1), error );
    return error;
}



SCENARIO("Frame headers", "[network]")
{
    GIVEN("Headers with little endian body sizes") {
        THEN("sizes are decoded") {
            REQUIRE( DecodeFrameBodySize( string("\x0D\x00\x00\x00\x00", 5) ) == 0 );
            REQUIRE( DecodeFrameBodySize( string("\x0D\x2A\x01\x00\x00", 5) ) == 298 );
            REQUIRE( DecodeFrameBodySize( string("\x0D\x00\x00\x20\x00", 5) ) == 2 * 1024 * 1024 );
            REQUIRE( DecodeFrameBodySize( string("\x0D\xFF\xFF\xFF\xFF", 5) ) == 0xFFFFFFFFu );
        }
        THEN("truncated headers are rejected") {
            REQUIRE_THROWS_AS( DecodeFrameBodySize( string("\x0D\x00\x00", 3) ), ProximityError );
        }
    }
}



SCENARIO("Client-Server requests and responses with TCP networking", "[network]")
{
    GIVEN("A proximity service and a failing one served on TCP")
    {
        shared_ptr<TestConfig> config( new TestConfig() );
        config->testMode = false;
        shared_ptr<InMemorySignalStore> store( new InMemorySignalStore() );
        shared_ptr<InMemoryRelationshipOracle> oracle( new InMemoryRelationshipOracle() );
        shared_ptr<IRateLimiter> limiter( new FixedWindowRateLimiter(
            config->rateLimitMaxRequests(), config->rateLimitWindow(), SystemClock() ) );
        store->Store(TestData::Alice);
        store->Store(TestData::Bob);
        store->Store(TestData::Carol);
        oracle->AddFriendship("alice", "bob");

        shared_ptr<IProximityMethods> engine( new ProximityEngine(config, store, oracle, limiter) );
        shared_ptr<IAuthenticator> authenticator( new TrustedFrontendAuthenticator( config->isTestMode() ) );
        shared_ptr<IBlockingRequestDispatcherFactory> dispatcherFactory(
            new ProximityDispatcherFactory(config, engine, authenticator) );
        shared_ptr<DispatchingTcpServer> tcpServer = DispatchingTcpServer::Create(
            config->servicePort(), dispatcherFactory );
        tcpServer->StartListening();

        TcpPort failingPort = config->servicePort() + 1;
        shared_ptr<IProximityMethods> failingEngine( new ProximityEngine( config,
            shared_ptr<ISignalStore>( new FailingSignalStore() ), oracle, limiter ) );
        shared_ptr<DispatchingTcpServer> failingServer = DispatchingTcpServer::Create( failingPort,
            shared_ptr<IBlockingRequestDispatcherFactory>(
                new ProximityDispatcherFactory(config, failingEngine, authenticator) ) );
        failingServer->StartListening();

        TcpPort slowPort = config->servicePort() + 2;
        shared_ptr<DispatchingTcpServer> slowServer = DispatchingTcpServer::Create( slowPort,
            shared_ptr<IBlockingRequestDispatcherFactory>( new StaticBlockingDispatcherFactory(
                shared_ptr<IBlockingRequestDispatcher>( new DelayedResponseDispatcher( chrono::milliseconds(300) ) ) ) ) );
        slowServer->StartListening();

        thread reactorMainThread( [] { Reactor::Instance().RunWorker("ReactorMain"); } );
        reactorMainThread.detach();

        THEN("It serves raw messages and transparent clients")
        {
            NetworkEndpoint serviceEndpoint( "127.0.0.1", config->servicePort() );
            {
                shared_ptr<IProtoBufChannel> clientChannel( new AsyncProtoBufTcpChannel(serviceEndpoint) );

                unique_ptr<proxnet::protocol::Message> requestMsg( new proxnet::protocol::Message() );
                requestMsg->set_id(42);
                proxnet::protocol::Request *request = requestMsg->mutable_request();
                request->set_version({1,0,0});
                request->set_user_id("alice");
                request->mutable_update_gps_signal()->set_allocated_location(
                    Converter::ToProtoBuf(TestData::NewYork) );
                clientChannel->SendMessage( move(requestMsg), asio::use_future ).get();

                unique_ptr<proxnet::protocol::Message> msgReceived( clientChannel->ReceiveMessage(asio::use_future).get() );
                REQUIRE( msgReceived );
                REQUIRE( msgReceived->id() == 42 );
                REQUIRE( msgReceived->response().status() == proxnet::protocol::STATUS_OK );
                REQUIRE( msgReceived->response().update_signal().accepted() );

                unique_ptr<proxnet::protocol::Message> invalidMsg( new proxnet::protocol::Message() );
                invalidMsg->set_id(43);
                invalidMsg->mutable_request()->set_version({1,0,0});
                invalidMsg->mutable_request()->set_user_id("alice");
                invalidMsg->mutable_request()->mutable_discover_gps()->set_radius_meters(50001);
                clientChannel->SendMessage( move(invalidMsg), asio::use_future ).get();

                unique_ptr<proxnet::protocol::Message> errorReceived( clientChannel->ReceiveMessage(asio::use_future).get() );
                REQUIRE( errorReceived );
                REQUIRE( errorReceived->id() == 43 );
                REQUIRE( errorReceived->response().status() == proxnet::protocol::ERROR_INVALID_VALUE );
                REQUIRE( ! errorReceived->response().details().empty() );
            }

            {
                shared_ptr<IProximityMethods> client = ConnectTo(serviceEndpoint);
                client->UpdateSignal( SignalUpdate::ForGps("bob",   TestData::NearNewYork) );
                client->UpdateSignal( SignalUpdate::ForGps("carol", TestData::London) );

                DiscoveryResult result = client->Discover( DiscoveryRequest::ForGps("alice", 5000) );
                REQUIRE( result.totalFound == 1 );
                REQUIRE( result.users.size() == 1 );
                REQUIRE( result.users[0].id == "bob" );
                REQUIRE( result.users[0].isFriend );
                REQUIRE( *result.users[0].distanceMeters > 1500 );

                try {
                    client->GetSignalStatus("nobody");
                    FAIL("Unknown user was served");
                } catch (ProximityError &ex) {
                    REQUIRE( ex.code() == ErrorCode::ERROR_NOT_FOUND );
                }
            }

            {
                shared_ptr<IProximityMethods> client = ConnectTo( NetworkEndpoint("127.0.0.1", failingPort) );
                try {
                    client->Discover( DiscoveryRequest::ForWifi("alice") );
                    FAIL("Failing store was served");
                } catch (ProximityError &ex) {
                    REQUIRE( ex.code() == ErrorCode::ERROR_UPSTREAM );
                    REQUIRE( IsRetryable( ex.code() ) );
                    // Storage details are not disclosed to clients
                    REQUIRE( string( ex.what() ).find("sqlite") == string::npos );
                }
            }

            {
                // Oversized and empty frames end the session without a response
                asio::error_code error = SendRawAndAwaitClose( config->servicePort(), string("\x0D\x00\x00\x20\x00", 5) );
                REQUIRE( static_cast<bool>(error) );
                error = SendRawAndAwaitClose( config->servicePort(), string("\x0D\x00\x00\x00\x00", 5) );
                REQUIRE( static_cast<bool>(error) );

                shared_ptr<IProximityMethods> client = ConnectTo(serviceEndpoint);
                REQUIRE_NOTHROW( client->GetSignalStatus("alice") );
            }

            {
                shared_ptr<IProtoBufChannel> channel( new AsyncProtoBufTcpChannel(
                    NetworkEndpoint("127.0.0.1", slowPort) ) );
                shared_ptr<ProtoBufClientSession> session = ProtoBufClientSession::Create(channel);
                session->StartMessageLoop();

                unique_ptr<proxnet::protocol::Request> request( new proxnet::protocol::Request() );
                request->set_version({1,0,0});
                request->set_user_id("alice");
                request->mutable_get_signal_status();

                NetworkDispatcher impatient( session, chrono::milliseconds(50) );
                try {
                    impatient.Dispatch( unique_ptr<proxnet::protocol::Request>( new proxnet::protocol::Request(*request) ) );
                    FAIL("Slow response was not timed out");
                } catch (ProximityError &ex) {
                    REQUIRE( ex.code() == ErrorCode::ERROR_UPSTREAM );
                }
                REQUIRE( session->pendingRequestCount() == 0 );

                // Late response of the timed out request is dropped, the session keeps working
                NetworkDispatcher patient( session, chrono::seconds(5) );
                unique_ptr<proxnet::protocol::Response> response = patient.Dispatch( move(request) );
                REQUIRE( response );
                REQUIRE( response->status() == proxnet::protocol::STATUS_OK );
                REQUIRE( session->pendingRequestCount() == 0 );
            }
        }

        Reactor::Instance().Shutdown();
    }
}
