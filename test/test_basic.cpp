#include <cmath>
#include <limits>

#include <catch.hpp>
#include <easylogging++.h>

#include "auth.hpp"
#include "ratelimit.hpp"
#include "testdata.hpp"
#include "testimpls.hpp"

using namespace std;
using namespace ProxNet;



SCENARIO("Construction and behaviour of data holder types", "[basic]")
{
    GIVEN("A successful code block") {
        bool onExit     = false;
        bool onSuccess  = false;
        bool onError    = false;
        THEN("Scope guards work fine") {
            {
                scope_exit    ex(  [&onExit]    { onExit    = true; } );
                scope_error   err( [&onError]   { onError   = true; } );
                scope_success suc( [&onSuccess] { onSuccess = true; } );
            }
            REQUIRE( onExit );
            REQUIRE( onSuccess );
            REQUIRE( ! onError );
        }
    }

    GIVEN("A failing code block") {
        bool onExit     = false;
        bool onSuccess  = false;
        bool onError    = false;
        THEN("Scope guards work fine") {
            try {
                scope_exit    ex(  [&onExit]    { onExit    = true; } );
                scope_error   err( [&onError]   { onError   = true; } );
                scope_success suc( [&onSuccess] { onSuccess = true; } );
                throw runtime_error("Some error occured in this block");
            } catch (runtime_error &) {}
            REQUIRE( onExit );
            REQUIRE( ! onSuccess );
            REQUIRE( onError );
        }
    }

    GIVEN("A location object") {
        GpsLocation loc(1.0, 2.0);
        THEN("its fields are properly filled in") {
            REQUIRE( loc.latitude() == 1.0 );
            REQUIRE( loc.longitude() == 2.0 );
        }
        THEN("bounds are inclusive") {
            REQUIRE_NOTHROW( GpsLocation(90.0, 180.0) );
            REQUIRE_NOTHROW( GpsLocation(-90.0, -180.0) );
        }
    }

    GIVEN("A location object with invalid coordinates") {
        THEN("it will throw") {
            REQUIRE_THROWS_AS( GpsLocation(100.0, 1.0), ProximityError );
            REQUIRE_THROWS_AS( GpsLocation(1.0, -180.5), ProximityError );
            REQUIRE_THROWS_AS( GpsLocation( numeric_limits<double>::quiet_NaN(), 1.0 ), ProximityError );
        }
    }

    GIVEN("Network endpoints") {
        THEN("loopback addresses are recognized") {
            REQUIRE( NetworkEndpoint("127.0.0.1", 6666).isLoopback() );
            REQUIRE( NetworkEndpoint("::1", 6666).isLoopback() );
            REQUIRE( ! NetworkEndpoint("1.2.3.4", 6666).isLoopback() );
            REQUIRE( ! NetworkEndpoint("not an address", 6666).isLoopback() );
        }
    }

    GIVEN("Timestamps") {
        THEN("they are converted to Unix milliseconds and back") {
            REQUIRE( ToUnixMillis( FromUnixMillis(1700000000123) ) == 1700000000123 );
            REQUIRE( ToUnixMillis( FromUnixMillis(0) ) == 0 );
        }
    }

    GIVEN("Error codes") {
        THEN("only upstream failures and rate limiting are retryable") {
            REQUIRE( IsRetryable(ErrorCode::ERROR_UPSTREAM) );
            REQUIRE( IsRetryable(ErrorCode::ERROR_RATE_LIMITED) );
            REQUIRE( ! IsRetryable(ErrorCode::ERROR_INVALID_VALUE) );
            REQUIRE( ! IsRetryable(ErrorCode::ERROR_NOT_FOUND) );
            REQUIRE( ! IsRetryable(ErrorCode::ERROR_UNAUTHORIZED) );
            REQUIRE( ! IsRetryable(ErrorCode::ERROR_INTERNAL) );
        }
    }
}



SCENARIO("Hardware address normalization", "[basic]")
{
    GIVEN("Addresses in various accepted formats") {
        THEN("they are normalized into the uppercase colon separated form") {
            REQUIRE( NormalizeMacAddress("aa:bb:cc:dd:ee:ff") == "AA:BB:CC:DD:EE:FF" );
            REQUIRE( NormalizeMacAddress("AA-BB-CC-DD-EE-FF") == "AA:BB:CC:DD:EE:FF" );
            REQUIRE( NormalizeMacAddress("01:23:45:67:89:aB") == "01:23:45:67:89:AB" );
        }
    }

    GIVEN("Malformed addresses") {
        THEN("they are rejected") {
            REQUIRE( ! IsValidMacAddress("") );
            REQUIRE( ! IsValidMacAddress("AA:BB:CC:DD:EE") );
            REQUIRE( ! IsValidMacAddress("AA:BB:CC:DD:EE:FG") );
            REQUIRE( ! IsValidMacAddress("AABBCCDDEEFF") );
            REQUIRE( ! IsValidMacAddress("AA:BB:CC:DD:EE:FF:00") );
            REQUIRE( ! IsValidMacAddress("AA:BB-CC:DD-EE:FF") );
            REQUIRE( ! IsValidMacAddress("AA-BB-CC-DD-EE:FF") );
            REQUIRE( ! IsValidMacAddress("AA.BB.CC.DD.EE.FF") );
            REQUIRE_THROWS_AS( NormalizeMacAddress("my home wifi"), ProximityError );
        }
    }
}



SCENARIO("User records", "[basic]")
{
    GIVEN("A user without any signals") {
        UserRecord user(TestData::Alice);
        THEN("signal fields are missing") {
            REQUIRE( user.id() == "alice" );
            REQUIRE( ! user.gpsSignal() );
            REQUIRE( ! user.wifiSignal() );
            REQUIRE( ! user.bluetoothSignal() );
            REQUIRE( ! user.signalUpdatedAt(Channel::Gps) );
        }

        WHEN("signals are set") {
            Timestamp gpsTime  = TestData::Now;
            Timestamp wifiTime = TestData::Now + chrono::minutes(5);
            user.gpsSignal( make_shared<GpsSignal>(TestData::NewYork, gpsTime) );
            user.wifiSignal( make_shared<WifiSignal>(TestData::HomeNetwork, wifiTime) );

            THEN("update times are reported per channel") {
                REQUIRE( *user.signalUpdatedAt(Channel::Gps) == gpsTime );
                REQUIRE( *user.signalUpdatedAt(Channel::Wifi) == wifiTime );
                REQUIRE( ! user.signalUpdatedAt(Channel::Bluetooth) );
                REQUIRE( user.gpsSignal()->location() == TestData::NewYork );
            }
        }
    }

    GIVEN("Default discovery settings") {
        DiscoverabilityProfile profile;
        THEN("users are discoverable with the default range and everything shown") {
            REQUIRE( profile.isDiscoverable() );
            REQUIRE( profile.isActive() );
            REQUIRE( profile.rangeMeters() == DiscoverabilityProfile::DEFAULT_RANGE_METERS );
            REQUIRE( profile.privacy() == PrivacySettings(true, true, true) );
        }
    }
}



SCENARIO("Authentication of asserted identities", "[basic]")
{
    GIVEN("An authenticator in production mode") {
        TrustedFrontendAuthenticator authenticator(false);
        THEN("identities are accepted from loopback peers only") {
            REQUIRE( authenticator.Authenticate("alice", "127.0.0.1") == "alice" );
            REQUIRE_THROWS_AS( authenticator.Authenticate("alice", "10.1.2.3"), ProximityError );
            try {
                authenticator.Authenticate("alice", "10.1.2.3");
                FAIL("Untrusted peer was accepted");
            } catch (ProximityError &ex) {
                REQUIRE( ex.code() == ErrorCode::ERROR_UNAUTHORIZED );
            }
        }
        THEN("a missing identity is rejected") {
            REQUIRE_THROWS_AS( authenticator.Authenticate("", "127.0.0.1"), ProximityError );
        }
    }

    GIVEN("An authenticator in test mode") {
        TrustedFrontendAuthenticator authenticator(true);
        THEN("any peer may assert an identity") {
            REQUIRE( authenticator.Authenticate("bob", "10.1.2.3") == "bob" );
            REQUIRE_THROWS_AS( authenticator.Authenticate("", "10.1.2.3"), ProximityError );
        }
    }
}



SCENARIO("Fixed window rate limiting", "[basic]")
{
    GIVEN("A limiter allowing 3 requests per minute") {
        TestClock clock(TestData::Now);
        FixedWindowRateLimiter limiter( 3, chrono::minutes(1), clock.clock() );

        THEN("requests over the limit are refused within the window") {
            REQUIRE( limiter.TryAcquire("alice", Channel::Gps) );
            REQUIRE( limiter.TryAcquire("alice", Channel::Gps) );
            REQUIRE( limiter.TryAcquire("alice", Channel::Gps) );
            REQUIRE( ! limiter.TryAcquire("alice", Channel::Gps) );

            clock.advance( chrono::seconds(59) );
            REQUIRE( ! limiter.TryAcquire("alice", Channel::Gps) );

            clock.advance( chrono::seconds(1) );
            REQUIRE( limiter.TryAcquire("alice", Channel::Gps) );
        }

        THEN("users and channels are counted separately") {
            for (int idx = 0; idx < 3; ++idx)
                { REQUIRE( limiter.TryAcquire("alice", Channel::Gps) ); }
            REQUIRE( ! limiter.TryAcquire("alice", Channel::Gps) );
            REQUIRE( limiter.TryAcquire("alice", Channel::Wifi) );
            REQUIRE( limiter.TryAcquire("bob", Channel::Gps) );
            REQUIRE( limiter.trackedKeyCount() == 3 );
        }

        THEN("expired windows are purged") {
            REQUIRE( limiter.TryAcquire("alice", Channel::Gps) );
            REQUIRE( limiter.TryAcquire("bob", Channel::Wifi) );
            REQUIRE( limiter.trackedKeyCount() == 2 );

            clock.advance( chrono::minutes(2) );
            REQUIRE( limiter.TryAcquire("carol", Channel::Bluetooth) );
            REQUIRE( limiter.trackedKeyCount() == 1 );
        }
    }

    GIVEN("An invalid window") {
        THEN("the limiter cannot be created") {
            REQUIRE_THROWS_AS( FixedWindowRateLimiter( 3, chrono::milliseconds(0), SystemClock() ), ProximityError );
        }
    }
}
