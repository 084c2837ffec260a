#include <easylogging++.h>

#include "auth.hpp"

using namespace std;



namespace ProxNet
{



TrustedFrontendAuthenticator::TrustedFrontendAuthenticator(bool testMode) :
    _testMode(testMode)
{
    if (_testMode)
        { LOG(WARNING) << "Running in test mode, accepting asserted user ids from any peer"; }
}


UserId TrustedFrontendAuthenticator::Authenticate(const UserId &claimedUserId, const Address &remoteAddress) const
{
    if ( claimedUserId.empty() )
        { throw ProximityError(ErrorCode::ERROR_UNAUTHORIZED, "Missing user identity"); }

    if ( ! _testMode && ! NetworkEndpoint(remoteAddress, 0).isLoopback() )
    {
        LOG(WARNING) << "Rejected identity assertion for " << claimedUserId << " from untrusted peer " << remoteAddress;
        throw ProximityError(ErrorCode::ERROR_UNAUTHORIZED, "Identity assertions are accepted only from a trusted front end");
    }

    return claimedUserId;
}



} // namespace ProxNet
