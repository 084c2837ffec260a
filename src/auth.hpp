#ifndef __PROXNET_AUTH_H__
#define __PROXNET_AUTH_H__

#include "basic.hpp"



namespace ProxNet
{



// Establish the identity of the caller of a request. Sessions and credentials are
// handled by an authenticating front end, this only decides whether its assertion can be trusted.
class IAuthenticator
{
public:

    virtual ~IAuthenticator() {}

    // Return the verified user id or throw ERROR_UNAUTHORIZED
    virtual UserId Authenticate(const UserId &claimedUserId, const Address &remoteAddress) const = 0;
};



// Trust user ids asserted by a gateway running on the same host.
// In test mode ids are accepted from any peer.
class TrustedFrontendAuthenticator : public IAuthenticator
{
    bool _testMode;

public:

    explicit TrustedFrontendAuthenticator(bool testMode);

    UserId Authenticate(const UserId &claimedUserId, const Address &remoteAddress) const override;
};



} // namespace ProxNet


#endif // __PROXNET_AUTH_H__
