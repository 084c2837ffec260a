#include <cmath>

#include <easylogging++.h>

#include "annotator.hpp"

using namespace std;



namespace ProxNet
{



PrivacyAnnotator::PrivacyAnnotator(shared_ptr<IRelationshipOracle> oracle) :
    _oracle(oracle)
{
    if (_oracle == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No relationship oracle instantiated"); }
}


CandidateUser PrivacyAnnotator::Annotate(const UserId &requesterId, const ProximityMatch &match) const
{
    const UserRecord &user = match.user;
    const UserDisplayInfo &display = user.display();
    const PrivacySettings &privacy = user.discovery().privacy();

    CandidateUser result;
    result.id               = user.id();
    result.username         = display.username;
    result.firstName        = display.firstName;
    result.lastName         = display.lastName;
    result.profilePicture   = display.profilePicture;
    result.bio              = display.bio;
    result.interests        = display.interests;
    result.isOnline         = display.isOnline;
    result.visibility       = privacy;

    result.isFriend          = _oracle->IsFriend(requesterId, user.id());
    result.hasPendingRequest = _oracle->HasPendingRequest(requesterId, user.id()) ||
                               _oracle->HasPendingRequest(user.id(), requesterId);

    if ( privacy.showAge() && display.age > 0 )
        { result.age = make_shared<uint16_t>(display.age); }

    if ( privacy.showLastSeen() )
    {
        result.lastSeen = make_shared<Timestamp>(display.lastSeen);
        result.signalUpdatedAt = match.signalUpdatedAt;
    }

    // Distances are shown rounded to whole meters
    if ( privacy.showLocation() )
    {
        if (match.distanceMeters)
            { result.distanceMeters = make_shared<Distance>( round(*match.distanceMeters) ); }
        if (match.estimatedDistanceMeters)
            { result.estimatedDistanceMeters = match.estimatedDistanceMeters; }
    }

    if (match.distanceMeters)
        { result.rankDistance = *match.distanceMeters; }
    if (match.signalUpdatedAt)
        { result.rankUpdatedAt = *match.signalUpdatedAt; }

    return result;
}


vector<CandidateUser> PrivacyAnnotator::Annotate(const UserId &requesterId, const vector<ProximityMatch> &matches) const
{
    vector<CandidateUser> result;
    result.reserve( matches.size() );
    for (const auto &match : matches)
        { result.push_back( Annotate(requesterId, match) ); }
    LOG(TRACE) << "Annotated " << result.size() << " candidates for " << requesterId;
    return result;
}



} // namespace ProxNet
