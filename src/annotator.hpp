#ifndef __PROXNET_ANNOTATOR_H__
#define __PROXNET_ANNOTATOR_H__

#include <memory>
#include <vector>

#include "candidates.hpp"



namespace ProxNet
{



// A discovered user as presented to the requester. Fields hidden by the privacy
// settings of the candidate are null, hardware ids and credentials are never copied here.
struct CandidateUser
{
    UserId      id;
    std::string username;
    std::string firstName;
    std::string lastName;
    std::string profilePicture;
    std::string bio;
    std::vector<std::string> interests;
    bool        isOnline = false;

    std::shared_ptr<uint16_t>   age;
    std::shared_ptr<Timestamp>  lastSeen;
    std::shared_ptr<Distance>   distanceMeters;
    std::shared_ptr<Distance>   estimatedDistanceMeters;
    std::shared_ptr<Timestamp>  signalUpdatedAt;

    bool            isFriend = false;
    bool            hasPendingRequest = false;
    PrivacySettings visibility;

    // Ordering keys, kept even if the related fields are hidden, never sent to clients
    Distance    rankDistance = 0;
    Timestamp   rankUpdatedAt;
};



// Merge relationship flags and privacy gated field visibility into channel matches.
class PrivacyAnnotator
{
    std::shared_ptr<IRelationshipOracle> _oracle;

public:

    PrivacyAnnotator(std::shared_ptr<IRelationshipOracle> oracle);

    CandidateUser Annotate(const UserId &requesterId, const ProximityMatch &match) const;
    std::vector<CandidateUser> Annotate(const UserId &requesterId, const std::vector<ProximityMatch> &matches) const;
};



} // namespace ProxNet


#endif // __PROXNET_ANNOTATOR_H__
