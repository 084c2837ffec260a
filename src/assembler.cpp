#include <algorithm>
#include <unordered_set>

#include "assembler.hpp"

using namespace std;



namespace ProxNet
{



DiscoveryResult::DiscoveryResult(Channel channel) :
    users(), context(channel), timestamp(), message() {}



ResultAssembler::ResultAssembler(size_t maxResultCount) :
    _maxResultCount(maxResultCount) {}


DiscoveryResult ResultAssembler::Assemble( const CandidateSearch &search,
    vector<CandidateUser> &&candidates, Timestamp now ) const
{
    DiscoveryResult result( search.context.channel );
    result.context   = search.context;
    result.timestamp = now;
    result.message   = search.message;

    unordered_set<UserId> seenIds;
    for (auto &candidate : candidates)
    {
        if ( seenIds.insert(candidate.id).second )
            { result.users.push_back( move(candidate) ); }
    }

    if (search.context.channel == Channel::Gps)
    {
        stable_sort( result.users.begin(), result.users.end(),
            [] (const CandidateUser &one, const CandidateUser &other)
            {
                if (one.rankDistance != other.rankDistance)
                    { return one.rankDistance < other.rankDistance; }
                return one.id < other.id;
            } );
    }
    else
    {
        stable_sort( result.users.begin(), result.users.end(),
            [] (const CandidateUser &one, const CandidateUser &other)
            {
                if (one.rankUpdatedAt != other.rankUpdatedAt)
                    { return one.rankUpdatedAt > other.rankUpdatedAt; }
                return one.id < other.id;
            } );
    }

    if ( result.users.size() > _maxResultCount )
        { result.users.resize(_maxResultCount); }
    result.totalFound = result.users.size();

    return result;
}



} // namespace ProxNet
