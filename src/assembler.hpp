#ifndef __PROXNET_ASSEMBLER_H__
#define __PROXNET_ASSEMBLER_H__

#include <vector>

#include "annotator.hpp"



namespace ProxNet
{



struct DiscoveryResult
{
    std::vector<CandidateUser>  users;
    size_t                      totalFound = 0;
    ChannelContext              context;
    Timestamp                   timestamp;
    std::string                 message;

    explicit DiscoveryResult(Channel channel);
};



// Deduplicate, order and truncate annotated candidates into the final response.
// GPS results are ordered by distance, short range channels by signal recency.
class ResultAssembler
{
    size_t _maxResultCount;

public:

    explicit ResultAssembler(size_t maxResultCount);

    DiscoveryResult Assemble( const CandidateSearch &search,
                              std::vector<CandidateUser> &&candidates, Timestamp now ) const;
};



} // namespace ProxNet


#endif // __PROXNET_ASSEMBLER_H__
