#pragma once

#include <vector>

#include "domain/StrategyTypes.h"

namespace strategy {

// Effective trailing stop at `time` for one side. Segments of the other side are ignored.
//  - no segment for the side, or time before every segment: initialStop
//  - a segment covering time (inclusive bounds): its price
//  - time after every segment: the last segment's price, in input order
//  - time inside a gap: the segment with the largest endTime below time
double resolveStopPrice(domain::TimestampMs time,
                        domain::Side side,
                        double initialStop,
                        const std::vector<domain::StopSegment>& segments);

}  // namespace strategy
