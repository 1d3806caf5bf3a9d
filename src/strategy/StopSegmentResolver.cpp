#include "strategy/StopSegmentResolver.h"

namespace strategy {

double resolveStopPrice(domain::TimestampMs time,
                        domain::Side side,
                        double initialStop,
                        const std::vector<domain::StopSegment>& segments) {
    std::size_t relevant = 0;
    std::size_t before = 0;
    std::size_t after = 0;
    const domain::StopSegment* last = nullptr;
    const domain::StopSegment* endedBefore = nullptr;

    for (const auto& segment : segments) {
        if (segment.side != side) {
            continue;
        }
        ++relevant;
        last = &segment;

        if (time >= segment.startTime && time <= segment.endTime) {
            return segment.price;
        }
        if (time < segment.startTime) {
            ++before;
        }
        if (time > segment.endTime) {
            ++after;
            if (endedBefore == nullptr || segment.endTime > endedBefore->endTime) {
                endedBefore = &segment;
            }
        }
    }

    if (relevant == 0 || before == relevant) {
        return initialStop;
    }
    if (after == relevant) {
        return last->price;
    }
    return endedBefore != nullptr ? endedBefore->price : initialStop;
}

}  // namespace strategy
