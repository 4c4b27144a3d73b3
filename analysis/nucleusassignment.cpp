#include "nucleusassignment.hpp"

#include <limits>
#include <utility>

namespace cellquant {

std::vector<RegionRecord> NucleusAssignment::assign(const std::vector<RegionRecord>& regions,
                                                    const std::vector<NucleusRecord>& nuclei)
{
    std::vector<RegionRecord> assigned;
    if (regions.empty() || nuclei.empty())
        return assigned;

    assigned.reserve(regions.size());
    for (const auto& r : regions) {
        int best = 0;
        double bestDist = std::numeric_limits<double>::infinity();
        for (size_t n = 0; n < nuclei.size(); ++n) {
            const double d = cv::norm(r.centroid - nuclei[n].centroid);
            if (d < bestDist) {
                bestDist = d;
                best = static_cast<int>(n);
            }
        }
        RegionRecord copy = r;
        copy.assignedNucleusId = nuclei[best].id;
        assigned.push_back(std::move(copy));
    }
    return assigned;
}

NucleusGroups NucleusAssignment::group(const std::vector<RegionRecord>& regions, int numNuclei)
{
    NucleusGroups groups(numNuclei > 0 ? numNuclei : 0);
    for (const auto& r : regions) {
        if (!r.assignedNucleusId)
            continue;
        const int id = *r.assignedNucleusId;
        if (id <= 0 || id > numNuclei)
            continue;
        groups[id - 1].push_back(&r);
    }
    return groups;
}

} // namespace cellquant
