#ifndef NUCLEUSASSIGNMENT_H
#define NUCLEUSASSIGNMENT_H

#include <vector>
#include "../segmentation/labelmapping.hpp"

namespace cellquant {

/// nucleus id - 1 -> objects assigned to that nucleus (non-owning).
using NucleusGroups = std::vector<std::vector<const RegionRecord*>>;

class NucleusAssignment {
public:
    /**
     * @brief Assign every region to the nucleus with the nearest centroid.
     *
     * Ties go to the first nucleus in order. If either set is empty the result
     * is empty: without nuclei no object can be attributed.
     * @return copies of the regions with assignedNucleusId set (nucleus id, 1-based)
     */
    static std::vector<RegionRecord> assign(const std::vector<RegionRecord>& regions,
                                            const std::vector<NucleusRecord>& nuclei);

    /**
     * @brief Bucket regions by assignedNucleusId into numNuclei lists.
     *
     * Regions without an id or with an id outside 1..numNuclei are dropped.
     * The pointers refer into @p regions, which must outlive the result.
     */
    static NucleusGroups group(const std::vector<RegionRecord>& regions, int numNuclei);
};

} // namespace cellquant

#endif // NUCLEUSASSIGNMENT_H
