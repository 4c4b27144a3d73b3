#include <gtest/gtest.h>

#include "analysis/nucleusassignment.hpp"

using namespace cellquant;

namespace {

RegionRecord regionAt(int id, double x, double y)
{
    RegionRecord r;
    r.id = id;
    r.area = 10;
    r.centroid = {x, y};
    return r;
}

NucleusRecord nucleusAt(int id, double x, double y)
{
    NucleusRecord n;
    n.id = id;
    n.area = 200;
    n.centroid = {x, y};
    return n;
}

} // namespace

TEST(NucleusAssignmentTest, NearestNucleusWins)
{
    std::vector<NucleusRecord> nuclei = {nucleusAt(1, 10, 10), nucleusAt(2, 90, 90)};
    std::vector<RegionRecord> regions = {regionAt(1, 15, 12), regionAt(2, 80, 70), regionAt(3, 49, 49)};

    std::vector<RegionRecord> out = NucleusAssignment::assign(regions, nuclei);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(*out[0].assignedNucleusId, 1);
    EXPECT_EQ(*out[1].assignedNucleusId, 2);
    EXPECT_EQ(*out[2].assignedNucleusId, 1);
    // геометрия не меняется
    EXPECT_EQ(out[1].centroid, regions[1].centroid);
}

TEST(NucleusAssignmentTest, TieGoesToFirstNucleus)
{
    std::vector<NucleusRecord> nuclei = {nucleusAt(1, 0, 0), nucleusAt(2, 20, 0)};
    std::vector<RegionRecord> out = NucleusAssignment::assign({regionAt(1, 10, 0)}, nuclei);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(*out[0].assignedNucleusId, 1);
}

TEST(NucleusAssignmentTest, AssignmentIsIdempotent)
{
    std::vector<NucleusRecord> nuclei = {nucleusAt(1, 10, 10), nucleusAt(2, 90, 90)};
    std::vector<RegionRecord> regions = {regionAt(1, 15, 12), regionAt(2, 80, 70)};

    std::vector<RegionRecord> once = NucleusAssignment::assign(regions, nuclei);
    std::vector<RegionRecord> twice = NucleusAssignment::assign(once, nuclei);
    ASSERT_EQ(once.size(), twice.size());
    for (size_t i = 0; i < once.size(); ++i)
        EXPECT_EQ(once[i].assignedNucleusId, twice[i].assignedNucleusId);
}

TEST(NucleusAssignmentTest, EmptyInputsGiveEmptyResult)
{
    EXPECT_TRUE(NucleusAssignment::assign({}, {nucleusAt(1, 0, 0)}).empty());
    EXPECT_TRUE(NucleusAssignment::assign({regionAt(1, 0, 0)}, {}).empty());
}

TEST(NucleusAssignmentTest, GroupDropsUnassignedAndOutOfRange)
{
    std::vector<RegionRecord> regions = {regionAt(1, 0, 0), regionAt(2, 0, 0), regionAt(3, 0, 0),
                                         regionAt(4, 0, 0), regionAt(5, 0, 0)};
    regions[0].assignedNucleusId = 1;
    regions[1].assignedNucleusId = 2;
    regions[2].assignedNucleusId = 2;
    regions[3].assignedNucleusId = 7;
    // regions[4] без ядра

    NucleusGroups groups = NucleusAssignment::group(regions, 3);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].size(), 1u);
    EXPECT_EQ(groups[1].size(), 2u);
    EXPECT_TRUE(groups[2].empty());
    EXPECT_EQ(groups[1][1]->id, 3);

    EXPECT_TRUE(NucleusAssignment::group(regions, 0).empty());
}
