#include <gtest/gtest.h>

#include <stdexcept>

#include "roadwatch/track_association.hpp"
#include "test_helpers.hpp"

using namespace roadwatch;
using namespace roadwatch::test;

TEST(TrackAssociator, ExtendsTrackWithBestOverlap) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});

    auto ids = assoc.update(1, ObjectClass::VEHICLE,
                            {vehicle(50, 0, 100, 100, "car", 0.95f), vehicle(10, 0, 100, 100, "car", 0.6f)});

    ASSERT_EQ(ids.size(), 2u);
    const Track* first = assoc.table().find(1);
    ASSERT_NE(first, nullptr);
    ASSERT_EQ(first->observations.size(), 2u);
    EXPECT_FLOAT_EQ(first->last().bbox.x, 10.0f);
    const Track* spawned = assoc.table().find(2);
    ASSERT_NE(spawned, nullptr);
    EXPECT_FLOAT_EQ(spawned->last().bbox.x, 50.0f);
}

TEST(TrackAssociator, TieGoesToLowestTrackId) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100), vehicle(100, 0, 100, 100)});

    auto ids = assoc.update(1, ObjectClass::VEHICLE, {vehicle(50, 0, 100, 100)});

    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], 1);
    EXPECT_EQ(assoc.table().find(2)->consecutive_misses, 1);
}

TEST(TrackAssociator, DetectionBelowFloorStartsNewTrack) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    auto ids = assoc.update(1, ObjectClass::VEHICLE, {vehicle(80, 0, 100, 100)});

    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], 2);
    EXPECT_EQ(assoc.table().size(), 2u);
}

TEST(TrackAssociator, ClassesAreAssociatedSeparately) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    auto ids = assoc.update(0, ObjectClass::PERSON, {person(0, 0, 100, 100)});

    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(assoc.table().find(ids[0])->object_class, ObjectClass::PERSON);
    EXPECT_EQ(assoc.table().find(1)->consecutive_misses, 0);
}

TEST(TrackAssociator, MarksLostThenPurges) {
    PipelineConfig cfg;
    cfg.max_missed_frames = 2;
    cfg.lost_retention_frames = 3;
    TrackAssociator assoc(cfg);
    assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});

    for (int64_t f = 1; f <= 2; ++f) assoc.update(f, ObjectClass::VEHICLE, {});
    EXPECT_EQ(assoc.table().find(1)->status, TrackStatus::ACTIVE);

    assoc.update(3, ObjectClass::VEHICLE, {});
    EXPECT_EQ(assoc.table().find(1)->status, TrackStatus::LOST);

    assoc.update(4, ObjectClass::VEHICLE, {});
    assoc.update(5, ObjectClass::VEHICLE, {});
    ASSERT_NE(assoc.table().find(1), nullptr);

    assoc.update(6, ObjectClass::VEHICLE, {});
    EXPECT_EQ(assoc.table().find(1), nullptr);
}

TEST(TrackAssociator, LostTracksAreNotRematched) {
    PipelineConfig cfg;
    cfg.max_missed_frames = 1;
    TrackAssociator assoc(cfg);
    assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    assoc.update(1, ObjectClass::VEHICLE, {});
    assoc.update(2, ObjectClass::VEHICLE, {});
    ASSERT_EQ(assoc.table().find(1)->status, TrackStatus::LOST);

    auto ids = assoc.update(3, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], 2);
}

TEST(TrackAssociator, GapLongerThanMissLimitStartsNewTrack) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(1, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});

    auto ids = assoc.update(50, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});

    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], 2);
    EXPECT_EQ(assoc.table().find(1), nullptr);
    EXPECT_EQ(assoc.table().find(2)->observations.size(), 1u);
}

TEST(TrackAssociator, ShortGapCountsMissedFrames) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(1, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    assoc.update(4, ObjectClass::VEHICLE, {});
    EXPECT_EQ(assoc.table().find(1)->consecutive_misses, 3);
    EXPECT_EQ(assoc.table().find(1)->status, TrackStatus::ACTIVE);

    auto ids = assoc.update(6, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], 1);
    EXPECT_EQ(assoc.table().find(1)->consecutive_misses, 0);
}

TEST(TrackAssociator, RejectsRepeatedFrame) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(4, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    EXPECT_THROW(assoc.update(4, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)}), std::invalid_argument);
}

TEST(TrackAssociator, VehicleTypeFromLabel) {
    TrackAssociator assoc(PipelineConfig{});
    auto ids = assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 60, 120, "motorcycle")});
    EXPECT_EQ(assoc.table().find(ids[0])->vehicle_type, VehicleType::MOTORCYCLE);
}

TEST(TrackAssociator, ResetDropsTracksButKeepsIdsIncreasing) {
    TrackAssociator assoc(PipelineConfig{});
    assoc.update(0, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    assoc.reset();
    EXPECT_EQ(assoc.table().size(), 0u);

    auto ids = assoc.update(1, ObjectClass::VEHICLE, {vehicle(0, 0, 100, 100)});
    EXPECT_EQ(ids[0], 2);
}
