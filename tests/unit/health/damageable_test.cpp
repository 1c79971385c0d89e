#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <vector>

#include "lhe/health/damageable.hpp"
#include "lhe/health/reaction_rule_builder.hpp"
#include "lhe/health/reaction_table.hpp"

using namespace lhe::health;
using lhe::foundation::ErrorCode;

namespace {

class DamageableTest : public ::testing::Test {
protected:
    void SetUp() override {
        // (Armour, Impact) is capped; (Armour, Slash) bleeds through.
        ASSERT_TRUE(ReactionRuleBuilder()
                        .ForHealth(health_class::Armour)
                        .ForDamage(damage_class::Impact)
                        .Transform(reactions::Capped())
                        .RegisterIn(table_)
                        .hasValue());
        ASSERT_TRUE(ReactionRuleBuilder()
                        .ForHealth(health_class::Armour)
                        .ForDamage(damage_class::Slash)
                        .Transform(reactions::Identity())
                        .RegisterIn(table_)
                        .hasValue());
        table_.Freeze();
    }

    Damageable make(std::vector<HealthBarSegment> segments) {
        auto result = Damageable::Create(std::move(segments), table_);
        EXPECT_TRUE(result.hasValue());
        return std::move(result).value();
    }

    ReactionTable table_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction and queries
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageableTest, SingleSegmentConstruction) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 100.0f), table_);
    EXPECT_EQ(damageable.SegmentCount(), 1u);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 100.0f);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 100.0f);
    EXPECT_FALSE(damageable.IsDead());
}

TEST_F(DamageableTest, CreateRejectsEmptySegmentList) {
    auto result = Damageable::Create({}, table_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(DamageableTest, AggregatesAreLiveSums) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 50.0f),
                            HealthBarSegment(health_class::Flesh, 70.0f, 100.0f)});
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 120.0f);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 150.0f);

    damageable.Damage(30.0f, damage_class::Fire);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 90.0f);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 150.0f);
}

TEST_F(DamageableTest, IndexedAndIteratedAccess) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 50.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});

    EXPECT_EQ(damageable[0].Classification(), health_class::Armour);
    EXPECT_EQ(damageable[1].Classification(), health_class::Flesh);

    std::vector<HealthClassification> order;
    for (const auto& segment : damageable) {
        order.push_back(segment.Classification());
    }
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], health_class::Armour);
    EXPECT_EQ(order[1], health_class::Flesh);

    EXPECT_EQ(damageable.Segments().size(), 2u);
}

TEST_F(DamageableTest, SegmentAtChecksBounds) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 10.0f), table_);

    auto first = damageable.SegmentAt(0);
    ASSERT_TRUE(first.hasValue());
    EXPECT_FLOAT_EQ(first.value().CurrentHitpoints(), 10.0f);

    auto missing = damageable.SegmentAt(1);
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::OutOfRange);
}

// ═══════════════════════════════════════════════════════════════════════════
// Damage resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageableTest, CappedReactionDoesNotBleedThrough) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 400.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});

    damageable.Damage(600.0f, damage_class::Impact);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 100.0f);
}

TEST_F(DamageableTest, UncappedReactionBleedsIntoNextSegment) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 50.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});

    damageable.Damage(80.0f, damage_class::Slash);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 70.0f);
}

TEST_F(DamageableTest, MissingRuleAppliesFullDamageWithBleedThrough) {
    auto damageable = make({HealthBarSegment(health_class::Shield, 30.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});

    damageable.Damage(45.0f, damage_class::Fire);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 85.0f);
}

TEST_F(DamageableTest, DamageWithinFirstSegmentStopsThere) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 50.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});

    damageable.Damage(20.0f, damage_class::Slash);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 30.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 100.0f);
}

TEST_F(DamageableTest, DepletedSegmentsAreSkipped) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 0.0f, 50.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});

    // Impact is capped on Armour, but Armour is already empty.
    damageable.Damage(40.0f, damage_class::Impact);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 60.0f);
}

TEST_F(DamageableTest, ExcessPastLastSegmentIsDiscarded) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 10.0f),
                            HealthBarSegment(health_class::Flesh, 20.0f)});

    damageable.Damage(1000.0f, damage_class::Slash);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 0.0f);
    EXPECT_TRUE(damageable.IsDead());
}

TEST_F(DamageableTest, TransformedLeftoverCarriesToNextReaction) {
    ReactionTable table;
    // Shield doubles fire; flesh halves it.
    ASSERT_TRUE(table.Register({{health_class::Shield}, {damage_class::Fire},
                                reactions::Scaled(2.0f)})
                    .hasValue());
    ASSERT_TRUE(table.Register({{health_class::Flesh}, {damage_class::Fire},
                                reactions::Scaled(0.5f)})
                    .hasValue());

    auto result = Damageable::Create({HealthBarSegment(health_class::Shield, 30.0f),
                                      HealthBarSegment(health_class::Flesh, 100.0f)},
                                     table);
    ASSERT_TRUE(result.hasValue());
    auto damageable = std::move(result).value();

    // 25 -> 50 on the shield (30 absorbed, 20 left) -> 10 on flesh.
    damageable.Damage(25.0f, damage_class::Fire);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 90.0f);
}

TEST_F(DamageableTest, NegativeAndNaNDamageChangeNothing) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 100.0f), table_);
    int damaged = 0;
    damageable.onDamaged().connect([&](float, DamageClassification) { ++damaged; });

    damageable.Damage(-50.0f, damage_class::Slash);
    damageable.Damage(std::numeric_limits<float>::quiet_NaN(), damage_class::Slash);
    damageable.Damage(0.0f, damage_class::Slash);

    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 100.0f);
    EXPECT_EQ(damaged, 0);
}

TEST_F(DamageableTest, ImmuneSegmentStopsDamage) {
    ReactionTable table;
    ASSERT_TRUE(table.Register({{health_class::Shield}, {damage_class::Pierce},
                                reactions::Immune()})
                    .hasValue());
    auto result = Damageable::Create({HealthBarSegment(health_class::Shield, 10.0f),
                                      HealthBarSegment(health_class::Flesh, 10.0f)},
                                     table);
    ASSERT_TRUE(result.hasValue());
    auto damageable = std::move(result).value();

    damageable.Damage(500.0f, damage_class::Pierce);

    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 20.0f);
}

TEST_F(DamageableTest, OverFullSegmentAbsorbsFromItsCurrentValue) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 100.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});
    damageable.ScaleMaxHitpoints(0.5f);

    damageable.Damage(120.0f, damage_class::Slash);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 0.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 80.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageableTest, DeathFiresOnceOnTransitionToZero) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 50.0f), table_);
    int deaths = 0;
    damageable.onDeath().connect([&] { ++deaths; });

    damageable.Damage(30.0f, damage_class::Slash);
    EXPECT_EQ(deaths, 0);

    damageable.Damage(30.0f, damage_class::Slash);
    EXPECT_EQ(deaths, 1);

    damageable.Damage(30.0f, damage_class::Slash);
    damageable.Damage(100.0f, damage_class::Fire);
    EXPECT_EQ(deaths, 1);
}

TEST_F(DamageableTest, DeathRearmsAfterHeal) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 50.0f), table_);
    int deaths = 0;
    damageable.onDeath().connect([&] { ++deaths; });

    damageable.Damage(50.0f, damage_class::Slash);
    damageable.Heal(10.0f);
    EXPECT_FALSE(damageable.IsDead());
    damageable.Damage(50.0f, damage_class::Slash);

    EXPECT_EQ(deaths, 2);
}

TEST_F(DamageableTest, CappedDamageOnOuterLayerDoesNotKill) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 400.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});
    int deaths = 0;
    damageable.onDeath().connect([&] { ++deaths; });

    damageable.Damage(600.0f, damage_class::Impact);

    EXPECT_EQ(deaths, 0);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 100.0f);
}

TEST_F(DamageableTest, DisconnectedObserverIsNotCalled) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 10.0f), table_);
    int deaths = 0;
    auto id = damageable.onDeath().connect([&] { ++deaths; });
    damageable.onDeath().disconnect(id);

    damageable.Damage(10.0f, damage_class::Slash);

    EXPECT_TRUE(damageable.IsDead());
    EXPECT_EQ(deaths, 0);
}

TEST_F(DamageableTest, DamagedAndDepletedNotifications) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 50.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f)});
    float reported = 0.0f;
    DamageClassification reportedClass;
    std::vector<std::size_t> depleted;
    damageable.onDamaged().connect([&](float amount, DamageClassification cls) {
        reported = amount;
        reportedClass = cls;
    });
    damageable.onSegmentDepleted().connect([&](std::size_t index) {
        depleted.push_back(index);
    });

    damageable.Damage(80.0f, damage_class::Slash);

    EXPECT_FLOAT_EQ(reported, 80.0f);
    EXPECT_EQ(reportedClass, damage_class::Slash);
    ASSERT_EQ(depleted.size(), 1u);
    EXPECT_EQ(depleted[0], 0u);
}

TEST_F(DamageableTest, DepletionObserverMayRemoveSegments) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 10.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f),
                            HealthBarSegment(health_class::Shield, 5.0f)});
    int deaths = 0;
    damageable.onDeath().connect([&] { ++deaths; });
    damageable.onSegmentDepleted().connect([&](std::size_t) {
        EXPECT_TRUE(damageable.RemoveLast().hasValue());
    });

    damageable.Damage(10.0f, damage_class::Slash);

    EXPECT_EQ(damageable.SegmentCount(), 2u);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 100.0f);
    EXPECT_EQ(deaths, 0);
}

TEST_F(DamageableTest, NotificationsAreDecidedBeforeObserversRun) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 10.0f),
                            HealthBarSegment(health_class::Flesh, 10.0f)});
    std::vector<std::size_t> depleted;
    int deaths = 0;
    damageable.onSegmentDepleted().connect([&](std::size_t index) {
        depleted.push_back(index);
        (void)damageable.RemoveLast();
    });
    damageable.onDeath().connect([&] { ++deaths; });

    damageable.Damage(50.0f, damage_class::Slash);

    ASSERT_EQ(depleted.size(), 2u);
    EXPECT_EQ(depleted[0], 0u);
    EXPECT_EQ(depleted[1], 1u);
    EXPECT_EQ(damageable.SegmentCount(), 1u);
    EXPECT_EQ(deaths, 1);
}

TEST_F(DamageableTest, DeathObserverMayDestroyTheDamageable) {
    auto damageable = std::make_unique<Damageable>(
        HealthBarSegment(health_class::Flesh, 10.0f), table_);
    int deaths = 0;
    damageable->onDeath().connect([&] {
        ++deaths;
        damageable.reset();
    });

    damageable->Damage(25.0f, damage_class::Fire);

    EXPECT_EQ(deaths, 1);
    EXPECT_EQ(damageable, nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// Healing
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageableTest, HealFillsFrontToBack) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 10.0f, 50.0f),
                            HealthBarSegment(health_class::Flesh, 20.0f, 100.0f)});

    damageable.Heal(60.0f);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 50.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 40.0f);
}

TEST_F(DamageableTest, HealNeverExceedsMaximum) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 10.0f, 50.0f),
                            HealthBarSegment(health_class::Flesh, 20.0f, 100.0f)});
    float restored = 0.0f;
    damageable.onHealed().connect([&](float amount) { restored += amount; });

    for (float amount : {5.0f, 1000.0f, 0.0f, 37.5f, -10.0f}) {
        damageable.Heal(amount);
        EXPECT_LE(damageable.CurrentHealth(), damageable.MaximumHealth());
        for (const auto& segment : damageable) {
            EXPECT_LE(segment.CurrentHitpoints(), segment.MaximumHitpoints());
        }
    }
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 150.0f);
    EXPECT_FLOAT_EQ(restored, 120.0f);
}

TEST_F(DamageableTest, HealClampsOverFullSegments) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 100.0f),
                            HealthBarSegment(health_class::Flesh, 10.0f, 100.0f)});
    damageable.ScaleMaxHitpoints(0.5f);
    ASSERT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 100.0f);

    damageable.Heal(5.0f);

    EXPECT_FLOAT_EQ(damageable[0].CurrentHitpoints(), 50.0f);
    EXPECT_FLOAT_EQ(damageable[1].CurrentHitpoints(), 15.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Scaling
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageableTest, ScaleAppliesToEverySegment) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 20.0f, 40.0f),
                            HealthBarSegment(health_class::Flesh, 50.0f, 100.0f)});

    damageable.Scale(2.0f);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 140.0f);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 280.0f);

    damageable.ScaleCurrentHitpoints(0.5f);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 70.0f);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 280.0f);

    damageable.ScaleMaxHitpoints(0.25f);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 70.0f);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 70.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Structure
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageableTest, AppendAddsToEnd) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 100.0f), table_);

    auto result = damageable.Append(std::make_unique<HealthBarSegment>(health_class::Shield, 25.0f));
    ASSERT_TRUE(result.hasValue());
    damageable.Append(HealthBarSegment(health_class::Armour, 5.0f));

    ASSERT_EQ(damageable.SegmentCount(), 3u);
    EXPECT_EQ(damageable[1].Classification(), health_class::Shield);
    EXPECT_EQ(damageable[2].Classification(), health_class::Armour);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 130.0f);
}

TEST_F(DamageableTest, AppendNullFailsAndLeavesSegmentsUnchanged) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 100.0f), table_);

    auto result = damageable.Append(std::unique_ptr<HealthBarSegment>());

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(damageable.SegmentCount(), 1u);
    EXPECT_FLOAT_EQ(damageable.MaximumHealth(), 100.0f);
}

TEST_F(DamageableTest, RemoveLastOnSingleSegmentFails) {
    Damageable damageable(HealthBarSegment(health_class::Flesh, 100.0f), table_);

    auto result = damageable.RemoveLast();

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::OutOfRange);
    EXPECT_EQ(damageable.SegmentCount(), 1u);
}

TEST_F(DamageableTest, RemoveLastShortensByOne) {
    auto damageable = make({HealthBarSegment(health_class::Armour, 50.0f),
                            HealthBarSegment(health_class::Flesh, 100.0f),
                            HealthBarSegment(health_class::Shield, 10.0f)});

    ASSERT_TRUE(damageable.RemoveLast().hasValue());
    EXPECT_EQ(damageable.SegmentCount(), 2u);
    EXPECT_EQ(damageable[1].Classification(), health_class::Flesh);

    ASSERT_TRUE(damageable.RemoveLast().hasValue());
    EXPECT_EQ(damageable.SegmentCount(), 1u);
    EXPECT_TRUE(damageable.RemoveLast().hasError());
    EXPECT_EQ(damageable.SegmentCount(), 1u);
}

TEST_F(DamageableTest, MovedDamageableKeepsObservers) {
    Damageable source(HealthBarSegment(health_class::Flesh, 10.0f), table_);
    int deaths = 0;
    source.onDeath().connect([&] { ++deaths; });

    Damageable moved(std::move(source));
    moved.Damage(10.0f, damage_class::Slash);

    EXPECT_EQ(deaths, 1);
}

TEST(DamageableGlobalTableTest, DefaultsToGlobalTable) {
    // Nothing is registered for (Flesh, Pierce) in the global table by
    // default, so damage passes through unchanged.
    Damageable damageable(HealthBarSegment(health_class::Flesh, 40.0f));
    damageable.Damage(15.0f, damage_class::Pierce);
    EXPECT_FLOAT_EQ(damageable.CurrentHealth(), 25.0f);
}
