/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionConfigTests
#include <boost/test/unit_test.hpp>

#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionContext.hpp"
#include "mocks/MockCollisionWorld.hpp"
#include "utils/JsonReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace CosmicEngine;

BOOST_AUTO_TEST_SUITE(CollisionConfigTests)

BOOST_AUTO_TEST_CASE(TestDefaults)
{
    CollisionConfig config;
    BOOST_CHECK_EQUAL(config.cellSize, 64.0f);
    BOOST_CHECK_EQUAL(config.maxChecksPerFrame, 5000u);
    BOOST_CHECK_EQUAL(config.queryPadding, 100.0f);
    BOOST_CHECK_CLOSE(config.separationBuffer, 0.1f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestLoadFromString)
{
    CollisionConfig config;
    BOOST_REQUIRE(config.loadFromString(R"({
        "collision": {
            "cellSize": 128,
            "maxChecksPerFrame": 250,
            "queryPadding": 0,
            "separationBuffer": 0.5
        }
    })"));

    BOOST_CHECK_EQUAL(config.cellSize, 128.0f);
    BOOST_CHECK_EQUAL(config.maxChecksPerFrame, 250u);
    BOOST_CHECK_EQUAL(config.queryPadding, 0.0f);
    BOOST_CHECK_EQUAL(config.separationBuffer, 0.5f);
}

BOOST_AUTO_TEST_CASE(TestPartialOverrideKeepsOtherFields)
{
    CollisionConfig config;
    BOOST_REQUIRE(config.loadFromString(R"({"collision": {"cellSize": 32}, "audio": {"volume": 3}})"));

    CollisionConfig expected;
    expected.cellSize = 32.0f;
    BOOST_CHECK(config == expected);
}

BOOST_AUTO_TEST_CASE(TestUnknownKeysIgnored)
{
    CollisionConfig config;
    BOOST_CHECK(config.loadFromString(R"({"collision": {"gravity": 9.8, "queryPadding": 10}})"));
    BOOST_CHECK_EQUAL(config.queryPadding, 10.0f);
    BOOST_CHECK_EQUAL(config.cellSize, CollisionConfig::DEFAULT_CELL_SIZE);
}

BOOST_AUTO_TEST_CASE(TestInvalidValuesLeaveFieldsUnchanged)
{
    CollisionConfig config;
    BOOST_CHECK(config.loadFromString(R"({
        "collision": {
            "cellSize": 0,
            "maxChecksPerFrame": 0.5,
            "queryPadding": -1,
            "separationBuffer": "lots"
        }
    })"));
    BOOST_CHECK(config == CollisionConfig());

    BOOST_CHECK(config.loadFromString(R"({"collision": {"cellSize": -64, "maxChecksPerFrame": true}})"));
    BOOST_CHECK(config == CollisionConfig());

    // Values that do not fit the field type, and fractional counts
    BOOST_CHECK(config.loadFromString(R"({
        "collision": {
            "cellSize": 1e300,
            "maxChecksPerFrame": 1e30,
            "queryPadding": 1e39,
            "separationBuffer": 3.5e38
        }
    })"));
    BOOST_CHECK(config == CollisionConfig());

    BOOST_CHECK(config.loadFromString(R"({"collision": {"maxChecksPerFrame": 2.5}})"));
    BOOST_CHECK_EQUAL(config.maxChecksPerFrame, CollisionConfig::DEFAULT_MAX_CHECKS_PER_FRAME);
    BOOST_CHECK(config.loadFromString(R"({"collision": {"maxChecksPerFrame": 18446744073709551615}})"));
    BOOST_CHECK_EQUAL(config.maxChecksPerFrame, CollisionConfig::DEFAULT_MAX_CHECKS_PER_FRAME);

    // Large but representable values are still taken
    BOOST_CHECK(config.loadFromString(R"({"collision": {"maxChecksPerFrame": 1e9, "cellSize": 1e30}})"));
    BOOST_CHECK_EQUAL(config.maxChecksPerFrame, 1000000000u);
    BOOST_CHECK_CLOSE(config.cellSize, 1e30f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestMissingSectionFails)
{
    CollisionConfig config;
    config.cellSize = 16.0f;

    BOOST_CHECK(!config.loadFromString(R"({"physics": {"cellSize": 8}})"));
    BOOST_CHECK(!config.loadFromString(R"({"collision": [1, 2]})"));
    BOOST_CHECK(!config.loadFromString("[]"));
    BOOST_CHECK_EQUAL(config.cellSize, 16.0f);
}

BOOST_AUTO_TEST_CASE(TestMalformedJsonFails)
{
    CollisionConfig config;
    BOOST_CHECK(!config.loadFromString(R"({"collision": {"cellSize": 32,}})"));
    BOOST_CHECK(!config.loadFromString(""));
    BOOST_CHECK(config == CollisionConfig());
}

BOOST_AUTO_TEST_CASE(TestApplyParsedDocument)
{
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"collision": {"separationBuffer": 0.25}})"));

    CollisionConfig config;
    BOOST_CHECK(config.apply(reader.getRoot()));
    BOOST_CHECK_EQUAL(config.separationBuffer, 0.25f);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile)
{
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "cosmic_collision_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"collision": {"maxChecksPerFrame": 42}})";
    }

    CollisionConfig config;
    BOOST_CHECK(config.loadFromFile(path.string()));
    BOOST_CHECK_EQUAL(config.maxChecksPerFrame, 42u);
    std::filesystem::remove(path);

    BOOST_CHECK(!config.loadFromFile(path.string()));
    BOOST_CHECK_EQUAL(config.maxChecksPerFrame, 42u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CollisionContextTests)

BOOST_AUTO_TEST_CASE(TestContextAppliesConfig)
{
    MockCollisionWorld world;
    CollisionConfig config;
    config.cellSize = 32.0f;
    config.maxChecksPerFrame = 7;
    config.separationBuffer = 0.0f;

    CollisionContext context(world, config, 99u);
    BOOST_CHECK_EQUAL(context.getSpatialHash().getCellSize(), 32.0f);
    BOOST_CHECK_EQUAL(context.getCollisionSystem().getMaxChecksPerFrame(), 7u);
    BOOST_CHECK_EQUAL(context.getResolver().getSeparationBuffer(), 0.0f);
    BOOST_CHECK(context.getConfig() == config);
}

BOOST_AUTO_TEST_CASE(TestContextTickResolvesContacts)
{
    MockCollisionWorld world;
    world.setEntity(1, Vector2D(0.0f, 0.0f), Vector2D(), 1.0f);
    world.setEntity(2, Vector2D(15.0f, 0.0f), Vector2D(), 1.0f);

    CollisionContext context(world, CollisionConfig(), 5u);
    CollisionSystem& system = context.getCollisionSystem();
    CollisionResolver& resolver = context.getResolver();
    system.onCollision([&resolver](const CollisionInfo& info) { resolver.resolveCollision(info); });

    BOOST_REQUIRE(system.attachCollider(1, Collider::circle(10.0f, Layer_Player, CollisionMasks::Player)));
    BOOST_REQUIRE(system.attachCollider(2, Collider::circle(10.0f, Layer_Enemy, CollisionMasks::Enemy)));

    context.update();
    BOOST_CHECK_EQUAL(context.getTickCount(), 1u);
    BOOST_CHECK_EQUAL(system.getCollisions().size(), 1u);

    // Separated by overlap plus buffer, so the next tick is clean
    const float gap = world.getPosition(2)->getX() - world.getPosition(1)->getX();
    BOOST_CHECK(gap > 20.0f);

    context.update();
    BOOST_CHECK_EQUAL(context.getTickCount(), 2u);
    BOOST_CHECK(system.getCollisions().empty());
}

BOOST_AUTO_TEST_CASE(TestSeparatePairOutsideTick)
{
    MockCollisionWorld world;
    world.setEntity(1, Vector2D(0.0f, 0.0f), Vector2D(), 1.0f);
    world.setEntity(2, Vector2D(15.0f, 0.0f), Vector2D(), 3.0f);
    world.setEntity(3, Vector2D(100.0f, 0.0f), Vector2D(), 1.0f);
    world.setEntity(4, Vector2D(112.0f, 0.0f), Vector2D(), 1.0f);

    CollisionConfig config;
    config.separationBuffer = 0.0f;
    CollisionContext context(world, config, 5u);
    CollisionSystem& system = context.getCollisionSystem();

    BOOST_REQUIRE(system.attachCollider(1, Collider::circle(10.0f, Layer_Player, CollisionMasks::Player)));
    BOOST_REQUIRE(system.attachCollider(2, Collider::circle(10.0f, Layer_Enemy, CollisionMasks::Enemy)));
    BOOST_REQUIRE(system.attachCollider(3, Collider::circle(5.0f, Layer_Player, CollisionMasks::Player)));
    BOOST_REQUIRE(system.attachCollider(4, Collider::rect(20.0f, 20.0f, Layer_Wall, CollisionMasks::Wall)));
    system.processPendingCommands();

    // Circle-circle: overlap 5, the lighter entity takes three quarters of it
    BOOST_CHECK(context.separatePair(2, 1));
    BOOST_CHECK_CLOSE(world.getPosition(1)->getX(), -3.75f, 0.001f);
    BOOST_CHECK_CLOSE(world.getPosition(2)->getX(), 16.25f, 0.001f);
    BOOST_CHECK(!context.separatePair(1, 2));

    // Circle-rect: the circle reaches 3 past the rect's left edge at 102
    BOOST_CHECK(context.separatePair(3, 4));
    BOOST_CHECK_CLOSE(world.getPosition(3)->getX(), 98.5f, 0.001f);
    BOOST_CHECK_CLOSE(world.getPosition(4)->getX(), 113.5f, 0.001f);
    BOOST_CHECK(!context.separatePair(3, 4));

    BOOST_CHECK(!context.separatePair(1, 99));
}

BOOST_AUTO_TEST_SUITE_END()
