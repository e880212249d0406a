#include "test_base.hpp"

class AirportDatabaseTest : public TestBase
{
};

TEST_F(AirportDatabaseTest, ShippedDatasetValidatesCommonCodes)
{
    EXPECT_GT(airports_->size(), 50u);
    EXPECT_TRUE(airports_->isValidAirportCode("FRA"));
    EXPECT_TRUE(airports_->isValidAirportCode("jfk"));
    EXPECT_FALSE(airports_->isValidAirportCode("XYZ"));
    EXPECT_FALSE(airports_->isValidAirportCode("FRAN"));

    auto fra = airports_->lookup("FRA");
    ASSERT_TRUE(fra.has_value());
    EXPECT_EQ(fra->icao, "EDDF");
    EXPECT_EQ(fra->city, "Frankfurt");
}

TEST_F(AirportDatabaseTest, KnownLabelsAreNotAirports)
{
    for (const char *label : {"DEP", "ARR", "GTE", "SEQ", "PNR", "JAN", "MAX"})
        EXPECT_FALSE(airports_->isValidAirportCode(label)) << label;
}

TEST_F(AirportDatabaseTest, LoadFromJsonSkipsMalformedEntries)
{
    AirportDatabase db;
    nlohmann::json data = nlohmann::json::array({
        {{"iata", "TST"}, {"icao", "XTST"}, {"name", "Test Field"}, {"city", "Testville"}, {"country", "Nowhere"}},
        {{"iata", "T1"}, {"name", "Too short"}},
        {{"iata", "12A"}, {"name", "Digits"}},
        "not an object"});

    ASSERT_TRUE(db.loadFromJson(data));
    EXPECT_EQ(db.size(), 1u);
    EXPECT_TRUE(db.isValidAirportCode("TST"));
    EXPECT_FALSE(db.loadFromJson(nlohmann::json::object()));
    EXPECT_EQ(db.size(), 1u);
}

TEST_F(AirportDatabaseTest, MissingFileKeepsCurrentEntries)
{
    AirportDatabase db;
    ASSERT_TRUE(db.loadFromJson(nlohmann::json::array({{{"iata", "TST"}}})));
    EXPECT_FALSE(db.loadFromFile(getTestFilesDir() + "/missing.json"));
    EXPECT_FALSE(db.loadFromFile(createFile("broken.json", "[{\"iata\": ")));
    EXPECT_TRUE(db.isValidAirportCode("TST"));
}

TEST_F(AirportDatabaseTest, SearchRanksExactCodeFirst)
{
    auto results = airports_->search("fra");
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results.front().iata, "FRA");

    auto by_city = airports_->search("London", 5);
    ASSERT_FALSE(by_city.empty());
    EXPECT_EQ(by_city.front().city, "London");

    EXPECT_TRUE(airports_->search("x").empty());
    EXPECT_EQ(airports_->search("a", 3).size(), 0u);
    EXPECT_LE(airports_->search("an", 3).size(), 3u);
}
