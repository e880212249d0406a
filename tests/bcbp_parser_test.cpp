#include "test_base.hpp"
#include "core/bcbp_parser.hpp"

namespace
{
    const std::string SINGLE_LEG = "M1MUSTERMANN/MAX      EABC123 FRAJFKLH 1234 014Y012A0001 100";
}

class BcbpParserTest : public TestBase
{
protected:
    CalendarDate reference_{2026, 1, 10};
};

TEST_F(BcbpParserTest, ParsesMandatoryItemsOfSingleLeg)
{
    ASSERT_EQ(SINGLE_LEG.size(), BcbpParser::HEADER_SIZE + BcbpParser::LEG_SIZE);

    auto payload = BcbpParser::parse(SINGLE_LEG);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload->number_of_legs, 1);
    EXPECT_EQ(payload->last_name, "MUSTERMANN");
    EXPECT_EQ(payload->first_name, "MAX");
    EXPECT_EQ(payload->electronic_ticket, 'E');
    ASSERT_EQ(payload->legs.size(), 1u);

    const BcbpLeg &leg = payload->legs.front();
    EXPECT_EQ(leg.booking_reference, "ABC123");
    EXPECT_EQ(leg.from_airport, "FRA");
    EXPECT_EQ(leg.to_airport, "JFK");
    EXPECT_EQ(leg.carrier, "LH");
    EXPECT_EQ(leg.flight_number, "1234");
    EXPECT_EQ(leg.day_of_year, 14);
    EXPECT_EQ(leg.compartment, 'Y');
    EXPECT_EQ(leg.seat, "12A");
    EXPECT_EQ(leg.check_in_sequence, "0001");
    EXPECT_EQ(leg.conditional_size, 0);
}

TEST_F(BcbpParserTest, CandidateCarriesExactValuesWithHighConfidence)
{
    BcbpParser parser(*airports_, reference_);
    auto payload = BcbpParser::parse(SINGLE_LEG);
    ASSERT_TRUE(payload.has_value());

    ExtractionCandidate candidate = parser.buildCandidate(*payload, "PDF417", SINGLE_LEG);
    EXPECT_EQ(candidate.method.toString(), "barcode:PDF417");
    ASSERT_EQ(candidate.flight_segments.size(), 1u);

    const FlightSegment &segment = candidate.flight_segments.front();
    EXPECT_EQ(segment.flight_number, "LH1234");
    EXPECT_EQ(segment.departure_airport, "FRA");
    EXPECT_EQ(segment.arrival_airport, "JFK");
    ASSERT_TRUE(segment.seat.has_value());
    EXPECT_EQ(*segment.seat, "12A");
    ASSERT_TRUE(segment.flight_date.has_value());
    EXPECT_EQ(segment.flight_date->toIso(), "2026-01-14");
    ASSERT_TRUE(segment.airline.has_value());
    EXPECT_EQ(*segment.airline, "Lufthansa");

    ASSERT_TRUE(candidate.booking_reference.has_value());
    EXPECT_EQ(*candidate.booking_reference, "ABC123");
    ASSERT_EQ(candidate.passengers.size(), 1u);
    EXPECT_EQ(candidate.passengers.front().last_name, "MUSTERMANN");

    for (const char *field : {FieldNames::FLIGHT_NUMBER, FieldNames::DEPARTURE_AIRPORT,
                              FieldNames::ARRIVAL_AIRPORT, FieldNames::BOOKING_REFERENCE,
                              FieldNames::SEAT_NUMBER})
    {
        EXPECT_GE(candidate.confidenceOf(field), 0.9) << field;
    }
    EXPECT_DOUBLE_EQ(candidate.confidenceOf(FieldNames::FLIGHT_DATE), BcbpParser::DATE_CONFIDENCE);
    EXPECT_TRUE(candidate.warnings.empty());
}

TEST_F(BcbpParserTest, ParsesRepeatedLegBlocks)
{
    const std::string payload_text =
        "M2MUSTERMANN/MAX      EABC123 FRAJFKLH 1234 014Y012A0001 100"
        "ABC123 JFKLAXLH 0456 015Y003C0002 100";

    auto payload = BcbpParser::parse(payload_text);
    ASSERT_TRUE(payload.has_value());
    ASSERT_EQ(payload->legs.size(), 2u);
    EXPECT_EQ(payload->legs[1].from_airport, "JFK");
    EXPECT_EQ(payload->legs[1].to_airport, "LAX");
    EXPECT_EQ(payload->legs[1].flight_number, "456");
    EXPECT_EQ(payload->legs[1].seat, "3C");

    BcbpParser parser(*airports_, reference_);
    ExtractionCandidate candidate = parser.buildCandidate(*payload, "Aztec", payload_text);
    ASSERT_EQ(candidate.flight_segments.size(), 2u);
    EXPECT_EQ(candidate.flight_segments[1].flight_number, "LH456");
    ASSERT_TRUE(candidate.flight_segments[1].flight_date.has_value());
    EXPECT_EQ(candidate.flight_segments[1].flight_date->toIso(), "2026-01-15");
}

TEST_F(BcbpParserTest, SkipsConditionalSectionBetweenLegs)
{
    // First leg announces a 4 character conditional block
    const std::string payload_text =
        "M2MUSTERMANN/MAX      EABC123 FRAJFKLH 1234 014Y012A0001 104XXXX"
        "ABC123 JFKLAXLH 0456 015Y003C0002 100";

    auto payload = BcbpParser::parse(payload_text);
    ASSERT_TRUE(payload.has_value());
    ASSERT_EQ(payload->legs.size(), 2u);
    EXPECT_EQ(payload->legs[0].conditional_size, 4);
    EXPECT_EQ(payload->legs[1].from_airport, "JFK");
}

TEST_F(BcbpParserTest, MalformedPayloadsYieldNothing)
{
    EXPECT_FALSE(BcbpParser::parse("").has_value());
    EXPECT_FALSE(BcbpParser::parse("https://example.com/boarding").has_value());
    // Truncated leg
    EXPECT_FALSE(BcbpParser::parse(SINGLE_LEG.substr(0, 50)).has_value());
    // Wrong format code
    EXPECT_FALSE(BcbpParser::parse("X" + SINGLE_LEG.substr(1)).has_value());

    // Garbled flight number
    std::string garbled = SINGLE_LEG;
    garbled.replace(23 + 16, 5, "12?4 ");
    EXPECT_FALSE(BcbpParser::parse(garbled).has_value());

    // Julian date out of range
    std::string bad_date = SINGLE_LEG;
    bad_date.replace(23 + 21, 3, "400");
    EXPECT_FALSE(BcbpParser::parse(bad_date).has_value());

    // Second leg announced but missing
    EXPECT_FALSE(BcbpParser::parse("M2" + SINGLE_LEG.substr(2)).has_value());
}

TEST_F(BcbpParserTest, UnknownAirportDropsOnlyThatField)
{
    std::string payload_text = SINGLE_LEG;
    payload_text.replace(23 + 10, 3, "QQQ");

    auto payload = BcbpParser::parse(payload_text);
    ASSERT_TRUE(payload.has_value());

    BcbpParser parser(*airports_, reference_);
    ExtractionCandidate candidate = parser.buildCandidate(*payload, "PDF417", payload_text);
    ASSERT_EQ(candidate.flight_segments.size(), 1u);
    EXPECT_EQ(candidate.flight_segments.front().departure_airport, "FRA");
    EXPECT_TRUE(candidate.flight_segments.front().arrival_airport.empty());
    EXPECT_EQ(candidate.confidenceOf(FieldNames::ARRIVAL_AIRPORT), 0.0);
    EXPECT_EQ(candidate.flight_segments.front().flight_number, "LH1234");
    EXPECT_FALSE(candidate.warnings.empty());
}
