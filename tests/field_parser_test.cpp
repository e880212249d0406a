#include "test_base.hpp"
#include "test_fakes.hpp"
#include "core/field_parser.hpp"

class FieldParserTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        parser_ = std::make_unique<FieldParser>(FieldParserConfig::defaults(), *airports_);
    }

    std::unique_ptr<FieldParser> parser_;
};

TEST_F(FieldParserTest, ParsesCompleteBoardingPassText)
{
    ExtractionCandidate candidate = parser_->parse(sampleBoardingPassText());

    EXPECT_EQ(candidate.method.toString(), "ocr");
    ASSERT_EQ(candidate.flight_segments.size(), 1u);
    ASSERT_EQ(candidate.passengers.size(), 1u);

    const FlightSegment &segment = candidate.flight_segments.front();
    EXPECT_EQ(segment.flight_number, "LH400");
    ASSERT_TRUE(segment.airline.has_value());
    EXPECT_EQ(*segment.airline, "Lufthansa");
    EXPECT_EQ(segment.departure_airport, "FRA");
    EXPECT_EQ(segment.arrival_airport, "JFK");
    ASSERT_TRUE(segment.flight_date.has_value());
    EXPECT_EQ(segment.flight_date->toIso(), "2026-01-14");
    EXPECT_EQ(segment.departure_time.value_or(""), "10:15");
    EXPECT_EQ(segment.arrival_time.value_or(""), "13:05");
    EXPECT_EQ(segment.boarding_time.value_or(""), "09:30");
    EXPECT_EQ(segment.seat.value_or(""), "12A");

    EXPECT_EQ(candidate.passengers.front().last_name, "MUSTERMANN");
    EXPECT_EQ(candidate.passengers.front().first_name, "MAX");
    EXPECT_EQ(candidate.booking_reference.value_or(""), "ABC123");

    EXPECT_DOUBLE_EQ(candidate.confidenceOf(FieldNames::FLIGHT_NUMBER), FieldParser::FLIGHT_KNOWN_CARRIER_CONFIDENCE);
    EXPECT_DOUBLE_EQ(candidate.confidenceOf(FieldNames::DEPARTURE_AIRPORT), FieldParser::AIRPORT_KEYWORD_CONFIDENCE);
    EXPECT_DOUBLE_EQ(candidate.confidenceOf(FieldNames::FLIGHT_DATE), FieldParser::DATE_KEYWORD_CONFIDENCE);
    EXPECT_DOUBLE_EQ(candidate.confidenceOf(FieldNames::PASSENGER_NAME), FieldParser::NAME_KEYWORD_CONFIDENCE);
    EXPECT_DOUBLE_EQ(candidate.confidenceOf(FieldNames::BOOKING_REFERENCE), FieldParser::BOOKING_KEYWORD_CONFIDENCE);
    EXPECT_DOUBLE_EQ(candidate.confidenceOf(FieldNames::SEAT_NUMBER), FieldParser::SEAT_KEYWORD_CONFIDENCE);
    EXPECT_GE(candidate.fieldCount(), 10u);
}

TEST_F(FieldParserTest, EmptyTextYieldsEmptyCandidate)
{
    ExtractionCandidate candidate = parser_->parse("");
    EXPECT_EQ(candidate.fieldCount(), 0u);
    ASSERT_EQ(candidate.flight_segments.size(), 1u);
    ASSERT_EQ(candidate.passengers.size(), 1u);
    EXPECT_TRUE(candidate.passengers.front().empty());
}

TEST_F(FieldParserTest, GateIsNotMistakenForFlight)
{
    std::vector<std::string> lines = {"GATE B22", "FLIGHT BA 117"};
    auto flight = parser_->findFlightNumber(lines);
    ASSERT_TRUE(flight.has_value());
    EXPECT_EQ(flight->value, "BA117");
    EXPECT_DOUBLE_EQ(flight->confidence, FieldParser::FLIGHT_KNOWN_CARRIER_CONFIDENCE);
}

TEST_F(FieldParserTest, UnknownCarrierGetsLowerConfidence)
{
    std::vector<std::string> lines = {"FLIGHT QX 0042"};
    auto flight = parser_->findFlightNumber(lines);
    ASSERT_TRUE(flight.has_value());
    EXPECT_EQ(flight->value, "QX42");
    EXPECT_DOUBLE_EQ(flight->confidence, FieldParser::FLIGHT_CONFIDENCE);
}

TEST_F(FieldParserTest, BlocklistedCodesAreNeverAirports)
{
    AirportDatabase airports;
    ASSERT_TRUE(airports.loadFromJson(nlohmann::json::array({
        {{"iata", "GTE"}, {"name", "Groote Eylandt"}},
        {{"iata", "SEQ"}, {"name", "Sungai Pakning"}},
        {{"iata", "FRA"}, {"name", "Frankfurt"}},
        {{"iata", "JFK"}, {"name", "John F Kennedy"}},
    })));
    FieldParser parser(FieldParserConfig::defaults(), airports);

    EXPECT_FALSE(parser.isAcceptedAirportCode("GTE"));
    EXPECT_FALSE(parser.isAcceptedAirportCode("SEQ"));
    EXPECT_TRUE(parser.isAcceptedAirportCode("FRA"));

    std::vector<std::string> lines = {"GTE 22 SEQ 014", "FRA JFK"};
    auto result = parser.findAirports(lines);
    ASSERT_TRUE(result.departure.has_value());
    ASSERT_TRUE(result.arrival.has_value());
    EXPECT_EQ(result.departure->value, "FRA");
    EXPECT_EQ(result.arrival->value, "JFK");
    EXPECT_DOUBLE_EQ(result.departure->confidence, FieldParser::AIRPORT_POSITIONAL_CONFIDENCE);
}

TEST_F(FieldParserTest, CodesMissingFromDatasetAreIgnored)
{
    EXPECT_FALSE(parser_->isAcceptedAirportCode("QQQ"));
    EXPECT_FALSE(parser_->isAcceptedAirportCode("FR1"));
    EXPECT_FALSE(parser_->isAcceptedAirportCode("FRAN"));
}

TEST_F(FieldParserTest, ArrivalBeforeDepartureIsDiscarded)
{
    std::vector<std::string> lines = {"DEPARTURE 14:00", "ARRIVAL 09:30"};
    auto times = parser_->findTimes(lines);
    ASSERT_TRUE(times.departure.has_value());
    EXPECT_EQ(times.departure->value, "14:00");
    EXPECT_FALSE(times.arrival.has_value());
}

TEST_F(FieldParserTest, NextDayArrivalIsKept)
{
    std::vector<std::string> lines = {"DEPARTURE 22:30", "ARRIVAL 06:10 +1"};
    auto times = parser_->findTimes(lines);
    ASSERT_TRUE(times.arrival.has_value());
    EXPECT_EQ(times.arrival->value, "06:10");
    EXPECT_EQ(times.departure->value, "22:30");
}

TEST_F(FieldParserTest, MultiWordNamesKeepTheirSpaces)
{
    std::vector<std::string> lines = {"PASSENGER", "DUENAS SANABRIA/DIANA LORENA"};
    auto name = parser_->findPassengerName(lines);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->passenger.last_name, "DUENAS SANABRIA");
    EXPECT_EQ(name->passenger.first_name, "DIANA LORENA");
    EXPECT_DOUBLE_EQ(name->confidence, FieldParser::NAME_KEYWORD_CONFIDENCE);
}

TEST_F(FieldParserTest, RouteIsNotAName)
{
    std::vector<std::string> lines = {"FRA/JFK", "SMITH/JOHN"};
    auto name = parser_->findPassengerName(lines);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->passenger.last_name, "SMITH");
    EXPECT_EQ(name->passenger.first_name, "JOHN");
    EXPECT_DOUBLE_EQ(name->confidence, FieldParser::NAME_CONFIDENCE);
}

TEST_F(FieldParserTest, BookingFallbackSkipsFlightAndName)
{
    Passenger passenger;
    passenger.last_name = "MUSTERMANN";
    passenger.first_name = "MAX";

    std::vector<std::string> lines = {"FLIGHT LH400", "MUSTERMANN/MAX", "X7QP2K"};
    auto booking = parser_->findBookingReference(lines, "LH400", passenger);
    ASSERT_TRUE(booking.has_value());
    EXPECT_EQ(booking->value, "X7QP2K");
    EXPECT_DOUBLE_EQ(booking->confidence, FieldParser::BOOKING_CONFIDENCE);
}

TEST_F(FieldParserTest, BookingIgnoresNumbersAndKeywords)
{
    std::vector<std::string> lines = {"PNR 123456 GATE"};
    EXPECT_FALSE(parser_->findBookingReference(lines, "", Passenger()).has_value());
}

TEST_F(FieldParserTest, SeatFallbackSkipsGateLines)
{
    std::vector<std::string> lines = {"GATE 12 A", "ROW 014C"};
    auto seat = parser_->findSeat(lines);
    ASSERT_TRUE(seat.has_value());
    EXPECT_EQ(seat->value, "14C");
    EXPECT_DOUBLE_EQ(seat->confidence, FieldParser::SEAT_CONFIDENCE);
}

TEST_F(FieldParserTest, ConfiguredKeywordsReplaceDefaults)
{
    nlohmann::json section = {{"keywords", {{"seat", {"platz"}}}}, {"keyword_window_lines", 0}};
    FieldParserConfig config = FieldParserConfig::fromJson(section);
    ASSERT_EQ(config.keywordsFor("seat").size(), 1u);
    EXPECT_EQ(config.keywordsFor("seat").front(), "PLATZ");
    EXPECT_EQ(config.keyword_window_lines, 0);
    EXPECT_FALSE(config.keywordsFor("flight").empty());

    FieldParser parser(config, *airports_);
    auto keyword_seat = parser.findSeat({"PLATZ 7F"});
    ASSERT_TRUE(keyword_seat.has_value());
    EXPECT_DOUBLE_EQ(keyword_seat->confidence, FieldParser::SEAT_KEYWORD_CONFIDENCE);

    auto plain_seat = parser.findSeat({"SEAT 7F"});
    ASSERT_TRUE(plain_seat.has_value());
    EXPECT_DOUBLE_EQ(plain_seat->confidence, FieldParser::SEAT_CONFIDENCE);
}

TEST_F(FieldParserTest, MistypedConfigKeepsDefaults)
{
    nlohmann::json section = {{"keywords", {{"seat", "SEAT"}}}, {"keyword_window_lines", "four"}};
    FieldParserConfig config = FieldParserConfig::fromJson(section);
    EXPECT_EQ(config.keywordsFor("seat"), FieldParserConfig::defaults().keywordsFor("seat"));
    EXPECT_EQ(config.keyword_window_lines, 4);
}
