#include "test_base.hpp"
#include "test_fakes.hpp"
#include "core/ocr_pipeline.hpp"
#include <opencv2/imgproc.hpp>

class OcrPipelineTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        parser_ = std::make_unique<FieldParser>(FieldParserConfig::defaults(), *airports_);

        page_ = cv::Mat(400, 600, CV_8UC3, cv::Scalar(255, 255, 255));
        cv::rectangle(page_, cv::Rect(50, 100, 500, 20), cv::Scalar(0, 0, 0), cv::FILLED);
        cv::rectangle(page_, cv::Rect(50, 200, 500, 20), cv::Scalar(0, 0, 0), cv::FILLED);

        options_.max_threads = 2;
    }

    StrategyOutcome run(const OcrEngine &engine,
                        std::chrono::steady_clock::time_point deadline,
                        const std::function<bool()> &is_cancelled = nullptr)
    {
        OcrPipeline pipeline(engine, preprocessor_, *parser_, options_);
        return pipeline.run(page_, deadline, is_cancelled);
    }

    static std::chrono::steady_clock::time_point later()
    {
        return std::chrono::steady_clock::now() + std::chrono::seconds(30);
    }

    std::unique_ptr<FieldParser> parser_;
    ImagePreprocessor preprocessor_;
    OcrPipelineOptions options_;
    cv::Mat page_;
};

TEST_F(OcrPipelineTest, PicksAttemptWithMostFields)
{
    FakeOcrEngine engine("FLIGHT LH 400");
    engine.setTextForMode(11, sampleBoardingPassText());

    StrategyOutcome outcome = run(engine, later());
    ASSERT_TRUE(outcome.success) << outcome.failure.describe();
    ASSERT_TRUE(outcome.candidate.has_value());

    const ExtractionCandidate &candidate = *outcome.candidate;
    EXPECT_EQ(candidate.method.toString(), "ocr");
    EXPECT_EQ(candidate.flight_segments.front().flight_number, "LH400");
    EXPECT_EQ(candidate.flight_segments.front().seat.value_or(""), "12A");
    EXPECT_EQ(candidate.raw_text, sampleBoardingPassText());
    EXPECT_TRUE(candidate.warnings.empty());

    // Five variants for a small page, three modes each
    EXPECT_EQ(engine.calls.load(), 15);
}

TEST_F(OcrPipelineTest, TooFewFieldsIsAFailure)
{
    FakeOcrEngine engine("FLIGHT LH 400");

    StrategyOutcome outcome = run(engine, later());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failure.strategy, ExtractionStrategy::OCR);
    EXPECT_EQ(outcome.failure.reason, "insufficient fields");
}

TEST_F(OcrPipelineTest, AirlineDoesNotCountTowardMinimumFields)
{
    // Two recognized fields; the carrier name is only looked up from the flight number
    FakeOcrEngine engine("FLIGHT LH 400\nSEAT 12A");
    options_.min_fields = 3;

    StrategyOutcome outcome = run(engine, later());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failure.reason, "insufficient fields");
    EXPECT_EQ(outcome.failure.detail, "best attempt found 2 of 3 required fields");
}

TEST_F(OcrPipelineTest, UnavailableEngineIsAFailure)
{
    FakeOcrEngine engine(sampleBoardingPassText(), false);

    StrategyOutcome outcome = run(engine, later());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failure.reason, "OCR engine unavailable");
    EXPECT_EQ(engine.calls.load(), 0);
}

TEST_F(OcrPipelineTest, ExpiredDeadlineSkipsAllAttempts)
{
    FakeOcrEngine engine(sampleBoardingPassText());

    StrategyOutcome outcome = run(engine, std::chrono::steady_clock::now() - std::chrono::milliseconds(1));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failure.reason, "no OCR attempt completed");
    EXPECT_EQ(outcome.failure.detail, "time budget expired");
    EXPECT_EQ(engine.calls.load(), 0);
}

TEST_F(OcrPipelineTest, CancellationSkipsAttempts)
{
    FakeOcrEngine engine(sampleBoardingPassText());

    StrategyOutcome outcome = run(engine, later(), []
                                  { return true; });
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failure.detail, "cancelled");
    EXPECT_EQ(engine.calls.load(), 0);
}

TEST_F(OcrPipelineTest, SelectBestPrefersFieldsThenConfidence)
{
    std::vector<OcrAttempt> attempts(4);

    attempts[0].completed = false;
    attempts[0].candidate.field_confidence = {{"a", 0.9}, {"b", 0.9}, {"c", 0.9}, {"d", 0.9}};

    attempts[1].completed = true;
    attempts[1].candidate.field_confidence = {{"a", 0.5}, {"b", 0.5}};

    attempts[2].completed = true;
    attempts[2].candidate.field_confidence = {{"a", 0.6}, {"b", 0.6}, {"c", 0.0}};

    attempts[3].completed = true;
    attempts[3].candidate.field_confidence = {{"a", 0.4}, {"b", 0.4}};

    const OcrAttempt *best = OcrPipeline::selectBest(attempts);
    ASSERT_NE(best, nullptr);
    EXPECT_EQ(best, &attempts[2]);

    attempts[3].candidate.field_confidence["c"] = 0.4;
    EXPECT_EQ(OcrPipeline::selectBest(attempts), &attempts[3]);

    EXPECT_EQ(OcrPipeline::selectBest(std::vector<OcrAttempt>(2)), nullptr);
}

TEST_F(OcrPipelineTest, SelectBestIgnoresDerivedAirline)
{
    std::vector<OcrAttempt> attempts(2);

    attempts[0].completed = true;
    attempts[0].candidate.field_confidence = {{FieldNames::FLIGHT_NUMBER, 0.9}, {FieldNames::AIRLINE, 0.9}};

    attempts[1].completed = true;
    attempts[1].candidate.field_confidence = {{FieldNames::FLIGHT_NUMBER, 0.8}, {FieldNames::SEAT_NUMBER, 0.8}};

    EXPECT_EQ(attempts[0].candidate.fieldCount(), 2u);
    EXPECT_EQ(attempts[0].candidate.recognizedFieldCount(), 1u);
    EXPECT_EQ(OcrPipeline::selectBest(attempts), &attempts[1]);
}
