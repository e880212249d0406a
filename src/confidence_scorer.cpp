#include "core/confidence_scorer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace
{
    double clampConfidence(double value)
    {
        return std::min(1.0, std::max(0.0, value));
    }

    FlightSegment &primarySegment(ExtractionCandidate &candidate)
    {
        if (candidate.flight_segments.empty())
            candidate.flight_segments.emplace_back();
        return candidate.flight_segments.front();
    }

    Passenger &primaryPassenger(ExtractionCandidate &candidate)
    {
        if (candidate.passengers.empty())
            candidate.passengers.emplace_back();
        return candidate.passengers.front();
    }

    // Copies one field's value from `source` into `target`
    void copyField(const std::string &field, const ExtractionCandidate &source, ExtractionCandidate &target)
    {
        FlightSegment source_segment = source.flight_segments.empty() ? FlightSegment() : source.flight_segments.front();

        if (field == FieldNames::FLIGHT_NUMBER)
        {
            FlightSegment &segment = primarySegment(target);
            segment.flight_number = source_segment.flight_number;
            segment.airline = source_segment.airline;
            target.field_confidence.erase(FieldNames::AIRLINE);
            double airline_confidence = source.confidenceOf(FieldNames::AIRLINE);
            if (airline_confidence > 0.0)
                target.field_confidence[FieldNames::AIRLINE] = airline_confidence;
        }
        else if (field == FieldNames::DEPARTURE_AIRPORT)
            primarySegment(target).departure_airport = source_segment.departure_airport;
        else if (field == FieldNames::ARRIVAL_AIRPORT)
            primarySegment(target).arrival_airport = source_segment.arrival_airport;
        else if (field == FieldNames::FLIGHT_DATE)
            primarySegment(target).flight_date = source_segment.flight_date;
        else if (field == FieldNames::DEPARTURE_TIME)
            primarySegment(target).departure_time = source_segment.departure_time;
        else if (field == FieldNames::ARRIVAL_TIME)
            primarySegment(target).arrival_time = source_segment.arrival_time;
        else if (field == FieldNames::BOARDING_TIME)
            primarySegment(target).boarding_time = source_segment.boarding_time;
        else if (field == FieldNames::SEAT_NUMBER)
            primarySegment(target).seat = source_segment.seat;
        else if (field == FieldNames::PASSENGER_NAME)
            primaryPassenger(target) = source.passengers.empty() ? Passenger() : source.passengers.front();
        else if (field == FieldNames::BOOKING_REFERENCE)
            target.booking_reference = source.booking_reference;
        else
            return;

        target.field_confidence[field] = source.confidenceOf(field);
    }
}

ScoringWeights ScoringWeights::defaults()
{
    ScoringWeights weights;
    weights.weights = {
        {FieldNames::FLIGHT_NUMBER, 1.5},
        {FieldNames::FLIGHT_DATE, 1.5},
        {FieldNames::DEPARTURE_AIRPORT, 1.2},
        {FieldNames::ARRIVAL_AIRPORT, 1.2},
        {FieldNames::PASSENGER_NAME, 0.8},
        {FieldNames::DEPARTURE_TIME, 0.8},
        {FieldNames::BOOKING_REFERENCE, 0.5},
        {FieldNames::SEAT_NUMBER, 0.5}};
    weights.default_weight = 0.5;
    return weights;
}

ScoringWeights ScoringWeights::fromJson(const nlohmann::json &weights_section)
{
    ScoringWeights weights = defaults();
    if (!weights_section.is_object())
        return weights;

    for (auto it = weights_section.begin(); it != weights_section.end(); ++it)
    {
        if (!it.value().is_number() || it.value().get<double>() < 0.0)
        {
            Logger::warn("Ignoring invalid scoring weight for " + it.key());
            continue;
        }
        if (it.key() == "other")
            weights.default_weight = it.value().get<double>();
        else
            weights.weights[it.key()] = it.value().get<double>();
    }
    return weights;
}

double ScoringWeights::weightOf(const std::string &field) const
{
    auto it = weights.find(field);
    return it == weights.end() ? default_weight : it->second;
}

ConfidenceScorer::ConfidenceScorer(const ScoringWeights &weights) : weights_(weights)
{
}

const std::vector<std::string> &ConfidenceScorer::requiredFields()
{
    static const std::vector<std::string> fields = {
        FieldNames::FLIGHT_NUMBER, FieldNames::DEPARTURE_AIRPORT, FieldNames::ARRIVAL_AIRPORT,
        FieldNames::FLIGHT_DATE, FieldNames::PASSENGER_NAME};
    return fields;
}

double ConfidenceScorer::overallConfidence(const FieldConfidence &fields) const
{
    if (fields.empty())
        return 0.0;

    std::set<std::string> names;
    for (const auto &[field, confidence] : fields)
        names.insert(field);
    for (const auto &field : requiredFields())
        names.insert(field);

    double weighted_sum = 0.0;
    double total_weight = 0.0;
    for (const auto &field : names)
    {
        double weight = weights_.weightOf(field);
        auto it = fields.find(field);
        double confidence = it == fields.end() ? 0.0 : clampConfidence(it->second);
        weighted_sum += weight * confidence;
        total_weight += weight;
    }
    return total_weight > 0.0 ? clampConfidence(weighted_sum / total_weight) : 0.0;
}

int ConfidenceScorer::selectBest(const std::vector<ExtractionCandidate> &candidates) const
{
    int best = -1;
    for (size_t i = 0; i < candidates.size(); ++i)
    {
        if (best < 0)
        {
            best = static_cast<int>(i);
            continue;
        }
        const ExtractionCandidate &current = candidates[best];
        const ExtractionCandidate &challenger = candidates[i];
        if (challenger.overall_confidence > current.overall_confidence ||
            (challenger.overall_confidence == current.overall_confidence &&
             challenger.method.priority() > current.method.priority()))
        {
            best = static_cast<int>(i);
        }
    }
    return best;
}

ExtractionCandidate ConfidenceScorer::merge(const std::vector<ExtractionCandidate> &candidates) const
{
    int best_index = selectBest(candidates);
    if (best_index < 0)
        throw std::invalid_argument("merge requires at least one candidate");

    ExtractionCandidate merged = candidates[best_index];

    static const std::vector<std::string> mergeable = {
        FieldNames::FLIGHT_NUMBER, FieldNames::DEPARTURE_AIRPORT, FieldNames::ARRIVAL_AIRPORT,
        FieldNames::FLIGHT_DATE, FieldNames::DEPARTURE_TIME, FieldNames::ARRIVAL_TIME,
        FieldNames::BOARDING_TIME, FieldNames::SEAT_NUMBER, FieldNames::PASSENGER_NAME,
        FieldNames::BOOKING_REFERENCE};

    for (const auto &field : mergeable)
    {
        int source = best_index;
        for (size_t i = 0; i < candidates.size(); ++i)
        {
            double confidence = candidates[i].confidenceOf(field);
            double source_confidence = candidates[source].confidenceOf(field);
            if (confidence > source_confidence ||
                (confidence == source_confidence && confidence > 0.0 &&
                 candidates[i].method.priority() > candidates[source].method.priority()))
            {
                source = static_cast<int>(i);
            }
        }

        if (source != best_index)
        {
            copyField(field, candidates[source], merged);
            Logger::debug("Merged " + field + " from " + candidates[source].method.toString());
        }
    }

    for (size_t i = 0; i < candidates.size(); ++i)
    {
        if (static_cast<int>(i) == best_index)
            continue;
        for (const auto &warning : candidates[i].warnings)
        {
            if (std::find(merged.warnings.begin(), merged.warnings.end(), warning) == merged.warnings.end())
                merged.warnings.push_back(warning);
        }
    }

    merged.overall_confidence = overallConfidence(merged.field_confidence);
    return merged;
}
