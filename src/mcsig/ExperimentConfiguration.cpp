#include "ExperimentConfiguration.h"
#include "HypothesisTestConfiguration.h"
#include "HypothesisTestException.h"
#include "PValueComputationPolicy.h"

#include <rapidjson/error/en.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

using namespace rapidjson;

namespace mcsig {

std::string dataShapeToString(DataShape shape) {
    switch (shape) {
        case DataShape::TwoSample:      return "two samples";
        case DataShape::Paired:         return "paired series";
        case DataShape::Counts:         return "category counts";
        case DataShape::TwoCategorical: return "two categorical samples";
    }
    return "unknown";
}

ExperimentConfiguration::ExperimentConfiguration(std::string name,
                                                 std::string statistic,
                                                 std::string nullModel,
                                                 DataShape shape,
                                                 std::vector<std::vector<double>> series)
    : mName(std::move(name)),
      mStatistic(std::move(statistic)),
      mNullModel(std::move(nullModel)),
      mPValuePolicy(EmpiricalPValueComputationPolicy::name()),
      mExecutor("single"),
      mIterations(HypothesisTestConfiguration::kDefaultIterations),
      mSeed(),
      mAlpha(HypothesisTestConfiguration::kDefaultAlpha),
      mShape(shape),
      mSeries(std::move(series)),
      mPower()
{
}

std::vector<ExperimentConfiguration> ExperimentConfigurationReader::readFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw InvalidArgumentError("ExperimentConfigurationReader: cannot open experiment file " + filePath);
    }

    std::string jsonStr((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    return readString(jsonStr);
}

std::vector<ExperimentConfiguration> ExperimentConfigurationReader::readString(const std::string& json) {
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError()) {
        throw InvalidArgumentError(std::string("ExperimentConfigurationReader: JSON parse error at offset ") +
                                   std::to_string(doc.GetErrorOffset()) + ": " +
                                   GetParseError_En(doc.GetParseError()));
    }

    if (!doc.IsObject()) {
        throw InvalidArgumentError("ExperimentConfigurationReader: top level must be an object");
    }

    std::vector<ExperimentConfiguration> experiments;

    // A file may hold a single experiment object
    if (!doc.HasMember("experiments")) {
        experiments.push_back(readExperiment(doc, 0));
        return experiments;
    }

    const Value& list = doc["experiments"];
    if (!list.IsArray() || list.Empty()) {
        throw InvalidArgumentError("ExperimentConfigurationReader: \"experiments\" must be a non-empty array");
    }

    for (SizeType i = 0; i < list.Size(); ++i) {
        experiments.push_back(readExperiment(list[i], i));
    }

    return experiments;
}

ExperimentConfiguration ExperimentConfigurationReader::readExperiment(const Value& json, std::size_t index) {
    if (!json.IsObject()) {
        throw InvalidArgumentError("ExperimentConfigurationReader: experiment " + std::to_string(index) +
                                   " is not an object");
    }

    const std::string name = readText(json, "name", "experiment-" + std::to_string(index + 1), "");
    const std::string statistic = readText(json, "statistic", "", name);
    const std::string nullModel = readText(json, "nullModel", "", name);

    if (statistic.empty() || nullModel.empty()) {
        throw InvalidArgumentError("ExperimentConfigurationReader: " + name +
                                   ": \"statistic\" and \"nullModel\" are required");
    }

    if (!json.HasMember("data") || !json["data"].IsObject()) {
        throw InvalidDataError("ExperimentConfigurationReader: " + name + ": \"data\" object is missing");
    }

    const Value& data = json["data"];
    const bool hasCounts = data.HasMember("counts");
    const bool hasPaired = data.HasMember("x") || data.HasMember("y");
    const bool hasGroups = data.HasMember("group1") || data.HasMember("group2");

    if (static_cast<int>(hasCounts) + static_cast<int>(hasPaired) + static_cast<int>(hasGroups) != 1) {
        throw InvalidDataError("ExperimentConfigurationReader: " + name +
                               ": \"data\" must hold exactly one of counts, x/y or group1/group2");
    }

    DataShape shape;
    std::vector<std::vector<double>> series;

    if (hasCounts) {
        shape = DataShape::Counts;
        series.push_back(readSeries(data, "counts", name));
    } else if (hasPaired) {
        shape = DataShape::Paired;
        series.push_back(readSeries(data, "x", name));
        series.push_back(readSeries(data, "y", name));
    } else {
        series.push_back(readSeries(data, "group1", name));
        series.push_back(readSeries(data, "group2", name));

        if (data.HasMember("categories")) {
            shape = DataShape::TwoCategorical;
            series.push_back(readSeries(data, "categories", name));
        } else {
            shape = DataShape::TwoSample;
        }
    }

    ExperimentConfiguration config(name, statistic, nullModel, shape, std::move(series));

    config.setIterations(readCount(json, "iterations", HypothesisTestConfiguration::kDefaultIterations, name));
    config.setExecutor(readText(json, "executor", config.getExecutor(), name));
    config.setPValuePolicy(readText(json, "pvaluePolicy", config.getPValuePolicy(), name));

    if (json.HasMember("seed")) {
        if (!json["seed"].IsUint64()) {
            throw InvalidArgumentError("ExperimentConfigurationReader: " + name +
                                       ": \"seed\" must be a non-negative integer");
        }
        config.setSeed(json["seed"].GetUint64());
    }

    if (json.HasMember("alpha")) {
        const Value& alpha = json["alpha"];
        if (!alpha.IsNumber() || !(alpha.GetDouble() > 0.0 && alpha.GetDouble() < 1.0)) {
            throw InvalidArgumentError("ExperimentConfigurationReader: " + name +
                                       ": \"alpha\" must be a number in (0, 1)");
        }
        config.setAlpha(alpha.GetDouble());
    }

    if (json.HasMember("power")) {
        const Value& power = json["power"];
        if (!power.IsObject()) {
            throw InvalidArgumentError("ExperimentConfigurationReader: " + name + ": \"power\" must be an object");
        }

        PowerSettings settings;
        settings.numExperiments =
            readCount(power, "experiments", HypothesisTestConfiguration::kDefaultPowerExperiments, name);
        settings.iterationsPerExperiment =
            readCount(power, "iterations", HypothesisTestConfiguration::kDefaultPowerIterations, name);
        config.setPowerSettings(settings);
    }

    return config;
}

std::vector<double> ExperimentConfigurationReader::readSeries(const Value& data, const char* key,
                                                              const std::string& experiment) {
    if (!data.HasMember(key)) {
        throw InvalidDataError("ExperimentConfigurationReader: " + experiment + ": data series \"" +
                               key + "\" is missing");
    }

    const Value& array = data[key];
    if (!array.IsArray()) {
        throw InvalidDataError("ExperimentConfigurationReader: " + experiment + ": data series \"" +
                               key + "\" is not an array");
    }

    std::vector<double> values;
    values.reserve(array.Size());

    for (const auto& v : array.GetArray()) {
        if (!v.IsNumber()) {
            throw InvalidDataError("ExperimentConfigurationReader: " + experiment + ": data series \"" +
                                   key + "\" holds a non-numeric value");
        }
        values.push_back(v.GetDouble());
    }

    return values;
}

std::uint32_t ExperimentConfigurationReader::readCount(const Value& json, const char* key,
                                                       std::uint32_t defaultValue,
                                                       const std::string& experiment) {
    if (!json.HasMember(key)) {
        return defaultValue;
    }

    const Value& v = json[key];
    if (v.IsUint()) {
        return v.GetUint();
    }

    if (v.IsInt64() && v.GetInt64() < 0) {
        throw InvalidArgumentError("ExperimentConfigurationReader: " + experiment + ": \"" + key +
                                   "\" must not be negative");
    }

    throw InvalidArgumentError("ExperimentConfigurationReader: " + experiment + ": \"" + key +
                               "\" must be a whole number up to " +
                               std::to_string(std::numeric_limits<std::uint32_t>::max()));
}

std::string ExperimentConfigurationReader::readText(const Value& json, const char* key,
                                                    const std::string& defaultValue,
                                                    const std::string& experiment) {
    if (!json.HasMember(key)) {
        return defaultValue;
    }

    const Value& v = json[key];
    if (!v.IsString()) {
        throw InvalidArgumentError("ExperimentConfigurationReader: " + experiment + ": \"" + key +
                                   "\" must be a string");
    }

    return std::string(v.GetString(), v.GetStringLength());
}

void applyOverrides(std::vector<ExperimentConfiguration>& experiments, const ExperimentOverrides& overrides) {
    if (overrides.iterations &&
        (*overrides.iterations < 1 ||
         *overrides.iterations > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))) {
        throw InvalidArgumentError("applyOverrides: iterations must be between 1 and " +
                                   std::to_string(std::numeric_limits<std::uint32_t>::max()) + ", got " +
                                   std::to_string(*overrides.iterations));
    }

    for (auto& experiment : experiments) {
        if (overrides.iterations) {
            experiment.setIterations(static_cast<std::uint32_t>(*overrides.iterations));
        }
        if (overrides.seed) {
            experiment.setSeed(*overrides.seed);
        }
        if (overrides.executor) {
            experiment.setExecutor(*overrides.executor);
        }
        if (overrides.pValuePolicy) {
            experiment.setPValuePolicy(*overrides.pValuePolicy);
        }
    }
}

} // namespace mcsig
