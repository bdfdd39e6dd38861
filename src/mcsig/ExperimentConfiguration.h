#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace mcsig {

/**
 * @brief Shape of the observed data of one experiment.
 *
 * Inferred from the keys of the "data" object:
 *   group1 + group2              -> TwoSample
 *   group1 + group2 + categories -> TwoCategorical
 *   x + y                        -> Paired
 *   counts                       -> Counts
 */
enum class DataShape {
    TwoSample,
    Paired,
    Counts,
    TwoCategorical
};

std::string dataShapeToString(DataShape shape);

struct PowerSettings {
    std::uint32_t numExperiments;
    std::uint32_t iterationsPerExperiment;
};

/**
 * @brief One experiment read from an experiment file.
 *
 * Names are resolved later by ExperimentRunner; this class only checks
 * that the document is well formed.
 */
class ExperimentConfiguration {
public:
    ExperimentConfiguration(std::string name,
                            std::string statistic,
                            std::string nullModel,
                            DataShape shape,
                            std::vector<std::vector<double>> series);

    const std::string& getName() const { return mName; }
    const std::string& getStatistic() const { return mStatistic; }
    const std::string& getNullModel() const { return mNullModel; }
    const std::string& getPValuePolicy() const { return mPValuePolicy; }
    const std::string& getExecutor() const { return mExecutor; }
    std::uint32_t getIterations() const { return mIterations; }
    const std::optional<std::uint64_t>& getSeed() const { return mSeed; }
    double getAlpha() const { return mAlpha; }
    DataShape getDataShape() const { return mShape; }
    const std::optional<PowerSettings>& getPowerSettings() const { return mPower; }

    // Series in key order of the shape: (group1, group2), (x, y), (counts)
    // or (group1, group2, categories).
    const std::vector<std::vector<double>>& getSeries() const { return mSeries; }

    void setPValuePolicy(const std::string& policy) { mPValuePolicy = policy; }
    void setExecutor(const std::string& executor) { mExecutor = executor; }
    void setIterations(std::uint32_t iterations) { mIterations = iterations; }
    void setSeed(std::uint64_t seed) { mSeed = seed; }
    void setAlpha(double alpha) { mAlpha = alpha; }
    void setPowerSettings(const PowerSettings& power) { mPower = power; }

private:
    std::string mName;
    std::string mStatistic;
    std::string mNullModel;
    std::string mPValuePolicy;
    std::string mExecutor;
    std::uint32_t mIterations;
    std::optional<std::uint64_t> mSeed;
    double mAlpha;
    DataShape mShape;
    std::vector<std::vector<double>> mSeries;
    std::optional<PowerSettings> mPower;
};

/**
 * @brief Reads experiment files with RapidJSON.
 *
 * Expected document:
 * @code
 * {
 *   "experiments": [
 *     {
 *       "name": "dice",
 *       "statistic": "CategoricalChiSquared",
 *       "nullModel": "CategoricalRedraw",
 *       "iterations": 10000,
 *       "seed": 2718,
 *       "executor": "threadpool",
 *       "pvaluePolicy": "empirical",
 *       "alpha": 0.05,
 *       "data": { "counts": [8, 9, 19, 5, 8, 11] },
 *       "power": { "experiments": 1000, "iterations": 101 }
 *     }
 *   ]
 * }
 * @endcode
 *
 * Malformed input raises InvalidArgumentError (settings) or
 * InvalidDataError (the "data" object).
 */
class ExperimentConfigurationReader {
public:
    static std::vector<ExperimentConfiguration> readFile(const std::string& filePath);

    static std::vector<ExperimentConfiguration> readString(const std::string& json);

private:
    static ExperimentConfiguration readExperiment(const rapidjson::Value& json, std::size_t index);

    static std::vector<double> readSeries(const rapidjson::Value& data, const char* key,
                                          const std::string& experiment);

    static std::uint32_t readCount(const rapidjson::Value& json, const char* key,
                                   std::uint32_t defaultValue, const std::string& experiment);

    static std::string readText(const rapidjson::Value& json, const char* key,
                                const std::string& defaultValue, const std::string& experiment);
};

// Command-line settings that replace the file's values in every experiment.
struct ExperimentOverrides {
    // Signed so that a negative count is reported rather than wrapped.
    std::optional<std::int64_t> iterations;
    std::optional<std::uint64_t> seed;
    std::optional<std::string> executor;
    std::optional<std::string> pValuePolicy;
};

/**
 * @brief Applies overrides to every experiment.
 * @throws InvalidArgumentError if the iteration count is < 1 or exceeds
 *         the 32-bit trial counter; no experiment is modified then.
 */
void applyOverrides(std::vector<ExperimentConfiguration>& experiments, const ExperimentOverrides& overrides);

} // namespace mcsig
