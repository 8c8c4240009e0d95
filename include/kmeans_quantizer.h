#pragma once

#include "color_quantizer.h"
#include <random>
#include <vector>

struct KMeansOptions {
    uint32_t maxIterations = 50;
    float convergenceThreshold = 1.0f; // max centroid movement, RGB units
    size_t maxSamples = 10000;         // samples read per call
    uint32_t seed = 0;
};

struct KMeansStats {
    uint32_t iterations = 0;
    bool converged = false;
};

class CHROMAQUANT_API KMeansQuantizer : public ColorQuantizer {
private:
    KMeansOptions options;

    std::vector<RGBColor> SeedCentroids(const std::vector<RGBColor>& samples, size_t k, std::mt19937& rng, std::vector<double>& minDistSq) const;

protected:
    std::vector<ExtractedColor> Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const override;
    size_t BytesPerSample() const override;
    size_t MaxSamples() const override { return options.maxSamples; }

public:
    // Throws std::invalid_argument on unusable options.
    explicit KMeansQuantizer(const KMeansOptions& opts = KMeansOptions());

    const char* Name() const override { return AlgorithmNames::KMeans; }
    const KMeansOptions& GetOptions() const { return options; }

    // K-means++ seeding followed by Lloyd iterations. Returns at most `k` distinct centroids;
    // `assignments` receives the cluster of every sample for the returned centroids.
    std::vector<RGBColor> Cluster(const std::vector<RGBColor>& samples, size_t k, std::vector<uint32_t>& assignments, KMeansStats* stats = nullptr) const;
};
