#include "kmeans_quantizer.h"
#include "color_math.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

// =================================================================================================
// Configuration
// =================================================================================================

KMeansQuantizer::KMeansQuantizer(const KMeansOptions& opts)
    : options(opts) {
    if (options.maxIterations == 0) {
        throw std::invalid_argument("KMeansOptions::maxIterations must be >= 1");
    }
    if (!(options.convergenceThreshold >= 0.0f)) {
        throw std::invalid_argument("KMeansOptions::convergenceThreshold must be >= 0, got " + std::to_string(options.convergenceThreshold));
    }
    if (options.maxSamples == 0) {
        throw std::invalid_argument("KMeansOptions::maxSamples must be >= 1");
    }
}

size_t KMeansQuantizer::BytesPerSample() const {
    // sample + assignment + distance to the nearest seed
    return sizeof(RGBColor) + sizeof(uint32_t) + sizeof(double);
}

// =================================================================================================
// K-Means++ Initialization
// =================================================================================================

std::vector<RGBColor> KMeansQuantizer::SeedCentroids(const std::vector<RGBColor>& samples, size_t k, std::mt19937& rng, std::vector<double>& minDistSq) const {
    std::vector<RGBColor> centroids;
    const size_t numSamples = samples.size();
    if (numSamples == 0 || k == 0) return centroids;
    centroids.reserve(k);

    std::uniform_int_distribution<size_t> distrib(0, numSamples - 1);
    centroids.push_back(samples[distrib(rng)]);

    minDistSq.assign(numSamples, std::numeric_limits<double>::max());
    for (size_t i = 1; i < k; ++i) {
        double current_sum = 0.0;
        for (size_t j = 0; j < numSamples; ++j) {
            const double d = ColorMath::RgbDistanceSq(samples[j], centroids[i - 1]);
            minDistSq[j] = std::min(d, minDistSq[j]);
            current_sum += minDistSq[j];
        }
        // Every sample already coincides with a centroid: fewer distinct colors than k.
        if (current_sum <= 0) break;

        std::uniform_real_distribution<double> p_distrib(0.0, current_sum);
        const double p = p_distrib(rng);
        double cumulative_p = 0.0;
        size_t chosen = numSamples;
        for (size_t j = 0; j < numSamples; ++j) {
            if (minDistSq[j] <= 0) continue;
            cumulative_p += minDistSq[j];
            chosen = j;
            if (cumulative_p >= p) break;
        }
        centroids.push_back(samples[chosen]);
    }
    return centroids;
}

// =================================================================================================
// K-Means Iterations
// =================================================================================================

namespace {

    uint32_t NearestCentroid(const RGBColor& c, const std::vector<RGBColor>& centroids) {
        uint32_t best = 0;
        int bestDist = std::numeric_limits<int>::max();
        for (uint32_t i = 0; i < centroids.size(); ++i) {
            const int d = ColorMath::RgbDistanceSq(c, centroids[i]);
            if (d < bestDist) {
                bestDist = d;
                best = i;
            }
        }
        return best;
    }

    void AssignAll(const std::vector<RGBColor>& samples, const std::vector<RGBColor>& centroids, std::vector<uint32_t>& assignments) {
        assignments.resize(samples.size());
        for (size_t j = 0; j < samples.size(); ++j) {
            assignments[j] = NearestCentroid(samples[j], centroids);
        }
    }

}

std::vector<RGBColor> KMeansQuantizer::Cluster(const std::vector<RGBColor>& samples, size_t k, std::vector<uint32_t>& assignments, KMeansStats* stats) const {
    std::mt19937 rng(options.seed);
    std::vector<double> minDistSq;
    std::vector<RGBColor> centroids = SeedCentroids(samples, k, rng, minDistSq);

    KMeansStats localStats;
    if (centroids.empty()) {
        assignments.clear();
        if (stats) *stats = localStats;
        return centroids;
    }

    struct ChannelSums { uint64_t r = 0, g = 0, b = 0, count = 0; };
    std::vector<ChannelSums> sums(centroids.size());

    for (uint32_t iter = 0; iter < options.maxIterations; ++iter) {
        AssignAll(samples, centroids, assignments);

        std::fill(sums.begin(), sums.end(), ChannelSums());
        for (size_t j = 0; j < samples.size(); ++j) {
            ChannelSums& s = sums[assignments[j]];
            s.r += samples[j].r;
            s.g += samples[j].g;
            s.b += samples[j].b;
            s.count++;
        }

        float maxMovement = 0.0f;
        for (size_t i = 0; i < centroids.size(); ++i) {
            // Empty clusters keep their previous centroid.
            if (sums[i].count == 0) continue;
            const double n = static_cast<double>(sums[i].count);
            const RGBColor updated(ColorMath::ClampToByte(sums[i].r / n), ColorMath::ClampToByte(sums[i].g / n), ColorMath::ClampToByte(sums[i].b / n));
            maxMovement = std::max(maxMovement, ColorMath::RgbDistance(updated, centroids[i]));
            centroids[i] = updated;
        }

        localStats.iterations = iter + 1;
        if (maxMovement <= options.convergenceThreshold) {
            localStats.converged = true;
            break;
        }
    }

    AssignAll(samples, centroids, assignments);
    if (stats) *stats = localStats;
    return centroids;
}

std::vector<ExtractedColor> KMeansQuantizer::Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const {
    std::vector<uint32_t> assignments;
    const std::vector<RGBColor> centroids = Cluster(samples, static_cast<size_t>(config.targetColorCount), assignments);

    std::vector<uint64_t> counts(centroids.size(), 0);
    for (uint32_t a : assignments) counts[a]++;

    const float total = static_cast<float>(samples.size());
    std::vector<ExtractedColor> colors;
    colors.reserve(centroids.size());
    for (size_t i = 0; i < centroids.size(); ++i) {
        if (counts[i] == 0) continue;
        colors.emplace_back(centroids[i], counts[i] / total);
    }
    std::stable_sort(colors.begin(), colors.end(),
        [](const ExtractedColor& a, const ExtractedColor& b) { return a.frequency > b.frequency; });

    // Includes the seeding distances, freed before Cluster returns.
    memoryBytes = assignments.capacity() * sizeof(uint32_t) + samples.size() * sizeof(double) +
        centroids.capacity() * sizeof(RGBColor) + counts.capacity() * sizeof(uint64_t);
    return colors;
}
