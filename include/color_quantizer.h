#pragma once

#include "palette_types.h"
#include "pixel_sampler.h"
#include <chrono>
#include <vector>

// Base class of every palette extraction algorithm. Instances hold only immutable
// options, so one instance may be shared across threads.
class CHROMAQUANT_API ColorQuantizer {
private:
    ExtractionResult Run(const std::vector<RGBColor>& samples, const ExtractionConfig& config, std::chrono::steady_clock::time_point start) const;

protected:
    // Runs the algorithm on the opaque samples. Returned colors are already ordered;
    // `memoryBytes` receives the size of the structures the call allocated.
    virtual std::vector<ExtractedColor> Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const = 0;

    // Working bytes one sample costs, used to fit the sample set into memoryLimit.
    virtual size_t BytesPerSample() const = 0;

    // 0 reads every opaque pixel.
    virtual size_t MaxSamples() const { return 0; }

public:
    virtual ~ColorQuantizer() = default;

    virtual const char* Name() const = 0;

    // Throws std::invalid_argument on a bad config or buffer.
    ExtractionResult Quantize(const PixelBuffer& buffer, const ExtractionConfig& config) const;

    // Same flow over colors that were already gathered (alpha is assumed non-zero).
    ExtractionResult QuantizeSamples(const std::vector<RGBColor>& samples, const ExtractionConfig& config) const;
};
