#pragma once

#include "color_quantizer.h"
#include <algorithm>
#include <array>
#include <iterator>
#include <vector>

struct OctreeNode {
    int32_t children[8];
    uint64_t pixelCount = 0;
    uint64_t redSum = 0;
    uint64_t greenSum = 0;
    uint64_t blueSum = 0;
    uint8_t level = 0;
    bool isLeaf = false;

    OctreeNode() { std::fill(std::begin(children), std::end(children), -1); }

    RGBColor GetAverageColor() const;
};

// Flat node arena for one extraction. Node 0 is the root.
struct Octree {
    static constexpr uint8_t MAX_DEPTH = 7;

    std::vector<OctreeNode> nodes;
    // Internal nodes per level (0..6), in creation order.
    std::array<std::vector<int32_t>, MAX_DEPTH> reducible;
    size_t leafCount = 0;

    // Handles of the leaves reachable from the root, depth first.
    std::vector<int32_t> CollectLeaves() const;

    uint64_t GetByteSize() const;
};

class CHROMAQUANT_API OctreeQuantizer : public ColorQuantizer {
protected:
    std::vector<ExtractedColor> Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const override;
    size_t BytesPerSample() const override;

public:
    const char* Name() const override { return AlgorithmNames::Octree; }

    // Inserts every sample and collapses the tree until it holds at most `maxLeaves` leaves.
    static Octree BuildTree(const std::vector<RGBColor>& samples, size_t maxLeaves);
};
