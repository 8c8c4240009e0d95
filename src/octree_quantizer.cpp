#include "octree_quantizer.h"
#include "color_math.h"
#include <algorithm>

RGBColor OctreeNode::GetAverageColor() const {
    if (pixelCount == 0) return RGBColor();
    const double n = static_cast<double>(pixelCount);
    return RGBColor(ColorMath::ClampToByte(redSum / n), ColorMath::ClampToByte(greenSum / n), ColorMath::ClampToByte(blueSum / n));
}

std::vector<int32_t> Octree::CollectLeaves() const {
    std::vector<int32_t> leaves;
    if (nodes.empty()) return leaves;

    std::vector<int32_t> stack = { 0 };
    while (!stack.empty()) {
        const int32_t handle = stack.back();
        stack.pop_back();
        const OctreeNode& node = nodes[handle];
        if (node.isLeaf) {
            leaves.push_back(handle);
            continue;
        }
        for (int i = 7; i >= 0; --i) {
            if (node.children[i] >= 0) stack.push_back(node.children[i]);
        }
    }
    return leaves;
}

uint64_t Octree::GetByteSize() const {
    uint64_t bytes = nodes.capacity() * sizeof(OctreeNode);
    for (const auto& level : reducible) bytes += level.capacity() * sizeof(int32_t);
    return bytes;
}

namespace {

    inline int OctreeIndex(const RGBColor& c, uint8_t level) {
        const int shift = 7 - level;
        return (((c.r >> shift) & 1) << 2) | (((c.g >> shift) & 1) << 1) | ((c.b >> shift) & 1);
    }

    int32_t CreateNode(Octree& tree, uint8_t level) {
        OctreeNode node;
        node.level = level;
        node.isLeaf = level >= Octree::MAX_DEPTH;
        tree.nodes.push_back(node);

        const int32_t handle = static_cast<int32_t>(tree.nodes.size() - 1);
        if (node.isLeaf) tree.leafCount++;
        else tree.reducible[level].push_back(handle);
        return handle;
    }

    void Insert(Octree& tree, const RGBColor& c) {
        int32_t handle = 0;
        while (true) {
            OctreeNode& node = tree.nodes[handle];
            node.pixelCount++;
            node.redSum += c.r;
            node.greenSum += c.g;
            node.blueSum += c.b;
            if (node.isLeaf) return;

            const uint8_t level = node.level;
            const int index = OctreeIndex(c, level);
            int32_t child = node.children[index];
            if (child < 0) {
                // CreateNode may reallocate the arena; `node` is not touched afterwards.
                child = CreateNode(tree, static_cast<uint8_t>(level + 1));
                tree.nodes[handle].children[index] = child;
            }
            handle = child;
        }
    }

    // Turns `handle` into a leaf holding the sum of its children.
    void Collapse(Octree& tree, int32_t handle) {
        OctreeNode& node = tree.nodes[handle];
        uint64_t count = 0, r = 0, g = 0, b = 0;
        size_t childCount = 0;
        for (int i = 0; i < 8; ++i) {
            const int32_t child = node.children[i];
            if (child < 0) continue;
            const OctreeNode& c = tree.nodes[child];
            count += c.pixelCount;
            r += c.redSum;
            g += c.greenSum;
            b += c.blueSum;
            childCount++;
            node.children[i] = -1;
        }
        node.pixelCount = count;
        node.redSum = r;
        node.greenSum = g;
        node.blueSum = b;
        node.isLeaf = true;
        tree.leafCount = tree.leafCount - childCount + 1;
    }

}

Octree OctreeQuantizer::BuildTree(const std::vector<RGBColor>& samples, size_t maxLeaves) {
    Octree tree;
    tree.nodes.reserve(std::min<size_t>(samples.size() * 2 + 1, 1u << 16));
    CreateNode(tree, 0);
    for (const auto& c : samples) {
        Insert(tree, c);
    }

    maxLeaves = std::max<size_t>(1, maxLeaves);
    while (tree.leafCount > maxLeaves) {
        int deepest = Octree::MAX_DEPTH - 1;
        while (deepest >= 0 && tree.reducible[deepest].empty()) deepest--;
        if (deepest < 0) break;

        const int32_t handle = tree.reducible[deepest].back();
        tree.reducible[deepest].pop_back();
        Collapse(tree, handle);
    }
    return tree;
}

size_t OctreeQuantizer::BytesPerSample() const {
    // Worst case every sample opens a new branch down to a leaf.
    return sizeof(RGBColor) + sizeof(OctreeNode);
}

std::vector<ExtractedColor> OctreeQuantizer::Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const {
    const Octree tree = BuildTree(samples, static_cast<size_t>(config.targetColorCount));
    const std::vector<int32_t> leaves = tree.CollectLeaves();

    std::vector<const OctreeNode*> filled;
    filled.reserve(leaves.size());
    for (int32_t handle : leaves) {
        if (tree.nodes[handle].pixelCount > 0) filled.push_back(&tree.nodes[handle]);
    }
    std::stable_sort(filled.begin(), filled.end(),
        [](const OctreeNode* a, const OctreeNode* b) { return a->pixelCount > b->pixelCount; });
    if (filled.size() > static_cast<size_t>(config.targetColorCount)) {
        filled.resize(config.targetColorCount);
    }

    const float total = static_cast<float>(samples.size());
    std::vector<ExtractedColor> colors;
    colors.reserve(filled.size());
    for (const OctreeNode* node : filled) {
        colors.emplace_back(node->GetAverageColor(), node->pixelCount / total);
    }

    memoryBytes = tree.GetByteSize() + leaves.capacity() * sizeof(int32_t) + filled.capacity() * sizeof(const OctreeNode*);
    return colors;
}
