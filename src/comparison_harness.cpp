#include "comparison_harness.h"
#include "octree_quantizer.h"
#include "median_cut_quantizer.h"
#include "kmeans_quantizer.h"
#include "color_math.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

const AlgorithmRun& ComparisonReport::GetWinner() const {
    if (!HasWinner()) {
        throw std::runtime_error("Comparison has no winner: every algorithm failed");
    }
    return runs[winner];
}

ComparisonHarness::ComparisonHarness(const HarnessOptions& opts)
    : options(opts) {
    KMeansOptions kmeansOptions;
    kmeansOptions.seed = options.seed;

    HybridOptions hybridOptions;
    hybridOptions.policy = options.hybridPolicy;
    hybridOptions.kmeans = kmeansOptions;

    quantizers.push_back(std::make_unique<OctreeQuantizer>());
    quantizers.push_back(std::make_unique<MedianCutQuantizer>());
    quantizers.push_back(std::make_unique<KMeansQuantizer>(kmeansOptions));
    quantizers.push_back(std::make_unique<HybridQuantizer>(hybridOptions));
}

ComparisonHarness::ComparisonHarness(std::vector<std::unique_ptr<ColorQuantizer>> customQuantizers, const HarnessOptions& opts)
    : quantizers(std::move(customQuantizers)), options(opts) {
    for (const auto& q : quantizers) {
        if (!q) throw std::invalid_argument("ComparisonHarness: null quantizer");
    }
}

float ComparisonHarness::OverallScore(const ExtractionResult& result) {
    const double speedScore = std::max(0.0, 1.0 - result.extractionTime / 1000.0);
    const double memoryScore = std::max(0.0, 1.0 - static_cast<double>(result.memoryUsage) / (1024.0 * 1024.0 * 100.0));
    return static_cast<float>(result.qualityScore * 0.6 + speedScore * 0.3 + memoryScore * 0.1);
}

size_t ComparisonHarness::SelectWinner(const std::vector<AlgorithmRun>& runs) {
    size_t bestIndex = ComparisonReport::NO_WINNER;
    for (size_t i = 0; i < runs.size(); ++i) {
        const AlgorithmRun& run = runs[i];
        if (!run.succeeded) continue;
        if (bestIndex == ComparisonReport::NO_WINNER || run.overallScore > runs[bestIndex].overallScore) {
            bestIndex = i;
        }
    }
    return bestIndex;
}

ComparisonReport ComparisonHarness::Compare(const PixelBuffer& buffer, const ExtractionConfig& config) const {
    ValidateConfig(config);
    ValidateBuffer(buffer);

    ComparisonReport report;
    report.runs.reserve(quantizers.size());
    for (const auto& quantizer : quantizers) {
        AlgorithmRun run;
        run.algorithm = quantizer->Name();
        if (options.verbose) {
            std::cout << "Running " << run.algorithm << " on " << buffer.width << "x" << buffer.height << "..." << std::endl;
        }

        try {
            run.result = quantizer->Quantize(buffer, config);
            run.succeeded = true;
            run.overallScore = OverallScore(run.result);
        }
        catch (const std::exception& e) {
            run.error = e.what();
            std::cerr << "Algorithm " << run.algorithm << " failed: " << e.what() << std::endl;
        }

        if (options.verbose && run.succeeded) {
            std::cout << "  " << run.result.colorCount << " colors in " << std::fixed << std::setprecision(2)
                << run.result.extractionTime << " ms, quality " << std::setprecision(3) << run.result.qualityScore << std::endl;
        }
        report.runs.push_back(std::move(run));
    }

    report.winner = SelectWinner(report.runs);
    return report;
}

std::string ComparisonHarness::FormatReport(const ComparisonReport& report) {
    std::ostringstream out;
    out << std::left << std::setw(18) << "Algorithm"
        << std::right << std::setw(12) << "Time (ms)"
        << std::setw(10) << "Quality"
        << std::setw(14) << "Memory (KB)"
        << std::setw(8) << "Colors"
        << std::setw(10) << "Overall"
        << "  Status\n";
    out << std::string(80, '-') << "\n";

    for (const auto& run : report.runs) {
        out << std::left << std::setw(18) << run.algorithm << std::right;
        if (!run.succeeded) {
            out << std::setw(12) << "-" << std::setw(10) << "-" << std::setw(14) << "-"
                << std::setw(8) << "-" << std::setw(10) << "-" << "  FAILED: " << run.error << "\n";
            continue;
        }
        out << std::fixed
            << std::setw(12) << std::setprecision(2) << run.result.extractionTime
            << std::setw(10) << std::setprecision(3) << run.result.qualityScore
            << std::setw(14) << std::setprecision(1) << run.result.memoryUsage / 1024.0
            << std::setw(8) << run.result.colorCount
            << std::setw(10) << std::setprecision(3) << run.overallScore
            << "  " << (run.result.meetsQualityThreshold ? "ok" : "below quality threshold") << "\n";
    }
    out << std::string(80, '-') << "\n";

    if (report.HasWinner()) {
        const AlgorithmRun& winner = report.GetWinner();
        out << "Winner: " << winner.algorithm << " (overall " << std::fixed << std::setprecision(3) << winner.overallScore << ")\n";
        out << "Palette:";
        for (const auto& c : winner.result.colors) {
            out << " " << ColorMath::ToHex(c.color);
        }
        out << "\n";
    }
    else {
        out << "Winner: none (all algorithms failed)\n";
    }
    return out.str();
}
