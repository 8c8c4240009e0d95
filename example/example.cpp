#include "comparison_harness.h"
#include "palette_metrics.h"
#include "pixel_sampler.h"
#include "test_images.h"
#include "color_math.h"
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <filesystem>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

struct CliOptions {
    ExtractionConfig config{ 8, 16, 0.3f, 30.0f, 64.0f };
    uint32_t seed = 0;
    int numThreads = 4;
    bool maxColorsSet = false;
    bool useSampling = false;
    SamplingStrategy sampling = SamplingStrategy::Hybrid;
    std::vector<std::string> synthetic;
    std::vector<std::string> inputs;
};

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <image|directory>...\n"
        << "  --colors N         target palette size (default 8)\n"
        << "  --max-colors N     upper bound on palette size (default 16)\n"
        << "  --distance D       hybrid fusion distance in RGB units (default 30)\n"
        << "  --quality Q        quality threshold 0..1 (default 0.3)\n"
        << "  --memory MB        working memory limit (default 64)\n"
        << "  --seed S           k-means and synthetic image seed (default 0)\n"
        << "  --threads N        images processed in parallel (default 4)\n"
        << "  --synthetic TYPE   gradient|natural|geometric|complex, may repeat\n"
        << "  --sample STRATEGY  pre-sample with uniform|importance|edge|hybrid\n"
        << "  --help             show this message\n";
}

static SamplingStrategy ParseSamplingStrategy(const std::string& name) {
    if (name == "uniform") return SamplingStrategy::Uniform;
    if (name == "importance") return SamplingStrategy::Importance;
    if (name == "edge") return SamplingStrategy::Edge;
    if (name == "hybrid") return SamplingStrategy::Hybrid;
    throw std::invalid_argument("Unknown sampling strategy: " + name);
}

// Returns false when the program should exit without processing (e.g. --help).
static bool ParseArguments(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") { PrintUsage(argv[0]); return false; }
        else if (arg == "--colors") opts.config.targetColorCount = std::stoi(next());
        else if (arg == "--max-colors") { opts.config.maxColorCount = std::stoi(next()); opts.maxColorsSet = true; }
        else if (arg == "--distance") opts.config.colorDistanceThreshold = std::stof(next());
        else if (arg == "--quality") opts.config.qualityThreshold = std::stof(next());
        else if (arg == "--memory") opts.config.memoryLimit = std::stof(next());
        else if (arg == "--seed") opts.seed = static_cast<uint32_t>(std::stoul(next()));
        else if (arg == "--threads") opts.numThreads = std::max(1, std::stoi(next()));
        else if (arg == "--synthetic") opts.synthetic.push_back(next());
        else if (arg == "--sample") { opts.sampling = ParseSamplingStrategy(next()); opts.useSampling = true; }
        else if (!arg.empty() && arg[0] == '-') throw std::invalid_argument("Unknown option: " + arg);
        else opts.inputs.push_back(arg);
    }
    // A target above the default maximum raises the maximum with it.
    if (!opts.maxColorsSet) {
        opts.config.maxColorCount = std::max(opts.config.maxColorCount, opts.config.targetColorCount);
    }
    return true;
}

static bool IsImageFile(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tga" || ext == ".gif" || ext == ".psd";
}

static bool LoadImage(const std::string& filename, RgbaImage& image, std::ostream& log) {
    int width = 0, height = 0, channels = 0;
    // Always expand to RGBA so alpha drives the opaque-pixel filter.
    uint8_t* pixels = stbi_load(filename.c_str(), &width, &height, &channels, 4);
    if (!pixels) {
        log << "Failed to load image: " << stbi_failure_reason() << std::endl;
        return false;
    }
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.assign(pixels, pixels + static_cast<size_t>(width) * height * 4);
    stbi_image_free(pixels);

    log << "Loaded " << filename << " (" << width << "x" << height << ", " << channels << " channels)" << std::endl;
    return true;
}

static std::string DescribePalette(const char* label, const std::vector<RGBColor>& colors) {
    std::string s = std::string(label) + ":";
    for (const auto& c : colors) s += " " + ColorMath::ToHex(c);
    return s;
}

static void AnalyzeImage(const std::string& label, const RgbaImage& image, const CliOptions& opts, bool verbose, std::ostream& log) {
    log << "\n--- Processing: " << label << " ---\n";

    PixelBuffer buffer = image.GetBuffer();
    std::vector<uint8_t> sampled;
    if (opts.useSampling) {
        SamplingParams params;
        params.strategy = opts.sampling;
        const auto samples = PixelSampler::Sample(buffer, params);
        sampled = PixelSampler::ToRgbaRow(samples);
        buffer = PixelBuffer(sampled.data(), static_cast<uint32_t>(samples.size()), samples.empty() ? 0 : 1);
        log << "Pre-sampled " << samples.size() << " pixels" << std::endl;
    }

    HarnessOptions harnessOptions;
    harnessOptions.seed = opts.seed;
    harnessOptions.verbose = verbose;
    ComparisonHarness harness(harnessOptions);

    auto start = std::chrono::high_resolution_clock::now();
    const ComparisonReport report = harness.Compare(buffer, opts.config);
    auto end = std::chrono::high_resolution_clock::now();

    log << ComparisonHarness::FormatReport(report);
    log << "Comparison finished in " << std::fixed << std::setprecision(2)
        << std::chrono::duration<double>(end - start).count() << "s.\n";

    if (report.HasWinner()) {
        const PaintingAnalysis analysis = PaletteMetrics::AnalyzePaintingColors(PaletteMetrics::ColorsOf(report.GetWinner().result.colors));
        log << DescribePalette("Light", analysis.light) << "\n"
            << DescribePalette("Mid", analysis.mid) << "\n"
            << DescribePalette("Dark", analysis.dark) << "\n"
            << DescribePalette("Warm", analysis.warm) << "\n"
            << DescribePalette("Neutral", analysis.neutral) << "\n"
            << DescribePalette("Cool", analysis.cool) << "\n"
            << "Diversity: " << std::setprecision(3) << analysis.diversity
            << ", luminance coverage: " << analysis.coverage << std::endl;
    }
}

int main(int argc, char** argv) {
    try {
        CliOptions opts;
        if (!ParseArguments(argc, argv, opts)) return 0;
        ValidateConfig(opts.config);

        std::vector<fs::path> files;
        for (const auto& input : opts.inputs) {
            if (fs::is_directory(input)) {
                for (const auto& file : fs::directory_iterator(input)) {
                    if (IsImageFile(file.path())) files.push_back(file.path());
                }
            }
            else if (fs::exists(input)) {
                files.push_back(input);
            }
            else {
                std::cerr << "Error: '" << input << "' not found." << std::endl;
                return 1;
            }
        }
        std::vector<TestImageType> synthetic;
        for (const auto& name : opts.synthetic) synthetic.push_back(ParseTestImageType(name));

        if (files.empty() && synthetic.empty()) {
            PrintUsage(argv[0]);
            return 1;
        }

        const bool verbose = files.size() + synthetic.size() == 1;
        for (TestImageType type : synthetic) {
            RgbaImage image = GenerateTestImage(type, 256, 256, opts.seed);
            AnalyzeImage(std::string("synthetic ") + GetTestImageName(type), image, opts, verbose, std::cout);
        }

        // Reports are buffered per file and printed in input order.
        std::vector<std::string> reports(files.size());
        int failures = 0;
#pragma omp parallel for num_threads(opts.numThreads) reduction(+:failures)
        for (int64_t i = 0; i < static_cast<int64_t>(files.size()); ++i) {
            std::ostringstream log;
            try {
                RgbaImage image;
                if (LoadImage(files[i].string(), image, log)) {
                    AnalyzeImage(files[i].filename().string(), image, opts, verbose, log);
                }
                else {
                    failures++;
                }
            }
            catch (const std::exception& e) {
                log << "An error occurred during processing: " << e.what() << std::endl;
                failures++;
            }
            reports[i] = log.str();
        }
        for (const auto& r : reports) std::cout << r;

        if (failures > 0) {
            std::cerr << failures << " image(s) could not be processed." << std::endl;
            return 1;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "A critical error occurred: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
