/**
 * @file bench_checksum.cpp
 * @brief Benchmarks for checksum computation and manifest handling
 */

#include <benchmark/benchmark.h>

#include <transfer_queue/core/checksum.h>
#include <transfer_queue/core/checksum_verifier.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace transfer_queue::benchmark {

namespace {

auto generate_random_data(std::size_t size, std::uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

/**
 * @brief Temporary file removed when the benchmark finishes
 */
class temp_file {
public:
    temp_file(const std::string& name, std::size_t size)
        : path_(std::filesystem::temp_directory_path() / ("tq_bench_" + name)) {
        auto data = generate_random_data(size, 42);
        std::ofstream file(path_, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }

    ~temp_file() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    temp_file(const temp_file&) = delete;
    auto operator=(const temp_file&) -> temp_file& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

static void BM_Checksum_Compute(::benchmark::State& state) {
    const auto algorithm = static_cast<checksum_algorithm>(state.range(0));
    const auto size = static_cast<std::size_t>(state.range(1));
    auto data = generate_random_data(size, 42);

    for (auto _ : state) {
        auto digest = checksum::compute(data, algorithm);
        if (!digest) {
            state.SkipWithError("checksum computation failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetLabel(to_string(algorithm));
    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_ComputeFile(::benchmark::State& state) {
    const auto algorithm = static_cast<checksum_algorithm>(state.range(0));
    const auto size = static_cast<std::size_t>(state.range(1));
    temp_file file("compute_file.bin", size);

    for (auto _ : state) {
        auto digest = checksum::compute_file(file.path(), algorithm);
        if (!digest) {
            state.SkipWithError("file checksum failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetLabel(to_string(algorithm));
    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

static void BM_Verifier_BlockSize(::benchmark::State& state) {
    const auto block_size = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t file_size = 16 * 1024 * 1024;
    temp_file file("verify.bin", file_size);

    auto expected = checksum::compute_file(file.path(), checksum_algorithm::sha256);
    if (!expected) {
        state.SkipWithError("reference checksum failed");
        return;
    }
    checksum_verifier verifier(block_size);

    for (auto _ : state) {
        auto matched = verifier.verify(file.path(), checksum_algorithm::sha256, expected.value());
        if (!matched || !matched.value()) {
            state.SkipWithError("verification failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Manifest_Load(::benchmark::State& state) {
    const auto entries = static_cast<std::size_t>(state.range(0));
    std::ostringstream content;
    content << "; generated\n";
    for (std::size_t i = 0; i < entries; ++i) {
        content << "release_" << i << ".bin " << checksum::to_hex(static_cast<std::uint32_t>(i))
                << "\n";
    }
    auto text = content.str();

    for (auto _ : state) {
        auto parsed = checksum_verifier::load_manifest(text, manifest_dialect::crc32_sfv);
        ::benchmark::DoNotOptimize(parsed);
    }

    state.SetItemsProcessed(static_cast<int64_t>(entries) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_Compute)
    ->ArgsProduct({{static_cast<int64_t>(checksum_algorithm::crc32),
                    static_cast<int64_t>(checksum_algorithm::md5),
                    static_cast<int64_t>(checksum_algorithm::sha1),
                    static_cast<int64_t>(checksum_algorithm::sha256),
                    static_cast<int64_t>(checksum_algorithm::sha512)},
                   {4 * 1024, 1024 * 1024}})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_ComputeFile)
    ->ArgsProduct({{static_cast<int64_t>(checksum_algorithm::crc32),
                    static_cast<int64_t>(checksum_algorithm::sha256)},
                   {1024 * 1024, 16 * 1024 * 1024}})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Verifier_BlockSize)
    ->Arg(4 * 1024)
    ->Arg(64 * 1024)
    ->Arg(1024 * 1024)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Manifest_Load)->Arg(100)->Arg(10000);

}  // namespace transfer_queue::benchmark
