#include <benchmark/benchmark.h>
#include "uplift/crypto/hash.hpp"
#include "uplift/storage/chunk_planner.hpp"
#include "uplift/storage/upload_store.hpp"
#include "support/upload_fixtures.hpp"
#include <memory>
#include <optional>
#include <vector>

using namespace uplift;
using namespace uplift::test;
using storage::PartStatus;

class UploadStoreBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        dir_ = std::make_unique<TempDir>();
        source_ = *dir_ / "payload.bin";
        write_pattern_file(source_, 64 * KB);

        store_ = open_store(*dir_ / "bench.db");
        session_ = make_session(source_, 4 * KB, parts_);
        store_->create_session(session_, parts_);
    }

    void TearDown(const ::benchmark::State& state) override {
        store_.reset();
        dir_.reset();
    }

protected:
    std::unique_ptr<TempDir> dir_;
    std::filesystem::path source_;
    std::shared_ptr<storage::UploadStore> store_;
    storage::UploadSession session_;
    std::vector<storage::UploadPart> parts_;
};

BENCHMARK_F(UploadStoreBenchmarkFixture, CreateSession)(benchmark::State& state) {
    std::vector<storage::UploadPart> parts;
    for (auto _ : state) {
        auto session = make_session(source_, 4 * KB, parts);
        auto result = store_->create_session(session, parts);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(UploadStoreBenchmarkFixture, PartStatusTransition)(benchmark::State& state) {
    storage::PartUpdate uploading;
    uploading.status = PartStatus::UPLOADING;

    storage::PartUpdate pending;
    pending.status = PartStatus::PENDING;

    for (auto _ : state) {
        uploading.last_attempt_at = core::utils::TimeUtils::now();
        auto started = store_->update_part_status(session_.session_id, 1, uploading, PartStatus::PENDING);
        auto reset = store_->update_part_status(session_.session_id, 1, pending, PartStatus::UPLOADING);
        benchmark::DoNotOptimize(started);
        benchmark::DoNotOptimize(reset);
    }

    state.SetItemsProcessed(state.iterations() * 2);
}

BENCHMARK_F(UploadStoreBenchmarkFixture, LoadParts)(benchmark::State& state) {
    std::vector<storage::UploadPart> parts;
    for (auto _ : state) {
        auto result = store_->get_parts(session_.session_id, parts);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(parts.data());
    }

    state.SetItemsProcessed(state.iterations() * parts_.size());
}

BENCHMARK_F(UploadStoreBenchmarkFixture, CountUploadedParts)(benchmark::State& state) {
    uint32_t count = 0;
    for (auto _ : state) {
        auto result = store_->count_uploaded_parts(session_.session_id, count);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(count);
    }
}

static void BM_ChunkPlanning(benchmark::State& state) {
    storage::ChunkPlanner planner;
    std::vector<storage::ByteRange> ranges;
    auto total = static_cast<uint64_t>(state.range(0)) * MB;

    for (auto _ : state) {
        auto result = planner.plan(total, storage::ChunkPlanner::DEFAULT_MINIMUM_CHUNK_SIZE, ranges);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(ranges.data());
    }

    state.SetItemsProcessed(state.iterations() * ranges.size());
}
BENCHMARK(BM_ChunkPlanning)->Arg(100)->Arg(10 * 1024)->Arg(100 * 1024);

static void BM_PartDigest(benchmark::State& state) {
    std::vector<std::uint8_t> data(static_cast<size_t>(state.range(0)));
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) % 251);
    }

    crypto::ContentDigest digest;
    for (auto _ : state) {
        auto result = crypto::ContentHasher::hash(data, digest);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(data.size()));
}
BENCHMARK(BM_PartDigest)->Arg(64 * 1024)->Arg(5 * 1024 * 1024);
