/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <chunkport/exporter/chunk_write_job.hpp>
#include <chunkport/exporter/finalize_export_job.hpp>
#include <chunkport/exporter/test/export_test_common.hpp>
#include <chunkport/util/test/test_sources.hpp>

#include <stdexcept>

using namespace chunkport;
using namespace chunkport::exporter;

namespace {

class ThrowingFormatter final : public RowFormatter {
  public:
    [[nodiscard]] std::string name() const override { return "throwing"; }

  private:
    std::string do_format_row(const Row&) const override {
        throw std::runtime_error("unsupported cell");
    }
};

class IntThrowingSource final : public source::DataSource {
  public:
    [[nodiscard]] std::string name() const override { return "int-throwing"; }

  private:
    RowCount do_count() override { return 10; }

    Rows do_fetch_range(RowOffset, RowCount) override {
        throw 42;
    }
};

} // namespace

class ChunkWriteJobTest : public test::ExportTestBase {
  protected:
    std::shared_ptr<const RowFormatter> csv_ = std::make_shared<CsvRowFormatter>();
};

TEST_F(ChunkWriteJobTest, WritesItsOwnChunk) {
    auto artifact = store_->create("artifact");
    ChunkWriteJob job{test::make_source(250), 100, 2, artifact, csv_};
    ASSERT_EQ(job.name(), "chunk-2");
    job.execute();
    ASSERT_EQ(artifact.slots(), (std::vector<storage::SlotIndex>{2}));
    ASSERT_EQ(artifact.read_slot(2), test::expected_csv(200, 250));
}

TEST_F(ChunkWriteJobTest, ExecutingTwiceEqualsExecutingOnce) {
    auto source = test::make_source(250);
    auto once = store_->create("once");
    auto twice = store_->create("twice");
    ChunkWriteJob{source, 100, 1, once, csv_}.execute();
    ChunkWriteJob job{source, 100, 1, twice, csv_};
    job.execute();
    job.execute();
    ASSERT_EQ(once.slots(), twice.slots());
    ASSERT_EQ(once.read_slot(1), twice.read_slot(1));
}

TEST_F(ChunkWriteJobTest, ExecuteWithMaterializedChunk) {
    auto artifact = store_->create("artifact");
    ChunkWriteJob job{test::make_source(0), 10, 0, artifact, csv_};
    Chunk chunk{4, 40, test::make_rows(2)};
    job.execute(chunk, artifact);
    ASSERT_EQ(artifact.read_slot(4), test::expected_csv(0, 2));
}

TEST_F(ChunkWriteJobTest, ChunkPastEndIsWrittenEmpty) {
    auto artifact = store_->create("artifact");
    ChunkWriteJob{test::make_source(10), 10, 3, artifact, csv_}.execute();
    ASSERT_TRUE(artifact.slot_exists(3));
    ASSERT_EQ(artifact.read_slot(3), "");
}

TEST_F(ChunkWriteJobTest, ReadFailure) {
    auto source = std::make_shared<test::FaultySource>(50);
    source->fail_fetch_at(20);
    auto artifact = store_->create("artifact");
    ASSERT_THROW(ChunkWriteJob(source, 10, 2, artifact, csv_).execute(), ChunkWriteException);
    ASSERT_FALSE(artifact.slot_exists(2));
    ASSERT_NO_THROW(ChunkWriteJob(source, 10, 1, artifact, csv_).execute());
}

TEST_F(ChunkWriteJobTest, NonStandardReadFailure) {
    auto artifact = store_->create("artifact");
    ChunkWriteJob job{std::make_shared<IntThrowingSource>(), 10, 0, artifact, csv_};
    try {
        job.execute();
        FAIL() << "expected a chunk write error";
    } catch (const ChunkWriteException& e) {
        ASSERT_NE(std::string(e.what()).find("E_ROW_READ_FAILED"), std::string::npos);
    }
    ASSERT_FALSE(artifact.slot_exists(0));
}

TEST_F(ChunkWriteJobTest, SerializationFailure) {
    auto artifact = store_->create("artifact");
    ChunkWriteJob job{test::make_source(5), 10, 0, artifact, std::make_shared<ThrowingFormatter>()};
    ASSERT_THROW(job.execute(), ChunkWriteException);
    ASSERT_FALSE(artifact.slot_exists(0));
}

TEST_F(ChunkWriteJobTest, WriteFailure) {
    auto artifact = store_->resolve("never-created");
    ChunkWriteJob job{test::make_source(5), 10, 0, artifact, csv_};
    try {
        job.execute();
        FAIL() << "expected a chunk write error";
    } catch (const ChunkWriteException& e) {
        ASSERT_NE(std::string(e.what()).find("E_ARTIFACT_WRITE_FAILED"), std::string::npos);
    }
}

TEST_F(ChunkWriteJobTest, FinalizeMergesInIndexOrder) {
    auto artifact = store_->create("artifact");
    auto source = test::make_source(25);
    for (ChunkIndex index : {2, 0, 1})
        ChunkWriteJob{source, 10, index, artifact, csv_}.execute();

    const auto destination = path("merged.csv");
    FinalizeExportJob finalize{artifact, 3, Destination{destination}, Row{CellValue{std::string{"id"}}, CellValue{std::string{"name"}}}, csv_};
    finalize.execute();

    ASSERT_EQ(read_file(destination), "id,name\n" + test::expected_csv(0, 25));
    ASSERT_FALSE(artifact.exists());
}

TEST_F(ChunkWriteJobTest, FinalizeNeedsEverySlot) {
    auto artifact = store_->create("artifact");
    auto source = test::make_source(25);
    ChunkWriteJob{source, 10, 0, artifact, csv_}.execute();
    ChunkWriteJob{source, 10, 2, artifact, csv_}.execute();

    const auto destination = path("merged.csv");
    FinalizeExportJob finalize{artifact, 3, Destination{destination}, std::nullopt, csv_};
    ASSERT_THROW(finalize.execute(), ArtifactNotFoundException);
    ASSERT_FALSE(std::filesystem::exists(destination));
    ASSERT_TRUE(artifact.exists());

    artifact.release();
    ASSERT_THROW(finalize.execute(), ArtifactNotFoundException);
}
