/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <chunkport/exporter/export_router.hpp>
#include <chunkport/exporter/test/export_test_common.hpp>
#include <chunkport/util/test/test_sources.hpp>

using namespace chunkport;
using namespace chunkport::exporter;

class ExportRouterTest : public test::ExportTestBase {
  protected:
    void SetUp() override {
        test::ExportTestBase::SetUp();
        QueuedWriterOptions options;
        router_ = std::make_unique<ExportRouter>(
            std::make_shared<QueuedWriter>(queue_, store_, std::make_shared<CsvRowFormatter>(), options),
            std::make_shared<SyncWriter>());
    }

    std::unique_ptr<ExportRouter> router_;
};

TEST_F(ExportRouterTest, SynchronousByDefault) {
    auto definition = ExportDefinitionBuilder{"sync", test::make_source(25)}
        .chunk_size(10)
        .headings(Row{CellValue{std::string{"id"}}, CellValue{std::string{"name"}}})
        .build();
    auto handle = router_->store(definition, Destination{path("sync.csv")});

    ASSERT_FALSE(handle.has_value());
    ASSERT_TRUE(queue_->enqueued().empty());
    ASSERT_EQ(backend_->artifact_count(), 0u);
    ASSERT_EQ(read_file(path("sync.csv")), "id,name\n" + test::expected_csv(0, 25));
}

TEST_F(ExportRouterTest, QueuedWhenDefinitionAsks) {
    auto definition = ExportDefinitionBuilder{"queued", test::make_source(25)}.chunk_size(10).queue_by_default().build();
    auto handle = router_->store(definition, Destination{path("queued.csv")});

    ASSERT_TRUE(handle.has_value());
    ASSERT_FALSE(std::filesystem::exists(path("queued.csv")));
    queue_->run_all();
    ASSERT_EQ(handle->state(), chain::ChainState::succeeded(4));
    ASSERT_EQ(read_file(path("queued.csv")), test::expected_csv(0, 25));
}

TEST_F(ExportRouterTest, ExplicitQueueOverridesDefinition) {
    auto definition = ExportDefinitionBuilder{"forced", test::make_source(5)}.build();
    auto handle = router_->queue(definition, Destination{path("forced.csv")});
    ASSERT_EQ(handle.chain()->size(), 2u);
    queue_->run_all();
    ASSERT_EQ(read_file(path("forced.csv")), test::expected_csv(0, 5));
}

TEST_F(ExportRouterTest, SynchronousHonoursDeclaredSize) {
    auto source = std::make_shared<test::FaultySource>(60);
    source->report_count(40);
    auto definition = ExportDefinitionBuilder{"grouped", source}
        .chunk_size(10)
        .custom_size([](source::DataSource&, uint64_t) -> uint64_t { return 5; })
        .build();
    SyncWriter writer;
    ASSERT_EQ(writer.write(definition, Destination{path("grouped.csv")}), 50u);
    ASSERT_EQ(read_file(path("grouped.csv")), test::expected_csv(0, 50));
}

TEST_F(ExportRouterTest, SynchronousFailureLeavesNoDestination) {
    auto source = std::make_shared<test::FaultySource>(30);
    source->fail_fetch_at(20);
    auto definition = ExportDefinitionBuilder{"broken", source}.chunk_size(10).build();
    ASSERT_THROW(router_->store(definition, Destination{path("broken.csv")}), std::runtime_error);
    ASSERT_FALSE(std::filesystem::exists(path("broken.csv")));
    ASSERT_FALSE(std::filesystem::exists(path("broken.csv.partial")));
}

TEST_F(ExportRouterTest, DefinitionWithoutSource) {
    ASSERT_THROW(ExportDefinitionBuilder("nothing", nullptr).build(), ConfigurationException);
}
