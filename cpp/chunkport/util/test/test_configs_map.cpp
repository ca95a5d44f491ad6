/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the
 * file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source
 * License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/util/configs_map.hpp>
#include <gtest/gtest.h>

TEST(RuntimeConfig, CaseInsensitive) {
  using namespace chunkport;

  ConfigsMap test_map;
  test_map.set_int("Export.ChunkSize", 4);
  test_map.set_string("EXPORT.defaultqueue", "exports");
  test_map.set_double("double_VALUE", 1.3);

  ASSERT_EQ(test_map.get_int("EXPORT.CHUNKSIZE"), 4);
  ASSERT_EQ(test_map.get_string("Export.DefaultQueue"), "exports");
  ASSERT_EQ(test_map.get_double("double_value"), 1.3);
  ASSERT_EQ(test_map.get_int("Export.MultiHost", 7), 7);
  ASSERT_FALSE(test_map.get_int("Export.MultiHost").has_value());
}

TEST(RuntimeConfig, ScopedConfigRestores) {
  using namespace chunkport;

  ConfigsMap::instance()->set_int("Export.ChunkSize", 10);
  {
    ScopedConfig override_size("Export.ChunkSize", 25);
    ScopedConfig override_host("Export.MultiHost", 1);
    ASSERT_EQ(ConfigsMap::instance()->get_int("Export.ChunkSize", 0), 25);
    ASSERT_EQ(ConfigsMap::instance()->get_int("Export.MultiHost", 0), 1);
  }
  ASSERT_EQ(ConfigsMap::instance()->get_int("Export.ChunkSize", 0), 10);
  ASSERT_FALSE(ConfigsMap::instance()->get_int("Export.MultiHost").has_value());
  ConfigsMap::instance()->unset_int("Export.ChunkSize");
}
