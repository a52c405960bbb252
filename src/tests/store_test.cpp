#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include "store/store.hpp"
#include "test_utils.hpp"

using namespace savestore::store;
using savestore::codec::Value;
using ::testing::Contains;
using ::testing::UnorderedElementsAre;

class StoreTest : public ::testing::Test {
protected:
  std::string test_dir;
  std::unique_ptr<Store> store;

  static void SetUpTestSuite() {
    init_test_logging();
  }

  void SetUp() override {
    test_dir = make_test_root("store_test");
    store = std::make_unique<Store>("store-test", test_dir);
    ASSERT_NE(store, nullptr);
    ASSERT_TRUE(std::filesystem::is_directory(test_dir));
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void write_and_verify(const std::string& path, const Value& value) {
    ASSERT_NO_THROW(store->write(path, value)) << "Failed to write path: " << path;
    ASSERT_TRUE(store->exists(path)) << "Path should exist after writing: " << path;

    Value read_back;
    ASSERT_NO_THROW(read_back = store->read(path)) << "Failed to read path: " << path;
    ASSERT_EQ(read_back, value) << "Value mismatch for path: " << path;
  }

  void expect_read_fails(const std::string& path) {
    EXPECT_FALSE(store->exists(path)) << "Path should not exist: " << path;
    EXPECT_THROW(store->read(path), NotFoundError) 
      << "Reading a missing path should throw: " << path;
  }

  static Value binary_blob() {
    return Value::binary(std::vector<std::uint8_t>{0xde, 0xad, 0xbe, 0xef, 0x00});
  }
};

TEST_F(StoreTest, ExposesTitleAndRoot) {
  EXPECT_EQ(store->project_title(), "store-test");
  EXPECT_EQ(store->root_path(), test_dir);
  EXPECT_EQ(store->root_path().back(), '/');
}

TEST_F(StoreTest, RootWithoutTrailingSeparator) {
  const std::string bare = test_dir + "bare";
  Store other("other", bare);
  EXPECT_EQ(other.root_path(), bare + "/");
  EXPECT_TRUE(std::filesystem::is_directory(bare));
}

TEST_F(StoreTest, JsonRoundTrip) {
  write_and_verify("settings.json", Value{
    {"volume", 0.75},
    {"fullscreen", true},
    {"bindings", {{"jump", "space"}, {"fire", "mouse1"}}},
    {"recent", {1, 2, 3}}
  });
}

TEST_F(StoreTest, OpaqueRoundTrip) {
  write_and_verify("slots/slot1.sav", Value{
    {"thumbnail", binary_blob()},
    {"play_time", 3600},
    {"checkpoint", "forest_gate"}
  });
}

TEST_F(StoreTest, JsonFilesAreText) {
  store->write("config.json", Value{{"difficulty", "hard"}});
  const std::string raw = read_raw_file(test_dir + "config.json");
  EXPECT_EQ(Value::parse(raw), (Value{{"difficulty", "hard"}}));
}

TEST_F(StoreTest, OtherFilesAreCbor) {
  const Value value = {{"difficulty", "hard"}};
  store->write("config.dat", value);
  const std::string raw = read_raw_file(test_dir + "config.dat");
  EXPECT_EQ(Value::from_cbor(raw), value);
}

TEST_F(StoreTest, ExistsBeforeAndAfterWrite) {
  EXPECT_FALSE(store->exists("profile/player.json"));
  store->write("profile/player.json", Value{{"name", "Ada"}});
  EXPECT_TRUE(store->exists("profile/player.json"));
  // Directories count as entries
  EXPECT_TRUE(store->exists("profile"));
}

TEST_F(StoreTest, ReadMissingPath) {
  expect_read_fails("nothing.json");
  expect_read_fails("nothing.bin");
  expect_read_fails("deep/missing/path");

  try {
    store->read("nothing.json");
    FAIL() << "Expected NotFoundError";
  } catch (const NotFoundError& e) {
    EXPECT_EQ(std::string(e.what()), test_dir + "nothing.json: No such file or directory");
  }
}

TEST_F(StoreTest, WriteCreatesIntermediateDirectories) {
  const Value value = {{"hp", 10}};
  store->write("a/b/c.json", value);

  EXPECT_TRUE(store->exists("a"));
  EXPECT_TRUE(store->exists("a/b"));
  EXPECT_TRUE(std::filesystem::is_directory(test_dir + "a/b"));
  EXPECT_THAT(store->list(), Contains("a/b/c.json"));
  EXPECT_EQ(store->read("a/b/c.json"), value);
}

TEST_F(StoreTest, ListEmptyStore) {
  EXPECT_TRUE(store->list().empty());
}

TEST_F(StoreTest, ListAfterWrites) {
  store->write("x.bin", Value{1, 2, 3});
  store->write("d/y.bin", Value("y"));
  store->write("d/e/z.json", Value{{"z", true}});

  EXPECT_THAT(store->list(), UnorderedElementsAre("x.bin", "d/y.bin", "d/e/z.json"));
}

TEST_F(StoreTest, OverwriteKeepsSecondValue) {
  write_and_verify("progress.json", Value{{"chapter", 1}, {"notes", "a long first draft of notes"}});
  write_and_verify("progress.json", Value{{"chapter", 2}});

  write_and_verify("progress.bin", Value{{"chapter", 1}});
  write_and_verify("progress.bin", Value{{"chapter", 2}});

  EXPECT_THAT(store->list(), UnorderedElementsAre("progress.json", "progress.bin"));
  EXPECT_EQ(store->read("progress.json"), (Value{{"chapter", 2}}));
}

TEST_F(StoreTest, ExtensionlessPathUsesOpaqueFormat) {
  // Binary blobs and infinities have no JSON form
  const Value value = {
    {"snapshot", binary_blob()},
    {"best_time", std::numeric_limits<double>::infinity()}
  };
  EXPECT_THROW(store->write("snapshot.json", value), EncodeError);

  write_and_verify("snapshot", value);
}

TEST_F(StoreTest, EncodeFailureLeavesExistingFileAlone) {
  const Value original = {{"version", 1}};
  store->write("state.json", original);

  EXPECT_THROW(store->write("state.json", Value{{"blob", binary_blob()}}), EncodeError);
  EXPECT_EQ(store->read("state.json"), original);
}

TEST_F(StoreTest, CorruptFilesFailToDecode) {
  write_raw_file(test_dir + "broken.json", "{\"unterminated\": ");
  write_raw_file(test_dir + "broken.bin", std::string("\xa1", 1));
  write_raw_file(test_dir + "empty.bin", "");

  EXPECT_THROW(store->read("broken.json"), DecodeError);
  EXPECT_THROW(store->read("broken.bin"), DecodeError);
  EXPECT_THROW(store->read("empty.bin"), DecodeError);
}

TEST_F(StoreTest, ReadingADirectoryIsAnIoError) {
  store->write("dir/file.json", Value{{"k", "v"}});
  EXPECT_TRUE(store->exists("dir"));
  EXPECT_THROW(store->read("dir"), IoError);
}

TEST_F(StoreTest, WritingThroughAFileIsAnIoError) {
  store->write("occupied", Value("plain file"));
  EXPECT_THROW(store->write("occupied/child.json", Value{{"k", 1}}), IoError);
  EXPECT_EQ(store->read("occupied"), Value("plain file"));
}

TEST_F(StoreTest, WritingOverADirectoryIsAnIoError) {
  store->write("dir/file.json", Value{{"k", "v"}});
  EXPECT_THROW(store->write("dir", Value("replacement")), IoError);
  EXPECT_TRUE(std::filesystem::is_directory(test_dir + "dir"));
  EXPECT_EQ(store->read("dir/file.json"), (Value{{"k", "v"}}));
}

TEST_F(StoreTest, EmptyRootIsAnIoError) {
  EXPECT_THROW(Store("store-test", ""), IoError);
}

TEST_F(StoreTest, ErrorsShareABaseType) {
  EXPECT_THROW(store->read("missing.json"), StoreError);
  EXPECT_THROW(store->write("x.json", Value{{"blob", binary_blob()}}), StoreError);
}

TEST_F(StoreTest, SurvivesReopening) {
  store->write("persist/me.json", Value{{"kept", true}});
  store.reset();

  store = std::make_unique<Store>("store-test", test_dir);
  EXPECT_EQ(store->read("persist/me.json"), (Value{{"kept", true}}));
  EXPECT_THAT(store->list(), UnorderedElementsAre("persist/me.json"));
}
