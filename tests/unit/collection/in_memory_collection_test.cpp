#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <future>
#include <string>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "docrag_core/collection/in_memory_collection.hpp"
#include "docrag_core/errors.hpp"

namespace docrag_core {

using docrag_tests::TestUtilities;

TEST(InMemoryCollectionTest, IsNotPersistent) {
  InMemoryCollection collection;
  EXPECT_FALSE(collection.is_persistent());
}

TEST(InMemoryCollectionTest, DimensionUnsetUntilFirstAdd) {
  InMemoryCollection collection;
  EXPECT_EQ(collection.dimension(), 0u);

  // An empty batch fixes nothing
  collection.add({}, {}, {}, {});
  EXPECT_EQ(collection.dimension(), 0u);

  TestUtilities::add_document_entries(collection, "doc", {TestUtilities::basis_vector(0, 6)});
  EXPECT_EQ(collection.dimension(), 6u);
}

TEST(InMemoryCollectionTest, DimensionStaysFixedAfterRemovingEverything) {
  InMemoryCollection collection;
  TestUtilities::add_document_entries(collection, "doc", {TestUtilities::basis_vector(0, 4)});
  collection.remove({"doc_0"});

  EXPECT_EQ(collection.count(), 0u);
  EXPECT_THROW(
      TestUtilities::add_document_entries(collection, "other", {TestUtilities::basis_vector(0, 5)}),
      InvalidInputError);
}

TEST(InMemoryCollectionTest, ManyIncrementalAddsStayQueryable) {
  InMemoryCollection collection;
  for (int doc = 0; doc < 200; ++doc) {
    const std::string doc_id = "doc" + std::to_string(doc);
    TestUtilities::add_document_entries(
        collection, doc_id, {TestUtilities::create_test_vector(doc_id, 16)});
  }
  EXPECT_EQ(collection.count(), 200u);

  auto hits = collection.query(TestUtilities::create_test_vector("doc123", 16), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].metadata.doc_id, "doc123");
  EXPECT_NEAR(hits[0].distance, 0.0f, 1e-5);
}

TEST(InMemoryCollectionTest, ConcurrentAddsAndQueriesDoNotCorruptState) {
  InMemoryCollection collection;
  TestUtilities::add_document_entries(collection, "seed", {TestUtilities::basis_vector(0, 8)});

  auto writer = std::async(std::launch::async, [&]() {
    for (int i = 0; i < 100; ++i) {
      const std::string doc_id = "w" + std::to_string(i);
      TestUtilities::add_document_entries(collection, doc_id,
                                          {TestUtilities::create_test_vector(doc_id, 8)});
    }
  });
  auto reader = std::async(std::launch::async, [&]() {
    for (int i = 0; i < 100; ++i) {
      auto hits = collection.query(TestUtilities::basis_vector(0, 8), 3);
      EXPECT_FALSE(hits.empty());
      EXPECT_LE(hits.size(), 3u);
    }
  });
  writer.get();
  reader.get();

  EXPECT_EQ(collection.count(), 101u);
}

}  // namespace docrag_core
