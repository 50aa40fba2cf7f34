#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cmath>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "docrag_core/collection/in_memory_collection.hpp"
#include "docrag_core/collection/persistent_collection.hpp"
#include "docrag_core/errors.hpp"

namespace docrag_core {

using docrag_tests::TestUtilities;
using testing::ElementsAre;

// Both backends must rank, filter and delete identically for the same data.
struct InMemoryBackend {
  std::unique_ptr<VectorCollection> open(const std::filesystem::path &) {
    return std::make_unique<InMemoryCollection>();
  }
};

struct PersistentBackend {
  std::unique_ptr<VectorCollection> open(const std::filesystem::path &dir) {
    return std::make_unique<PersistentCollection>(dir / "collection.db", /*pool_size*/ 2);
  }
};

template <typename Backend>
class VectorCollectionContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_test_dir();
    collection_ = Backend().open(temp_dir_);
  }

  void TearDown() override {
    collection_.reset();
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  void add_single(const std::string &id, const Embedding &vector, const std::string &document,
                  const std::string &doc_id = "doc", int chunk_index = 0) {
    collection_->add({id}, {vector}, {document},
                     {TestUtilities::create_test_metadata(doc_id, chunk_index)});
  }

  std::vector<std::string> documents_of(const std::vector<QueryHit> &hits) {
    std::vector<std::string> documents;
    for (const auto &hit : hits)
      documents.push_back(hit.document);
    return documents;
  }

  std::filesystem::path temp_dir_;
  std::unique_ptr<VectorCollection> collection_;
};

using Backends = ::testing::Types<InMemoryBackend, PersistentBackend>;
TYPED_TEST_SUITE(VectorCollectionContractTest, Backends);

TYPED_TEST(VectorCollectionContractTest, EmptyCollectionQueryReturnsNothing) {
  EXPECT_EQ(this->collection_->count(), 0u);
  EXPECT_TRUE(this->collection_->query({1.0f, 0.0f, 0.0f, 0.0f}, 5).empty());
}

TYPED_TEST(VectorCollectionContractTest, RanksByAscendingCosineDistance) {
  this->add_single("a", {1.0f, 0.0f, 0.0f, 0.0f}, "east", "doc", 0);
  this->add_single("b", {0.0f, 1.0f, 0.0f, 0.0f}, "north", "doc", 1);
  this->add_single("c", {1.0f, 1.0f, 0.0f, 0.0f}, "north-east", "doc", 2);

  // Magnitude must not matter for cosine similarity
  auto hits = this->collection_->query({10.0f, 0.0f, 0.0f, 0.0f}, 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_THAT(this->documents_of(hits), ElementsAre("east", "north-east", "north"));
  EXPECT_NEAR(hits[0].distance, 0.0f, 1e-5);
  EXPECT_NEAR(hits[1].distance, 1.0f - 1.0f / std::sqrt(2.0f), 1e-5);
  EXPECT_NEAR(hits[2].distance, 1.0f, 1e-5);
  EXPECT_EQ(hits[0].metadata, TestUtilities::create_test_metadata("doc", 0));
}

TYPED_TEST(VectorCollectionContractTest, TopKLimitsResults) {
  TestUtilities::add_document_entries(*this->collection_, "doc",
                                      {TestUtilities::basis_vector(0), TestUtilities::basis_vector(1),
                                       TestUtilities::basis_vector(2)});
  EXPECT_EQ(this->collection_->query(TestUtilities::basis_vector(1), 2).size(), 2u);
  EXPECT_EQ(this->collection_->query(TestUtilities::basis_vector(1), 10).size(), 3u);
  EXPECT_EQ(this->collection_->query(TestUtilities::basis_vector(1), 1)[0].document, "doc chunk 1");
}

TYPED_TEST(VectorCollectionContractTest, ExactTiesKeepInsertionOrder) {
  const Embedding same = {0.2f, 0.4f, 0.4f, 0.8f};
  std::vector<Embedding> vectors(6, same);
  TestUtilities::add_document_entries(*this->collection_, "tied", vectors);

  auto hits = this->collection_->query(same, 2);
  EXPECT_THAT(this->documents_of(hits), ElementsAre("tied chunk 0", "tied chunk 1"));

  hits = this->collection_->query({0.0f, 0.0f, 0.0f, 1.0f}, 6);
  EXPECT_THAT(this->documents_of(hits),
              ElementsAre("tied chunk 0", "tied chunk 1", "tied chunk 2", "tied chunk 3",
                          "tied chunk 4", "tied chunk 5"));
}

TYPED_TEST(VectorCollectionContractTest, ZeroNormVectorsScoreZeroSimilarity) {
  this->add_single("zero", {0.0f, 0.0f, 0.0f, 0.0f}, "zero");
  this->add_single("opposite", {-1.0f, 0.0f, 0.0f, 0.0f}, "opposite", "doc", 1);
  this->add_single("same", {1.0f, 0.0f, 0.0f, 0.0f}, "same", "doc", 2);

  auto hits = this->collection_->query({1.0f, 0.0f, 0.0f, 0.0f}, 3);
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_THAT(this->documents_of(hits), ElementsAre("same", "zero", "opposite"));
  EXPECT_NEAR(hits[1].distance, 1.0f, 1e-6);
  for (const auto &hit : hits) {
    EXPECT_FALSE(std::isnan(hit.distance));
  }

  // A zero query ties everything at distance 1, in insertion order
  hits = this->collection_->query({0.0f, 0.0f, 0.0f, 0.0f}, 3);
  EXPECT_THAT(this->documents_of(hits), ElementsAre("zero", "opposite", "same"));
  for (const auto &hit : hits) {
    EXPECT_NEAR(hit.distance, 1.0f, 1e-6);
  }
}

TYPED_TEST(VectorCollectionContractTest, ResultsAreSortedByNonDecreasingDistance) {
  std::vector<Embedding> vectors;
  for (int i = 0; i < 20; ++i) {
    vectors.push_back(TestUtilities::create_test_vector("entry" + std::to_string(i), 8));
  }
  TestUtilities::add_document_entries(*this->collection_, "random", vectors);

  auto hits = this->collection_->query(TestUtilities::create_test_vector("probe", 8), 20);
  ASSERT_EQ(hits.size(), 20u);
  for (size_t i = 1; i < hits.size(); ++i) {
    EXPECT_LE(hits[i - 1].distance, hits[i].distance);
  }
}

TYPED_TEST(VectorCollectionContractTest, GetByFilterMatchesEveryGivenField) {
  this->collection_->add(
      {"a_0", "a_1", "b_0"},
      {TestUtilities::basis_vector(0), TestUtilities::basis_vector(1), TestUtilities::basis_vector(2)},
      {"a0", "a1", "b0"},
      {TestUtilities::create_test_metadata("a", 0, "a.md", ".md"),
       TestUtilities::create_test_metadata("a", 1, "a.md", ".md"),
       TestUtilities::create_test_metadata("b", 0, "b.txt", ".txt")});

  EXPECT_THAT(this->collection_->get_by_filter(MetadataFilter::for_doc_id("a")),
              ElementsAre("a_0", "a_1"));

  MetadataFilter by_index;
  by_index.chunk_index = 0;
  EXPECT_THAT(this->collection_->get_by_filter(by_index), ElementsAre("a_0", "b_0"));

  MetadataFilter combined;
  combined.doc_id = "a";
  combined.chunk_index = 1;
  combined.file_type = ".md";
  EXPECT_THAT(this->collection_->get_by_filter(combined), ElementsAre("a_1"));

  MetadataFilter by_filename;
  by_filename.filename = "b.txt";
  EXPECT_THAT(this->collection_->get_by_filter(by_filename), ElementsAre("b_0"));

  EXPECT_TRUE(this->collection_->get_by_filter(MetadataFilter::for_doc_id("missing")).empty());
  EXPECT_THAT(this->collection_->get_by_filter(MetadataFilter{}), ElementsAre("a_0", "a_1", "b_0"));
}

TYPED_TEST(VectorCollectionContractTest, RemoveKeepsSurvivorOrderAndIgnoresUnknownIds) {
  TestUtilities::add_document_entries(*this->collection_, "doc",
                                      {TestUtilities::basis_vector(0), TestUtilities::basis_vector(1),
                                       TestUtilities::basis_vector(2), TestUtilities::basis_vector(3)});

  this->collection_->remove({"doc_1", "unknown"});
  EXPECT_EQ(this->collection_->count(), 3u);
  EXPECT_THAT(this->collection_->get_by_filter(MetadataFilter{}),
              ElementsAre("doc_0", "doc_2", "doc_3"));

  // Removed entries never come back from a query
  auto hits = this->collection_->query(TestUtilities::basis_vector(1), 4);
  ASSERT_EQ(hits.size(), 3u);
  for (const auto &hit : hits) {
    EXPECT_NE(hit.document, "doc chunk 1");
  }

  this->collection_->remove({"unknown"});
  this->collection_->remove({});
  EXPECT_EQ(this->collection_->count(), 3u);
}

TYPED_TEST(VectorCollectionContractTest, RemovedIdCanBeAddedAgain) {
  this->add_single("x", TestUtilities::basis_vector(0), "first");
  this->collection_->remove({"x"});
  this->add_single("x", TestUtilities::basis_vector(1), "second");

  auto hits = this->collection_->query(TestUtilities::basis_vector(1), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].document, "second");
}

TYPED_TEST(VectorCollectionContractTest, MismatchedLengthsAreRejectedWithoutChanges) {
  EXPECT_THROW(this->collection_->add({"a", "b"}, {TestUtilities::basis_vector(0)}, {"a", "b"},
                                      {TestUtilities::create_test_metadata("doc", 0),
                                       TestUtilities::create_test_metadata("doc", 1)}),
               InvalidInputError);
  EXPECT_THROW(this->collection_->add({"a"}, {TestUtilities::basis_vector(0)}, {},
                                      {TestUtilities::create_test_metadata("doc", 0)}),
               InvalidInputError);
  EXPECT_EQ(this->collection_->count(), 0u);
}

TYPED_TEST(VectorCollectionContractTest, DuplicateIdsAreRejectedWithoutChanges) {
  this->add_single("dup", TestUtilities::basis_vector(0), "original");

  // Already present
  EXPECT_THROW(this->collection_->add({"new", "dup"},
                                      {TestUtilities::basis_vector(1), TestUtilities::basis_vector(2)},
                                      {"new", "again"},
                                      {TestUtilities::create_test_metadata("doc", 1),
                                       TestUtilities::create_test_metadata("doc", 2)}),
               InvalidInputError);
  // Repeated within one call
  EXPECT_THROW(this->collection_->add({"twice", "twice"},
                                      {TestUtilities::basis_vector(1), TestUtilities::basis_vector(2)},
                                      {"one", "two"},
                                      {TestUtilities::create_test_metadata("doc", 1),
                                       TestUtilities::create_test_metadata("doc", 2)}),
               InvalidInputError);

  EXPECT_EQ(this->collection_->count(), 1u);
  EXPECT_THAT(this->collection_->get_by_filter(MetadataFilter{}), ElementsAre("dup"));
}

TYPED_TEST(VectorCollectionContractTest, DimensionIsFixedByFirstAdd) {
  this->add_single("four", TestUtilities::basis_vector(0, 4), "four");

  EXPECT_THROW(this->add_single("three", TestUtilities::basis_vector(0, 3), "three", "doc", 1),
               InvalidInputError);
  EXPECT_THROW(this->collection_->query(TestUtilities::basis_vector(0, 3), 1), InvalidInputError);
  EXPECT_THROW(this->add_single("empty", Embedding{}, "empty", "doc", 2), InvalidInputError);
  EXPECT_EQ(this->collection_->count(), 1u);
}

TYPED_TEST(VectorCollectionContractTest, QueryValidatesTopKAndVector) {
  this->add_single("a", TestUtilities::basis_vector(0), "a");
  EXPECT_THROW(this->collection_->query(TestUtilities::basis_vector(0), 0), InvalidInputError);
  EXPECT_THROW(this->collection_->query(Embedding{}, 1), InvalidInputError);
}

TYPED_TEST(VectorCollectionContractTest, EntriesWithoutDocIdAreRejected) {
  EXPECT_THROW(this->collection_->add({"a"}, {TestUtilities::basis_vector(0)}, {"a"},
                                      {TestUtilities::create_test_metadata("", 0)}),
               InvalidInputError);
  EXPECT_THROW(this->collection_->add({""}, {TestUtilities::basis_vector(0)}, {"a"},
                                      {TestUtilities::create_test_metadata("doc", 0)}),
               InvalidInputError);
}

TYPED_TEST(VectorCollectionContractTest, EmptyDocumentTextIsPreserved) {
  this->add_single("blank", TestUtilities::basis_vector(0), "");
  auto hits = this->collection_->query(TestUtilities::basis_vector(0), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].document, "");
}

TYPED_TEST(VectorCollectionContractTest, ConcurrentWritersAndReadersKeepStateConsistent) {
  constexpr int kRounds = 40;
  TestUtilities::add_document_entries(*this->collection_, "seed",
                                      {TestUtilities::basis_vector(0, 8)});

  auto adder = std::async(std::launch::async, [&]() {
    for (int i = 0; i < kRounds; ++i) {
      const std::string doc_id = "w" + std::to_string(i);
      TestUtilities::add_document_entries(*this->collection_, doc_id,
                                          {TestUtilities::create_test_vector(doc_id, 8)});
    }
  });
  auto churner = std::async(std::launch::async, [&]() {
    for (int i = 0; i < kRounds; ++i) {
      const std::string doc_id = "r" + std::to_string(i);
      TestUtilities::add_document_entries(*this->collection_, doc_id,
                                          {TestUtilities::create_test_vector(doc_id, 8)});
      this->collection_->remove({doc_id + "_0"});
    }
  });
  auto reader = std::async(std::launch::async, [&]() {
    for (int i = 0; i < kRounds; ++i) {
      auto hits = this->collection_->query(TestUtilities::basis_vector(0, 8), 3);
      EXPECT_FALSE(hits.empty());
      EXPECT_LE(hits.size(), 3u);
      EXPECT_EQ(this->collection_->get_by_filter(MetadataFilter::for_doc_id("seed")).size(), 1u);
    }
  });
  adder.get();
  churner.get();
  reader.get();

  EXPECT_EQ(this->collection_->count(), static_cast<size_t>(kRounds + 1));
  auto top = this->collection_->query(TestUtilities::basis_vector(0, 8), 1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].document, "seed chunk 0");
  for (int i = 0; i < kRounds; ++i) {
    EXPECT_TRUE(
        this->collection_->get_by_filter(MetadataFilter::for_doc_id("r" + std::to_string(i)))
            .empty());
  }
}

}  // namespace docrag_core
