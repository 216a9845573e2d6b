#include <gtest/gtest.h>
#include <data/triples.h>

#include <fstream>

#include "testing_util.h"

class TriplesFactoryTest : public ::testing::Test {
   protected:
    std::string train_path_ = std::string(KESTREL_TEST_DIRECTORY) + "/test_data/train.tsv";
    std::string test_path_ = std::string(KESTREL_TEST_DIRECTORY) + "/test_data/test.tsv";
};

TEST_F(TriplesFactoryTest, FromPathAssignsSortedIds) {
    auto factory = TriplesFactory::fromPath(train_path_);

    ASSERT_EQ(factory->num_triples(), 18);
    ASSERT_EQ(factory->num_entities_, 8);
    ASSERT_EQ(factory->num_relations_, 2);

    ASSERT_EQ(factory->entity_to_id_["alice"], 0);
    ASSERT_EQ(factory->entity_to_id_["heidi"], 7);
    ASSERT_EQ(factory->relation_to_id_["knows"], 0);
    ASSERT_EQ(factory->relation_to_id_["works_with"], 1);

    // alice knows bob
    ASSERT_TRUE(factory->triples_[0].equal(torch::tensor(std::vector<int64_t>{0, 0, 1})));
}

TEST_F(TriplesFactoryTest, FromPathWithExistingMapping) {
    auto train = TriplesFactory::fromPath(train_path_);
    auto test = TriplesFactory::fromPath(test_path_, train->entity_to_id_, train->relation_to_id_);

    ASSERT_EQ(test->num_triples(), 3);
    ASSERT_EQ(test->num_entities_, train->num_entities_);
    ASSERT_EQ(test->num_relations_, train->num_relations_);

    // carol knows erin
    ASSERT_TRUE(test->triples_[0].equal(torch::tensor(std::vector<int64_t>{2, 0, 4})));

    std::string unknown_path = writeTmpFile("unknown.tsv", "alice\tknows\tmallory\n");
    ASSERT_THROW(TriplesFactory::fromPath(unknown_path, train->entity_to_id_, train->relation_to_id_), KestrelRuntimeException);
}

TEST_F(TriplesFactoryTest, MalformedFilesThrow) {
    ASSERT_THROW(TriplesFactory::fromPath("/tmp/kestrel_missing_triples.tsv"), KestrelRuntimeException);

    std::string two_fields = writeTmpFile("two_fields.tsv", "alice\tknows\tbob\nalice\tknows\n");
    ASSERT_THROW(TriplesFactory::fromPath(two_fields), KestrelRuntimeException);

    std::string empty = writeTmpFile("empty.tsv", "\n\n");
    ASSERT_THROW(TriplesFactory::fromPath(empty), KestrelRuntimeException);

    std::string crlf = writeTmpFile("crlf.tsv", "a\tr\tb\r\nb\tr\tc\r\n");
    auto factory = TriplesFactory::fromPath(crlf);
    ASSERT_EQ(factory->num_triples(), 2);
    ASSERT_EQ(factory->num_entities_, 3);
}

TEST_F(TriplesFactoryTest, IdsOutsideCardinalityThrow) {
    TripleList triples = torch::tensor(std::vector<int64_t>{0, 0, 1, 1, 2, 0}).view({2, 3});

    ASSERT_THROW(TriplesFactory(triples, 2, 2), IndexOutOfRangeException);
    ASSERT_THROW(TriplesFactory(triples, 1, 3), IndexOutOfRangeException);
    ASSERT_THROW(TriplesFactory(triples, 0, 3), InvalidConfigurationException);
    ASSERT_THROW(TriplesFactory(triples.narrow(1, 0, 2), 2, 3), TensorSizeMismatchException);

    TriplesFactory factory(triples, 2, 3);
    ASSERT_EQ(factory.createOWAInstances()->size(), 2);
}

TEST_F(TriplesFactoryTest, CWAInstancesGroupTails) {
    TripleList triples = torch::tensor(std::vector<int64_t>{0, 1, 0, 0, 0, 2, 1, 0, 2, 0, 0, 1, 0, 0, 2}).view({5, 3});
    TriplesFactory factory(triples, 3, 2);

    auto instances = factory.createCWAInstances();
    ASSERT_EQ(instances->size(), 3);
    ASSERT_TRUE(instances->pairs_.equal(torch::tensor(std::vector<int64_t>{0, 0, 0, 1, 1, 0}).view({3, 2})));

    LabelSets expected = {{1, 2}, {0}, {2}};
    ASSERT_EQ(instances->labels_, expected);
}

TEST_F(TriplesFactoryTest, CWAInstancesFromFile) {
    auto instances = TriplesFactory::fromPath(train_path_)->createCWAInstances();

    // alice and bob each know two people, every other (head, relation) pair has one tail
    ASSERT_EQ(instances->size(), 16);
    LabelSets::value_type alice_knows = {1, 2};
    ASSERT_EQ(instances->labels_[0], alice_knows);
}

TEST_F(TriplesFactoryTest, SaveMappings) {
    auto factory = TriplesFactory::fromPath(train_path_);
    std::string directory = "/tmp/";
    factory->saveMappings(directory);

    std::ifstream relation_file(directory + "relation_to_id.tsv");
    std::string header;
    std::string first;
    std::getline(relation_file, header);
    std::getline(relation_file, first);
    ASSERT_EQ(header, "id\tlabel");
    ASSERT_EQ(first, "0\tknows");
}

TEST(InstancesTest, CWAInstancesRequireOneLabelSetPerPair) {
    PairList pairs = torch::zeros({2, 2}, torch::kInt64);
    ASSERT_THROW(CWAInstances(pairs, {{1}}), TensorSizeMismatchException);
    ASSERT_THROW(OWAInstances(torch::Tensor()), UndefinedTensorException);
}
