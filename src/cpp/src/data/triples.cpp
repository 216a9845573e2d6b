#include "data/triples.h"

#include <fstream>
#include <set>
#include <sstream>

#include "common/util.h"
#include "configuration/constants.h"
#include "reporting/logger.h"

namespace {
std::vector<std::array<string, 3>> readLabeledTriples(string path) {
    std::ifstream input_file(path);
    if (!input_file.is_open()) {
        throw KestrelRuntimeException("Unable to open triples file: " + path);
    }

    std::vector<std::array<string, 3>> labeled_triples;
    std::string line;
    int64_t line_num = 0;
    while (std::getline(input_file, line)) {
        line_num++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            continue;
        }

        std::array<string, 3> triple;
        std::istringstream line_stream(line);
        int num_fields = 0;
        std::string field;
        while (std::getline(line_stream, field, '\t')) {
            if (num_fields < 3) {
                triple[num_fields] = field;
            }
            num_fields++;
        }

        if (num_fields != 3) {
            throw KestrelRuntimeException(fmt::format("{}:{}: expected 3 tab separated fields, got {}", path, line_num, num_fields));
        }
        labeled_triples.emplace_back(triple);
    }

    return labeled_triples;
}

std::map<string, int64_t> buildMapping(const std::set<string> &labels) {
    std::map<string, int64_t> mapping;
    int64_t id = 0;
    for (auto &label : labels) {
        mapping[label] = id++;
    }
    return mapping;
}

int64_t lookupId(const std::map<string, int64_t> &mapping, const string &label, const string &kind) {
    auto itr = mapping.find(label);
    if (itr == mapping.end()) {
        throw KestrelRuntimeException(fmt::format("Unknown {} label: {}", kind, label));
    }
    return itr->second;
}

void writeMapping(const std::map<string, int64_t> &mapping, string path) {
    std::ofstream output_file(path);
    if (!output_file.is_open()) {
        throw KestrelRuntimeException("Unable to write mapping file: " + path);
    }

    output_file << "id\tlabel\n";
    for (auto &entry : mapping) {
        output_file << entry.second << "\t" << entry.first << "\n";
    }
}

shared_ptr<TriplesFactory> buildFactory(string path, const std::vector<std::array<string, 3>> &labeled_triples, std::map<string, int64_t> entity_to_id,
                                        std::map<string, int64_t> relation_to_id) {
    if (labeled_triples.empty()) {
        throw KestrelRuntimeException("No triples found in " + path);
    }

    torch::Tensor triples = torch::empty({(int64_t)labeled_triples.size(), 3}, torch::kInt64);
    auto triples_accessor = triples.accessor<int64_t, 2>();
    for (int64_t i = 0; i < (int64_t)labeled_triples.size(); i++) {
        triples_accessor[i][0] = lookupId(entity_to_id, labeled_triples[i][0], "entity");
        triples_accessor[i][1] = lookupId(relation_to_id, labeled_triples[i][1], "relation");
        triples_accessor[i][2] = lookupId(entity_to_id, labeled_triples[i][2], "entity");
    }

    auto factory = std::make_shared<TriplesFactory>(triples, (int64_t)entity_to_id.size(), (int64_t)relation_to_id.size());
    factory->entity_to_id_ = entity_to_id;
    factory->relation_to_id_ = relation_to_id;

    SPDLOG_INFO("Loaded {} triples from {}: {} entities, {} relations", factory->num_triples(), path, factory->num_entities_, factory->num_relations_);
    return factory;
}
}  // namespace

OWAInstances::OWAInstances(TripleList triples) {
    if (!triples.defined()) {
        throw UndefinedTensorException();
    }
    triples_ = triples;
}

CWAInstances::CWAInstances(PairList pairs, LabelSets labels) {
    if (!pairs.defined()) {
        throw UndefinedTensorException();
    }

    if (pairs.size(0) != (int64_t)labels.size()) {
        throw TensorSizeMismatchException(pairs, fmt::format("Expected one label set per pair, got {} label sets", labels.size()));
    }
    pairs_ = pairs;
    labels_ = labels;
}

TriplesFactory::TriplesFactory(TripleList triples, int64_t num_entities, int64_t num_relations) {
    if (!triples.defined()) {
        throw UndefinedTensorException();
    }

    if (triples.dim() != 2 || triples.size(1) != 3) {
        throw TensorSizeMismatchException(triples, "Expected triples of shape (n, 3)");
    }

    if (num_entities <= 0 || num_relations <= 0) {
        throw InvalidConfigurationException(fmt::format("Triples factory requires positive cardinalities, got {} entities and {} relations",
                                                        num_entities, num_relations));
    }

    triples_ = triples.to(torch::kCPU, torch::kInt64).contiguous();
    num_entities_ = num_entities;
    num_relations_ = num_relations;

    assert_in_range(triples_.select(1, 0), 0, num_entities_, "Head id");
    assert_in_range(triples_.select(1, 1), 0, num_relations_, "Relation id");
    assert_in_range(triples_.select(1, 2), 0, num_entities_, "Tail id");
}

shared_ptr<TriplesFactory> TriplesFactory::fromPath(string path) {
    auto labeled_triples = readLabeledTriples(path);

    std::set<string> entity_labels;
    std::set<string> relation_labels;
    for (auto &triple : labeled_triples) {
        entity_labels.insert(triple[0]);
        relation_labels.insert(triple[1]);
        entity_labels.insert(triple[2]);
    }

    return buildFactory(path, labeled_triples, buildMapping(entity_labels), buildMapping(relation_labels));
}

shared_ptr<TriplesFactory> TriplesFactory::fromPath(string path, std::map<string, int64_t> entity_to_id, std::map<string, int64_t> relation_to_id) {
    return buildFactory(path, readLabeledTriples(path), entity_to_id, relation_to_id);
}

shared_ptr<OWAInstances> TriplesFactory::createOWAInstances() { return std::make_shared<OWAInstances>(triples_); }

shared_ptr<CWAInstances> TriplesFactory::createCWAInstances() {
    std::map<std::pair<int64_t, int64_t>, std::set<int64_t>> completions;

    auto triples_accessor = triples_.accessor<int64_t, 2>();
    for (int64_t i = 0; i < triples_.size(0); i++) {
        completions[{triples_accessor[i][0], triples_accessor[i][1]}].insert(triples_accessor[i][2]);
    }

    torch::Tensor pairs = torch::empty({(int64_t)completions.size(), 2}, torch::kInt64);
    auto pairs_accessor = pairs.accessor<int64_t, 2>();
    LabelSets labels;
    labels.reserve(completions.size());

    int64_t row = 0;
    for (auto &entry : completions) {
        pairs_accessor[row][0] = entry.first.first;
        pairs_accessor[row][1] = entry.first.second;
        labels.emplace_back(entry.second.begin(), entry.second.end());
        row++;
    }

    return std::make_shared<CWAInstances>(pairs, labels);
}

void TriplesFactory::saveMappings(string directory) {
    writeMapping(entity_to_id_, directory + PathConstants::entity_mapping_file);
    writeMapping(relation_to_id_, directory + PathConstants::relation_mapping_file);
}
