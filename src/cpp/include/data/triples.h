#ifndef KESTREL_TRIPLES_H
#define KESTREL_TRIPLES_H

#include "common/datatypes.h"

/**
  Training instances consumed by a training loop. size() is the number of rows shuffled each epoch.
*/
class Instances {
   public:
    virtual ~Instances(){};

    virtual int64_t size() = 0;
};

/** Open-world instances: the positive triples themselves */
class OWAInstances : public Instances {
   public:
    TripleList triples_;

    OWAInstances(TripleList triples);

    int64_t size() override { return triples_.size(0); }
};

/** Closed-world instances: unique (head, relation) pairs and, per pair, every tail completing it */
class CWAInstances : public Instances {
   public:
    PairList pairs_;
    LabelSets labels_;

    CWAInstances(PairList pairs, LabelSets labels);

    int64_t size() override { return pairs_.size(0); }
};

class TriplesFactory {
   public:
    TripleList triples_;
    int64_t num_entities_;
    int64_t num_relations_;

    std::map<string, int64_t> entity_to_id_;
    std::map<string, int64_t> relation_to_id_;

    /**
      Wraps an existing id tensor of shape (n, 3). Every id must lie within its cardinality.
    */
    TriplesFactory(TripleList triples, int64_t num_entities, int64_t num_relations);

    /**
      Reads head<TAB>relation<TAB>tail labels, one triple per line. Ids follow the sorted order of the labels.
    */
    static shared_ptr<TriplesFactory> fromPath(string path);

    /**
      Reads labeled triples with an existing mapping, e.g. test triples with the mapping of the training set.
      Unknown labels throw.
    */
    static shared_ptr<TriplesFactory> fromPath(string path, std::map<string, int64_t> entity_to_id, std::map<string, int64_t> relation_to_id);

    int64_t num_triples() { return triples_.size(0); }

    shared_ptr<OWAInstances> createOWAInstances();

    shared_ptr<CWAInstances> createCWAInstances();

    /** Writes the label to id mappings as tab separated files into directory */
    void saveMappings(string directory);
};

#endif  // KESTREL_TRIPLES_H
