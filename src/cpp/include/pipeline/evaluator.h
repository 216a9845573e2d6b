#ifndef KESTREL_EVALUATOR_H
#define KESTREL_EVALUATOR_H

#include "nn/model.h"
#include "reporting/reporting.h"

/**
  Rank-based link prediction evaluation. Every test triple is ranked against all entities as a tail
  (score_t) and as a head (score_h). In the filtered setting, other known triples are removed from the
  candidate lists before ranking.
*/
class LinkPredictionEvaluator {
    shared_ptr<KGEModel> model_;
    shared_ptr<LinkPredictionReporter> reporter_;
    int batch_size_;
    bool filtered_;

    std::map<std::pair<int64_t, int64_t>, std::vector<int64_t>> known_tails_;
    std::map<std::pair<int64_t, int64_t>, std::vector<int64_t>> known_heads_;

    void filterScores(torch::Tensor scores, torch::Tensor keys, torch::Tensor targets, bool tails);

   public:
    /**
      @param filter_triples Known triples removed from the candidates when filtered is set
    */
    LinkPredictionEvaluator(shared_ptr<KGEModel> model, int batch_size = 256, bool filtered = false, std::vector<TripleList> filter_triples = {});

    /**
      Ranks the test triples and reports mean rank, MRR and Hits@{1, 3, 10}.
      @return Metric values keyed by metric name
    */
    std::map<std::string, double> evaluate(TripleList test_triples);

    shared_ptr<LinkPredictionReporter> getReporter() { return reporter_; }
};

#endif  // KESTREL_EVALUATOR_H
