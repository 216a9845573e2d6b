#ifndef KESTREL_SRC_CPP_INCLUDE_REPORTING_H_
#define KESTREL_SRC_CPP_INCLUDE_REPORTING_H_

#include <mutex>

#include "common/datatypes.h"

class Metric {
   public:
    std::string name_;
    std::string unit_;

    virtual ~Metric(){};
};

class RankingMetric : public Metric {
   public:
    virtual torch::Tensor computeMetric(torch::Tensor ranks) = 0;
};

class HitskMetric : public RankingMetric {
    int k_;

   public:
    HitskMetric(int k);

    torch::Tensor computeMetric(torch::Tensor ranks) override;
};

class MeanRankMetric : public RankingMetric {
   public:
    MeanRankMetric();

    torch::Tensor computeMetric(torch::Tensor ranks) override;
};

class MeanReciprocalRankMetric : public RankingMetric {
   public:
    MeanReciprocalRankMetric();

    torch::Tensor computeMetric(torch::Tensor ranks) override;
};

class Reporter {
   private:
    std::mutex lock_;

   public:
    std::vector<shared_ptr<Metric>> metrics_;

    virtual ~Reporter(){};

    void lock() { lock_.lock(); }

    void unlock() { lock_.unlock(); }

    void addMetric(shared_ptr<Metric> metric) { metrics_.emplace_back(metric); }

    virtual void report() = 0;
};

class LinkPredictionReporter : public Reporter {
   public:
    std::vector<torch::Tensor> per_batch_ranks_;
    torch::Tensor all_ranks_;

    LinkPredictionReporter();

    ~LinkPredictionReporter();

    void clear();

    /**
      Rank of each true entity among all candidates, one-based. Only strictly higher scores push the rank down.
      @param true_scores Score of the true entity for each query. Shape (n)
      @param all_scores Scores of every candidate for each query. Shape (n, num_entities)
      @return Ranks. Shape (n)
    */
    torch::Tensor computeRanks(torch::Tensor true_scores, torch::Tensor all_scores);

    void addResult(torch::Tensor true_scores, torch::Tensor all_scores);

    /** Computes every registered metric over the accumulated ranks, keyed by metric name */
    std::map<std::string, double> computeMetrics();

    void report() override;
};

class ProgressReporter : public Reporter {
    std::string item_name_;
    int64_t total_items_;
    int64_t current_item_;
    int total_reports_;
    int64_t next_report_;
    int64_t items_per_report_;

   public:
    ProgressReporter(std::string item_name, int64_t total_items, int total_reports);

    ~ProgressReporter();

    void clear();

    void addResult(int64_t items_processed);

    void report() override;
};

#endif  // KESTREL_SRC_CPP_INCLUDE_REPORTING_H_
