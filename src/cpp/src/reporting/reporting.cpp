#include "reporting/reporting.h"

#include "reporting/logger.h"

HitskMetric::HitskMetric(int k) {
    k_ = k;
    name_ = "Hits@" + std::to_string(k_);
    unit_ = "";
}

torch::Tensor HitskMetric::computeMetric(torch::Tensor ranks) { return torch::tensor((double)ranks.le(k_).nonzero().size(0) / ranks.size(0), torch::kFloat64); }

MeanRankMetric::MeanRankMetric() {
    name_ = "Mean Rank";
    unit_ = "";
}

torch::Tensor MeanRankMetric::computeMetric(torch::Tensor ranks) { return ranks.to(torch::kFloat64).mean(); }

MeanReciprocalRankMetric::MeanReciprocalRankMetric() {
    name_ = "MRR";
    unit_ = "";
}

torch::Tensor MeanReciprocalRankMetric::computeMetric(torch::Tensor ranks) { return ranks.to(torch::kFloat64).reciprocal().mean(); }

LinkPredictionReporter::LinkPredictionReporter() {}

LinkPredictionReporter::~LinkPredictionReporter() { clear(); }

void LinkPredictionReporter::clear() {
    all_ranks_ = torch::Tensor();
    per_batch_ranks_ = {};
}

torch::Tensor LinkPredictionReporter::computeRanks(torch::Tensor true_scores, torch::Tensor all_scores) {
    return (all_scores > true_scores.unsqueeze(1)).sum(1) + 1;
}

void LinkPredictionReporter::addResult(torch::Tensor true_scores, torch::Tensor all_scores) {
    lock();
    per_batch_ranks_.emplace_back(computeRanks(true_scores, all_scores).to(torch::kCPU));
    unlock();
}

std::map<std::string, double> LinkPredictionReporter::computeMetrics() {
    lock();
    if (!per_batch_ranks_.empty()) {
        all_ranks_ = torch::cat(per_batch_ranks_);
        per_batch_ranks_ = {};
    }
    unlock();

    if (!all_ranks_.defined() || all_ranks_.size(0) == 0) {
        throw KestrelRuntimeException("No ranks have been recorded");
    }

    std::map<std::string, double> results;
    for (auto m : metrics_) {
        results[m->name_] = std::dynamic_pointer_cast<RankingMetric>(m)->computeMetric(all_ranks_).item<double>();
    }
    return results;
}

void LinkPredictionReporter::report() {
    std::map<std::string, double> results = computeMetrics();

    std::string report_string = "";
    std::string header = "\n=================================\nLink Prediction: " + std::to_string(all_ranks_.size(0)) + " queries evaluated\n";
    report_string = report_string + header;

    for (auto m : metrics_) {
        report_string = report_string + m->name_ + ": " + std::to_string(results[m->name_]) + m->unit_ + "\n";
    }
    std::string footer = "=================================";
    report_string = report_string + footer;

    SPDLOG_INFO(report_string);
}

ProgressReporter::ProgressReporter(std::string item_name, int64_t total_items, int total_reports) {
    item_name_ = item_name;
    total_items_ = total_items;
    current_item_ = 0;
    total_reports_ = total_reports;
    items_per_report_ = std::max<int64_t>(1, total_items_ / std::max(1, total_reports_));
    next_report_ = items_per_report_;
}

ProgressReporter::~ProgressReporter() { clear(); }

void ProgressReporter::clear() {
    current_item_ = 0;
    next_report_ = items_per_report_;
}

void ProgressReporter::addResult(int64_t items_processed) {
    lock();
    current_item_ += items_processed;
    if (current_item_ >= next_report_) {
        report();
        next_report_ = std::min({current_item_ + items_per_report_, total_items_});
    }
    unlock();
}

void ProgressReporter::report() {
    std::string report_string = item_name_ + " processed: [" + std::to_string(current_item_) + "/" + std::to_string(total_items_) + "], " +
                                fmt::format("{:.2f}", 100 * (double)current_item_ / total_items_) + "%";
    SPDLOG_INFO(report_string);
}
