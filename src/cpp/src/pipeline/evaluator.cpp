#include "pipeline/evaluator.h"

#include <limits>

#include "common/util.h"
#include "reporting/logger.h"

LinkPredictionEvaluator::LinkPredictionEvaluator(shared_ptr<KGEModel> model, int batch_size, bool filtered, std::vector<TripleList> filter_triples) {
    if (model == nullptr) {
        throw UnexpectedNullPtrException("Evaluator requires a model");
    }

    if (batch_size <= 0) {
        throw InvalidConfigurationException(fmt::format("Evaluation batch_size must be > 0, got {}", batch_size));
    }

    model_ = model;
    batch_size_ = batch_size;
    filtered_ = filtered;

    reporter_ = std::make_shared<LinkPredictionReporter>();
    reporter_->addMetric(std::make_shared<MeanRankMetric>());
    reporter_->addMetric(std::make_shared<MeanReciprocalRankMetric>());
    reporter_->addMetric(std::make_shared<HitskMetric>(1));
    reporter_->addMetric(std::make_shared<HitskMetric>(3));
    reporter_->addMetric(std::make_shared<HitskMetric>(10));

    if (filtered_) {
        for (auto triples : filter_triples) {
            triples = triples.to(torch::kCPU, torch::kInt64).contiguous();
            auto triples_accessor = triples.accessor<int64_t, 2>();
            for (int64_t i = 0; i < triples.size(0); i++) {
                int64_t h = triples_accessor[i][0];
                int64_t r = triples_accessor[i][1];
                int64_t t = triples_accessor[i][2];
                known_tails_[{h, r}].emplace_back(t);
                known_heads_[{r, t}].emplace_back(h);
            }
        }
    }
}

void LinkPredictionEvaluator::filterScores(torch::Tensor scores, torch::Tensor keys, torch::Tensor targets, bool tails) {
    auto &known = tails ? known_tails_ : known_heads_;

    auto keys_accessor = keys.accessor<int64_t, 2>();
    auto targets_accessor = targets.accessor<int64_t, 1>();

    std::vector<int64_t> rows;
    std::vector<int64_t> cols;
    for (int64_t i = 0; i < keys.size(0); i++) {
        auto itr = known.find({keys_accessor[i][0], keys_accessor[i][1]});
        if (itr == known.end()) {
            continue;
        }

        for (auto entity_id : itr->second) {
            if (entity_id != targets_accessor[i]) {
                rows.emplace_back(i);
                cols.emplace_back(entity_id);
            }
        }
    }

    if (!rows.empty()) {
        auto ind_opts = torch::TensorOptions().dtype(torch::kInt64).device(scores.device());
        scores.index_put_({torch::tensor(rows, ind_opts), torch::tensor(cols, ind_opts)}, -std::numeric_limits<float>::infinity());
    }
}

std::map<std::string, double> LinkPredictionEvaluator::evaluate(TripleList test_triples) {
    if (!test_triples.defined()) {
        throw UndefinedTensorException();
    }

    if (test_triples.dim() != 2 || test_triples.size(1) != 3 || test_triples.size(0) == 0) {
        throw TensorSizeMismatchException(test_triples, "Expected a non-empty set of triples of shape (n, 3)");
    }

    torch::NoGradGuard no_grad;
    reporter_->clear();

    test_triples = test_triples.to(torch::kCPU, torch::kInt64).contiguous();
    auto ind_opts = torch::TensorOptions().dtype(torch::kInt64);
    Indices hr_columns = torch::tensor(std::vector<int64_t>{0, 1}, ind_opts);
    Indices rt_columns = torch::tensor(std::vector<int64_t>{1, 2}, ind_opts);

    Timer timer = Timer();
    timer.start();

    int64_t num_triples = test_triples.size(0);
    for (int64_t offset = 0; offset < num_triples; offset += batch_size_) {
        TripleList batch = test_triples.narrow(0, offset, std::min<int64_t>(batch_size_, num_triples - offset));

        PairList hr = batch.index_select(1, hr_columns).contiguous();
        PairList rt = batch.index_select(1, rt_columns).contiguous();
        Indices tails = batch.select(1, 2).contiguous();
        Indices heads = batch.select(1, 0).contiguous();

        torch::Tensor tail_scores = model_->score_t(hr.to(model_->device_));
        torch::Tensor head_scores = model_->score_h(rt.to(model_->device_));

        torch::Tensor true_tail_scores = tail_scores.gather(1, tails.to(model_->device_).unsqueeze(1)).squeeze(1);
        torch::Tensor true_head_scores = head_scores.gather(1, heads.to(model_->device_).unsqueeze(1)).squeeze(1);

        if (filtered_) {
            filterScores(tail_scores, hr, tails, true);
            filterScores(head_scores, rt, heads, false);
        }

        reporter_->addResult(true_tail_scores, tail_scores);
        reporter_->addResult(true_head_scores, head_scores);
    }

    timer.stop();

    std::map<std::string, double> results = reporter_->computeMetrics();
    reporter_->report();
    SPDLOG_INFO("Evaluation complete: {}ms", timer.getDuration());

    return results;
}
