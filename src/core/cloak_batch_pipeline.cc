#include "cloak/cloak_batch_pipeline.h"
#include "cloak/cloak_text.h"
#include "cloak/util/logger.h"
#include <exception>
#include <future>

namespace CloakPII {

BatchPipeline::BatchPipeline(const Anonymizer& anonymizer, size_t worker_threads)
    : anonymizer_(anonymizer) {
  if (worker_threads > 0) {
    pool_ = std::make_unique<cloak::ThreadPool>(worker_threads);
    LOG_DEBUG("BatchPipeline", "Started " + std::to_string(pool_->GetWorkerCount()) + " worker(s)");
  }
}

BatchPipeline::~BatchPipeline() {
  if (pool_) {
    pool_->Shutdown();
  }
}

std::vector<EntityResult> BatchPipeline::DetectEntities(
    const std::vector<std::wstring>& texts) const {
  const EntitySpanProvider* provider = anonymizer_.entity_provider();
  if (provider == nullptr || !anonymizer_.config().IsKindEnabled(EntityKind::PERSON)) {
    return std::vector<EntityResult>(texts.size());
  }

  std::string failure;
  try {
    std::vector<EntityResult> results = provider->DetectBatch(texts);
    if (results.size() == texts.size()) {
      return results;
    }
    failure = "returned " + std::to_string(results.size()) + " result(s) for " +
              std::to_string(texts.size()) + " document(s)";
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = kNonStandardException;
  }

  // Isolate the failure: each document gets its own answer
  LOG_WARN("BatchPipeline", "Batched entity detection failed (" + failure +
           "), detecting per document");
  std::vector<EntityResult> results;
  results.reserve(texts.size());
  for (const auto& text : texts) {
    results.push_back(anonymizer_.DetectEntities(text));
  }
  return results;
}

std::wstring BatchPipeline::MaskIsolated(const std::wstring& text, const EntityResult& entities,
                                        size_t doc_index, MaskStats* stats) const {
  std::string failure;
  try {
    return anonymizer_.MaskDocument(text, entities, doc_index, stats);
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = kNonStandardException;
  }
  LOG_ERROR("BatchPipeline", "Masking failed for document " + std::to_string(doc_index) + " (" +
            failure + "), falling back to pattern rules only");
  return anonymizer_.MaskPatterns(text, doc_index, stats);
}

std::vector<std::wstring> BatchPipeline::AnonymizeManyWide(
    const std::vector<std::wstring>& texts, MaskStats* stats) const {
  std::vector<std::wstring> outputs(texts.size());
  if (texts.empty()) {
    return outputs;
  }

  // Empty documents are never sent to the provider, as in Anonymize
  std::vector<std::wstring> non_empty;
  std::vector<size_t> non_empty_index;
  for (size_t i = 0; i < texts.size(); ++i) {
    if (!texts[i].empty()) {
      non_empty.push_back(texts[i]);
      non_empty_index.push_back(i);
    }
  }
  if (non_empty.empty()) {
    return outputs;
  }

  std::vector<EntityResult> detected = DetectEntities(non_empty);
  std::vector<EntityResult> entities(texts.size());
  for (size_t k = 0; k < non_empty_index.size(); ++k) {
    entities[non_empty_index[k]] = std::move(detected[k]);
  }

  std::vector<MaskStats> doc_stats(texts.size());

  if (!pool_) {
    for (size_t i : non_empty_index) {
      outputs[i] = MaskIsolated(texts[i], entities[i], i, &doc_stats[i]);
    }
  } else {
    // Tasks reference the locals above, so every future is waited for
    // before any error leaves this function
    std::vector<std::future<std::wstring>> futures(texts.size());
    for (size_t i : non_empty_index) {
      futures[i] = pool_->Submit([this, &texts, &entities, &doc_stats, i]() {
        return MaskIsolated(texts[i], entities[i], i, &doc_stats[i]);
      });
    }
    std::exception_ptr first_error;
    for (size_t i : non_empty_index) {
      try {
        if (futures[i].valid()) {
          outputs[i] = futures[i].get();
        } else {
          // Pool already shut down; mask on this thread instead
          outputs[i] = MaskIsolated(texts[i], entities[i], i, &doc_stats[i]);
        }
      } catch (...) {
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
    if (first_error) {
      std::rethrow_exception(first_error);
    }
  }

  MaskStats batch_stats;
  for (const auto& s : doc_stats) {
    batch_stats.Merge(s);
  }
  LOG_DEBUG("BatchPipeline", std::to_string(texts.size()) + " document(s): " + batch_stats.ToString());
  if (stats) {
    stats->Merge(batch_stats);
  }

  return outputs;
}

std::vector<std::string> BatchPipeline::AnonymizeMany(const std::vector<std::string>& texts,
                                                      MaskStats* stats) const {
  std::vector<std::wstring> wide;
  wide.reserve(texts.size());
  for (const auto& text : texts) {
    wide.push_back(Utf8ToWide(text));
  }

  std::vector<std::wstring> masked = AnonymizeManyWide(wide, stats);

  std::vector<std::string> outputs;
  outputs.reserve(masked.size());
  for (size_t i = 0; i < masked.size(); ++i) {
    // Untouched documents are returned byte for byte
    outputs.push_back(masked[i] == wide[i] ? texts[i] : WideToUtf8(masked[i]));
  }
  return outputs;
}

}  // namespace CloakPII
