#ifndef CLOAK_BATCH_PIPELINE_H_
#define CLOAK_BATCH_PIPELINE_H_

#include <memory>
#include <string>
#include <vector>

#include "cloak/cloak_anonymizer.h"
#include "cloak/util/cloak_thread_pool.h"

namespace CloakPII {

/**
 * BatchPipeline - masks many documents, sharing one entity-provider call.
 *
 * Output i always equals Anonymizer::Anonymize(texts[i]) given the same
 * provider answers; neither batch size nor sibling documents change it.
 *
 * Failure policy:
 * - The entity provider reports one result per document. A failed result
 *   removes PERSON masking from that document only; it still gets pattern
 *   and phone masking.
 * - If the batched call throws or returns the wrong number of results, each
 *   document is sent to the provider on its own so that only the documents
 *   whose own call fails lose PERSON masking.
 * - A phone-provider failure affects only the document being scanned.
 * - If masking a document still fails, that document falls back to the
 *   pattern rules alone. Only a failure of that fallback propagates, and
 *   never before every other document has finished.
 *
 * With worker_threads > 0 documents are masked on a private pool; outputs
 * are stored by index, so ordering never depends on scheduling.
 *
 * Usage:
 *   CloakPII::Anonymizer anonymizer(config);
 *   CloakPII::BatchPipeline pipeline(anonymizer, config.worker_threads);
 *   std::vector<std::string> masked = pipeline.AnonymizeMany(texts);
 */
class BatchPipeline {
 public:
  BatchPipeline(const Anonymizer& anonymizer, size_t worker_threads = 0);
  ~BatchPipeline();

  BatchPipeline(const BatchPipeline&) = delete;
  BatchPipeline& operator=(const BatchPipeline&) = delete;

  /**
   * Mask UTF-8 documents, one output per input in input order.
   */
  std::vector<std::string> AnonymizeMany(const std::vector<std::string>& texts,
                                         MaskStats* stats = nullptr) const;

  /**
   * Same on already-decoded documents.
   */
  std::vector<std::wstring> AnonymizeManyWide(const std::vector<std::wstring>& texts,
                                              MaskStats* stats = nullptr) const;

  size_t worker_count() const { return pool_ ? pool_->GetWorkerCount() : 0; }

 private:
  // One EntityResult per text, whatever the provider does
  std::vector<EntityResult> DetectEntities(const std::vector<std::wstring>& texts) const;

  std::wstring MaskIsolated(const std::wstring& text, const EntityResult& entities,
                            size_t doc_index, MaskStats* stats) const;

  const Anonymizer& anonymizer_;
  std::unique_ptr<cloak::ThreadPool> pool_;
};

}  // namespace CloakPII

#endif  // CLOAK_BATCH_PIPELINE_H_
