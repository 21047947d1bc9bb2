#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>

#include "cloak/cloak_batch_pipeline.h"
#include "cloak/cloak_builtin_providers.h"

namespace CloakPII {
namespace {

// Tags the first word of every text as a person; texts containing "boom"
// fail. Counts calls so tests can check how the batch was sent.
class CountingEntityProvider : public EntitySpanProvider {
 public:
  enum class BatchMode { kNormal, kThrow, kShort };

  explicit CountingEntityProvider(BatchMode mode = BatchMode::kNormal) : mode_(mode) {}

  EntityResult Detect(const std::wstring& text) const override {
    detect_calls_++;
    if (text.find(L"boom") != std::wstring::npos) {
      throw std::runtime_error("inference failed");
    }
    EntityResult result;
    size_t end = text.find(L' ');
    result.spans.push_back({0, end == std::wstring::npos ? text.size() : end, "PER"});
    return result;
  }

  std::vector<EntityResult> DetectBatch(const std::vector<std::wstring>& texts) const override {
    batch_calls_++;
    if (mode_ == BatchMode::kThrow) {
      throw std::runtime_error("batch endpoint down");
    }
    std::vector<EntityResult> results;
    for (const auto& text : texts) {
      if (text.find(L"boom") != std::wstring::npos) {
        results.push_back(EntityResult::Failure("inference failed"));
        continue;
      }
      EntityResult result;
      size_t end = text.find(L' ');
      result.spans.push_back({0, end == std::wstring::npos ? text.size() : end, "PER"});
      results.push_back(result);
    }
    if (mode_ == BatchMode::kShort && !results.empty()) {
      results.pop_back();
    }
    return results;
  }

  int batch_calls() const { return batch_calls_; }
  int detect_calls() const { return detect_calls_; }

 private:
  BatchMode mode_;
  mutable std::atomic<int> batch_calls_{0};
  mutable std::atomic<int> detect_calls_{0};
};

// Throws a plain int for texts containing "boom"
class IntThrowingPhoneProvider : public PhoneSpanProvider {
 public:
  std::vector<PhoneSpan> FindPhones(const std::wstring& text,
                                    const std::string& region) const override {
    if (text.find(L"boom") != std::wstring::npos) {
      throw 42;
    }
    return phones_.FindPhones(text, region);
  }

 private:
  FrenchPhoneSpanProvider phones_;
};

// Batch endpoint always fails with a plain int; single calls fail on "boom"
class IntThrowingEntityProvider : public EntitySpanProvider {
 public:
  EntityResult Detect(const std::wstring& text) const override {
    if (text.find(L"boom") != std::wstring::npos) {
      throw 7;
    }
    EntityResult result;
    result.spans.push_back({0, text.find(L' '), "PER"});
    return result;
  }

  std::vector<EntityResult> DetectBatch(const std::vector<std::wstring>&) const override {
    throw 7;
  }
};

class ThrowingDateNormalizer : public DateNormalizer {
 public:
  std::optional<int> ParseYear(const std::wstring&, bool) const override {
    throw std::runtime_error("calendar unavailable");
  }
};

const std::vector<std::string> kTexts = {
  "Martin a pour IBAN FR7630006000011234567890189",
  "Sophie boom 06 12 34 56 78",
  "Paul jo@x.com",
};

const std::vector<std::string> kExpected = {
  "M***** a pour IBAN FR************0189",
  "Sophie boom XXXXXXXX78",
  "P*** **@x.com",
};

TEST(BatchPipelineTest, OneProviderCallPerBatch) {
  auto provider = std::make_shared<CountingEntityProvider>();
  Anonymizer anonymizer(AnonymizerConfig(), std::make_shared<FrenchPhoneSpanProvider>(), provider);
  BatchPipeline pipeline(anonymizer);

  MaskStats stats;
  EXPECT_EQ(pipeline.AnonymizeMany(kTexts, &stats), kExpected);
  EXPECT_EQ(provider->batch_calls(), 1);
  EXPECT_EQ(provider->detect_calls(), 0);
  EXPECT_EQ(stats.by_kind[EntityKind::PERSON], 2);
  EXPECT_EQ(stats.total_masked, 5);
}

TEST(BatchPipelineTest, FailedBatchCallFallsBackPerDocument) {
  auto provider = std::make_shared<CountingEntityProvider>(
      CountingEntityProvider::BatchMode::kThrow);
  Anonymizer anonymizer(AnonymizerConfig(), std::make_shared<FrenchPhoneSpanProvider>(), provider);
  BatchPipeline pipeline(anonymizer);

  EXPECT_EQ(pipeline.AnonymizeMany(kTexts), kExpected);
  EXPECT_EQ(provider->batch_calls(), 1);
  EXPECT_EQ(provider->detect_calls(), 3);
}

TEST(BatchPipelineTest, WrongResultCountFallsBackPerDocument) {
  auto provider = std::make_shared<CountingEntityProvider>(
      CountingEntityProvider::BatchMode::kShort);
  Anonymizer anonymizer(AnonymizerConfig(), std::make_shared<FrenchPhoneSpanProvider>(), provider);
  BatchPipeline pipeline(anonymizer);

  EXPECT_EQ(pipeline.AnonymizeMany(kTexts), kExpected);
  EXPECT_EQ(provider->detect_calls(), 3);
}

TEST(BatchPipelineTest, MatchesSingleDocumentCalls) {
  Anonymizer anonymizer;
  BatchPipeline pipeline(anonymizer);

  const std::vector<std::string> texts = {
    "Madame Claire Martin, carte 4539148803436467",
    "",
    "Rien a signaler.",
    "NIR 185057800604830, le 12 mars 1990",
  };
  std::vector<std::string> masked = pipeline.AnonymizeMany(texts);
  ASSERT_EQ(masked.size(), texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    EXPECT_EQ(masked[i], anonymizer.Anonymize(texts[i])) << "document " << i;
  }
  EXPECT_EQ(masked[1], "");
  EXPECT_EQ(masked[2], texts[2]);
}

TEST(BatchPipelineTest, WorkerPoolKeepsInputOrder) {
  auto provider = std::make_shared<CountingEntityProvider>();
  Anonymizer anonymizer(AnonymizerConfig(), std::make_shared<FrenchPhoneSpanProvider>(), provider);
  BatchPipeline sequential(anonymizer);
  BatchPipeline parallel(anonymizer, 4);
  EXPECT_EQ(parallel.worker_count(), 4u);
  EXPECT_EQ(sequential.worker_count(), 0u);

  std::vector<std::string> texts;
  for (int i = 0; i < 64; ++i) {
    texts.push_back(kTexts[i % kTexts.size()] + " #" + std::to_string(i));
  }

  MaskStats sequential_stats;
  MaskStats parallel_stats;
  EXPECT_EQ(parallel.AnonymizeMany(texts, &parallel_stats),
            sequential.AnonymizeMany(texts, &sequential_stats));
  EXPECT_EQ(parallel_stats.total_masked, sequential_stats.total_masked);
}

TEST(BatchPipelineTest, EmptyBatch) {
  auto provider = std::make_shared<CountingEntityProvider>();
  Anonymizer anonymizer(AnonymizerConfig(), nullptr, provider);
  BatchPipeline pipeline(anonymizer);

  EXPECT_TRUE(pipeline.AnonymizeMany({}).empty());
  EXPECT_EQ(provider->batch_calls(), 0);
}

TEST(BatchPipelineTest, DisabledPersonSkipsProvider) {
  AnonymizerConfig config;
  config.disabled_kinds = {EntityKind::PERSON};
  auto provider = std::make_shared<CountingEntityProvider>();
  Anonymizer anonymizer(config, nullptr, provider);
  BatchPipeline pipeline(anonymizer);

  EXPECT_EQ(pipeline.AnonymizeMany({"Paul jo@x.com"}),
            std::vector<std::string>{"Paul **@x.com"});
  EXPECT_EQ(provider->batch_calls(), 0);
}

TEST(BatchPipelineTest, PooledPhoneProviderFailureStaysInItsDocument) {
  Anonymizer anonymizer(AnonymizerConfig(), std::make_shared<IntThrowingPhoneProvider>(), nullptr);
  BatchPipeline pipeline(anonymizer, 2);

  std::vector<std::string> texts;
  std::vector<std::string> expected;
  for (int i = 0; i < 32; ++i) {
    if (i % 2 == 0) {
      texts.push_back("boom jo@x.com 06 12 34 56 78");
      expected.push_back("boom **@x.com 06 12 34 56 78");
    } else {
      texts.push_back("Tel 06 12 34 56 78, jo@x.com");
      expected.push_back("Tel XXXXXXXX78, **@x.com");
    }
  }

  MaskStats stats;
  EXPECT_EQ(pipeline.AnonymizeMany(texts, &stats), expected);
  EXPECT_EQ(stats.by_kind[EntityKind::PHONE], 16);
  EXPECT_EQ(stats.by_kind[EntityKind::EMAIL], 32);
}

TEST(BatchPipelineTest, PooledEntityProviderFailureStaysInItsDocument) {
  Anonymizer anonymizer(AnonymizerConfig(), nullptr,
                        std::make_shared<IntThrowingEntityProvider>());
  BatchPipeline pipeline(anonymizer, 2);

  const std::vector<std::string> texts = {"Paul boom jo@x.com", "Paul jo@x.com"};
  const std::vector<std::string> expected = {"Paul boom **@x.com", "P*** **@x.com"};
  EXPECT_EQ(pipeline.AnonymizeMany(texts), expected);
}

TEST(BatchPipelineTest, PooledDateNormalizerFailureGivesToken) {
  Anonymizer anonymizer(AnonymizerConfig(), nullptr, nullptr,
                        std::make_shared<ThrowingDateNormalizer>());
  BatchPipeline pipeline(anonymizer, 2);

  const std::vector<std::string> texts = {"le 12/03/1990", "jo@x.com"};
  const std::vector<std::string> expected = {"le DATE", "**@x.com"};
  EXPECT_EQ(pipeline.AnonymizeMany(texts), expected);
}

TEST(BatchPipelineTest, InvalidUtf8MatchesSingleDocumentCall) {
  Anonymizer anonymizer;
  BatchPipeline pipeline(anonymizer, 2);

  const std::vector<std::string> texts = {
    "Bonjour \xff tout le monde",
    "Bonjour \xff jo@x.com",
    std::string(50000, 'a') + "@x.com",
  };
  std::vector<std::string> masked = pipeline.AnonymizeMany(texts);
  ASSERT_EQ(masked.size(), texts.size());
  EXPECT_EQ(masked[0], texts[0]);
  for (size_t i = 0; i < texts.size(); ++i) {
    EXPECT_EQ(masked[i], anonymizer.Anonymize(texts[i])) << "document " << i;
  }
}

}  // namespace
}  // namespace CloakPII
