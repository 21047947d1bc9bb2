#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <memory>
#include <stdexcept>

#include "cloak/cloak_builtin_providers.h"
#include "cloak/cloak_detector_registry.h"
#include "cloak/cloak_span_collector.h"

namespace CloakPII {
namespace {

std::vector<Span> SpansOfKind(const std::vector<Span>& spans, EntityKind kind) {
  std::vector<Span> out;
  std::copy_if(spans.begin(), spans.end(), std::back_inserter(out),
               [kind](const Span& span) { return span.kind == kind; });
  return out;
}

class ThrowingPhoneProvider : public PhoneSpanProvider {
 public:
  std::vector<PhoneSpan> FindPhones(const std::wstring&, const std::string&) const override {
    throw std::runtime_error("phone library unavailable");
  }
};

class FixedPhoneProvider : public PhoneSpanProvider {
 public:
  explicit FixedPhoneProvider(std::vector<PhoneSpan> spans) : spans_(std::move(spans)) {}
  std::vector<PhoneSpan> FindPhones(const std::wstring&, const std::string&) const override {
    return spans_;
  }

 private:
  std::vector<PhoneSpan> spans_;
};

TEST(DetectorRegistryTest, RulesFollowPriorityTable) {
  AnonymizerConfig config;
  DetectorRegistry registry(config, nullptr);

  const auto& rules = registry.rules();
  ASSERT_EQ(rules.size(), 11u);
  EXPECT_EQ(rules.front().kind, EntityKind::ADDRESS);
  EXPECT_EQ(rules.back().kind, EntityKind::NATIONAL_ID);
  for (size_t i = 0; i < rules.size(); ++i) {
    EXPECT_EQ(rules[i].priority, static_cast<int>(i));
    EXPECT_EQ(DetectorRegistry::PriorityOf(rules[i].kind), rules[i].priority);
  }
  EXPECT_EQ(DetectorRegistry::PriorityOf(EntityKind::PHONE), -1);
  EXPECT_EQ(DetectorRegistry::PriorityOf(EntityKind::PERSON), -1);
  EXPECT_LT(kPhonePriority, kPersonPriority);
  EXPECT_GT(kPhonePriority, DetectorRegistry::PriorityOf(EntityKind::NATIONAL_ID));
}

TEST(DetectorRegistryTest, DisabledKindsKeepPriorities) {
  AnonymizerConfig config;
  config.disabled_kinds = {EntityKind::IBAN, EntityKind::EMAIL};
  DetectorRegistry registry(config, nullptr);

  EXPECT_EQ(registry.rules().size(), 9u);
  EXPECT_EQ(registry.FindRule(EntityKind::IBAN), nullptr);
  EXPECT_EQ(registry.FindRule(EntityKind::EMAIL), nullptr);
  ASSERT_NE(registry.FindRule(EntityKind::RIB), nullptr);
  EXPECT_EQ(registry.FindRule(EntityKind::RIB)->priority, 2);
}

TEST(DetectorRegistryTest, CustomTokensAreUsed) {
  AnonymizerConfig config;
  config.tokens.vehicle_plate = "PLAQUE";
  DetectorRegistry registry(config, nullptr);

  const DetectorRule* rule = registry.FindRule(EntityKind::VEHICLE_PLATE);
  ASSERT_NE(rule, nullptr);
  EXPECT_EQ(rule->masker(L"AB-123-CD"), L"PLAQUE");
}

class SpanCollectorTest : public ::testing::Test {
 protected:
  SpanCollectorTest() : registry_(config_, nullptr), collector_(registry_, &phones_, config_) {}

  AnonymizerConfig config_;
  FrenchPhoneSpanProvider phones_;
  DetectorRegistry registry_;
  SpanCollector collector_;
};

TEST_F(SpanCollectorTest, ValidIbanProducesSpan) {
  std::wstring text = L"IBAN: FR7630006000011234567890189.";
  auto spans = SpansOfKind(collector_.CollectPatternSpans(text), EntityKind::IBAN);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].start, 6u);
  EXPECT_EQ(spans[0].end, 33u);
  EXPECT_EQ(spans[0].replacement, L"FR************0189");
  EXPECT_EQ(spans[0].priority, 1);
}

TEST_F(SpanCollectorTest, InvalidChecksumsAreDiscarded) {
  auto spans = collector_.CollectPatternSpans(L"IBAN FR7630006000011234567890188");
  EXPECT_TRUE(SpansOfKind(spans, EntityKind::IBAN).empty());

  spans = collector_.CollectPatternSpans(L"carte 4539148803436468");
  EXPECT_TRUE(SpansOfKind(spans, EntityKind::CARD).empty());

  spans = collector_.CollectPatternSpans(L"NIR 185057800604831");
  EXPECT_TRUE(SpansOfKind(spans, EntityKind::NATIONAL_ID).empty());
}

TEST_F(SpanCollectorTest, DetectsEachPatternKind) {
  struct Case {
    std::wstring text;
    EntityKind kind;
    std::wstring replacement;
  };
  const Case cases[] = {
    {L"au 12 rue de la Paix, 75002 Paris.", EntityKind::ADDRESS, L"ADRESSE"},
    {L"RIB 30006 00001 12345678901 89", EntityKind::RIB, L"************0189"},
    {L"le 12/03/1990", EntityKind::DATE_NUMERIC, L"XX/XX/1990"},
    {L"le 12 mars 1990", EntityKind::DATE_ALPHA, L"XX/XX/1990"},
    {L"le 5 f\u00E9vrier 1990", EntityKind::DATE_ALPHA, L"XX/XX/1990"},
    {L"passeport 12AB34567", EntityKind::PASSPORT, L"12*****67"},
    {L"permis 123456789012", EntityKind::DRIVING_LICENSE, L"PERMIS********"},
    {L"plaque AB-123-CD", EntityKind::VEHICLE_PLATE, L"IMMATRICULATION"},
    {L"carte 4539 1488 0343 6467", EntityKind::CARD, L"************6467"},
    {L"mail john.doe@example.com", EntityKind::EMAIL, L"j******e@example.com"},
    {L"NIR 185057800604830", EntityKind::NATIONAL_ID, L"***********4830"},
  };

  for (const auto& c : cases) {
    auto spans = SpansOfKind(collector_.CollectPatternSpans(c.text), c.kind);
    ASSERT_EQ(spans.size(), 1u) << GetKindName(c.kind);
    EXPECT_EQ(spans[0].replacement, c.replacement) << GetKindName(c.kind);
  }
}

TEST_F(SpanCollectorTest, CardDoesNotIncludeTrailingSpace) {
  std::wstring text = L"carte 4539148803436467 ok";
  auto spans = SpansOfKind(collector_.CollectPatternSpans(text), EntityKind::CARD);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].start, 6u);
  EXPECT_EQ(spans[0].end, 22u);
}

TEST_F(SpanCollectorTest, PhoneSpansUseProviderAndMaskChar) {
  std::wstring text = L"Appelez le 06 12 34 56 78.";
  auto spans = collector_.CollectPhoneSpans(text, 0);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].kind, EntityKind::PHONE);
  EXPECT_EQ(spans[0].priority, kPhonePriority);
  EXPECT_EQ(spans[0].replacement, L"XXXXXXXX78");
}

TEST_F(SpanCollectorTest, FailedEntityResultYieldsNoPersonSpans) {
  std::wstring text = L"Jean Dupont";
  EntityResult failed = EntityResult::Failure("model offline");
  failed.spans.push_back({0, 4, "PER"});
  EXPECT_TRUE(collector_.CollectPersonSpans(text, failed, 3).empty());

  EntityResult ok;
  ok.spans.push_back({5, 11, "PER"});
  ok.spans.push_back({0, 4, "LOC"});
  auto spans = collector_.CollectPersonSpans(text, ok, 3);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].replacement, L"D*****");
  EXPECT_EQ(spans[0].priority, kPersonPriority);
}

TEST(SpanCollectorProviderTest, ThrowingPhoneProviderYieldsNoSpans) {
  AnonymizerConfig config;
  DetectorRegistry registry(config, nullptr);
  ThrowingPhoneProvider phones;
  SpanCollector collector(registry, &phones, config);

  std::wstring text = L"Appelez le 06 12 34 56 78, mail jo@x.com";
  EXPECT_TRUE(collector.CollectPhoneSpans(text, 0).empty());
  auto spans = collector.Collect(text, EntityResult(), 0);
  EXPECT_EQ(SpansOfKind(spans, EntityKind::EMAIL).size(), 1u);
}

TEST(SpanCollectorProviderTest, OutOfRangePhoneSpansAreDropped) {
  AnonymizerConfig config;
  DetectorRegistry registry(config, nullptr);
  std::vector<PhoneSpan> fixed = {{0, 4}, {2, 100}, {5, 5}};
  FixedPhoneProvider phones(fixed);
  SpanCollector collector(registry, &phones, config);

  auto spans = collector.CollectPhoneSpans(L"0612 rest", 0);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].end, 4u);
}

TEST(SpanCollectorProviderTest, DisabledPhoneKindSkipsProvider) {
  AnonymizerConfig config;
  config.disabled_kinds = {EntityKind::PHONE};
  DetectorRegistry registry(config, nullptr);
  ThrowingPhoneProvider phones;
  SpanCollector collector(registry, &phones, config);

  EXPECT_TRUE(collector.CollectPhoneSpans(L"06 12 34 56 78", 0).empty());
}

}  // namespace
}  // namespace CloakPII
