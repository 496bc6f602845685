#include "parqlint/rules/registry.h"

#include <algorithm>
#include <memory>

#include "parqlint/rules/bloom_filter.h"
#include "parqlint/rules/compression_codec.h"
#include "parqlint/rules/compression_ratio.h"
#include "parqlint/rules/dictionary_encoding.h"
#include "parqlint/rules/float_encoding.h"
#include "parqlint/rules/gpu_page_count.h"
#include "parqlint/rules/page_size.h"
#include "parqlint/rules/page_statistics.h"
#include "parqlint/rules/string_encoding.h"
#include "parqlint/rules/string_statistics.h"
#include "parqlint/rules/timestamp_encoding.h"
#include "parqlint/rules/vector_embedding.h"

namespace parqlint::rules {

std::vector<RulePtr> AllRules() {
  return {
      std::make_shared<CompressionRatioRule>(),   std::make_shared<PageStatisticsRule>(),
      std::make_shared<VectorEmbeddingRule>(),    std::make_shared<DictionaryEncodingRule>(),
      std::make_shared<PageSizeRule>(),           std::make_shared<FloatEncodingRule>(),
      std::make_shared<GpuPageCountRule>(),       std::make_shared<StringEncodingRule>(),
      std::make_shared<CompressionCodecRule>(),   std::make_shared<TimestampEncodingRule>(),
      std::make_shared<StringStatisticsRule>(),   std::make_shared<BloomFilterRule>(),
  };
}

std::vector<RulePtr> GetRules(const std::optional<std::vector<std::string>>& names) {
  auto rules = AllRules();
  if (!names) {
    return rules;
  }
  std::erase_if(rules, [&names](const RulePtr& rule) {
    return std::find(names->begin(), names->end(), rule->Name()) == names->end();
  });
  return rules;
}

}  // namespace parqlint::rules
