#include "cra/context.hpp"

#include <algorithm>
#include <cctype>

#include <fnmatch.h>

namespace cra {

namespace {

bool has_item(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

LoadedContext context_from_pack(const AtlasContextPack& pack, const std::string& atlas_id) {
  LoadedContext c;
  c.pack_id = pack.pack_id;
  c.name = pack.name.empty() ? pack.pack_id : pack.name;
  c.source_atlas = atlas_id;
  c.content = pack.content;
  c.content_type = pack.content_type;
  c.priority = pack.priority;
  for (const auto& k : pack.keywords) c.keywords.insert(lower(k));
  c.condition = pack.condition;
  c.inject_mode = pack.inject_mode;
  return c;
}

std::vector<std::string> tokenize(const std::string& text) {
  std::vector<std::string> out;
  std::string cur;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '_') {
      cur.push_back(static_cast<char>(std::tolower(c)));
    } else if (!cur.empty()) {
      out.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) out.push_back(std::move(cur));
  return out;
}

bool condition_holds(const ContextCondition& cond, const EvalContext& eval,
                     const std::vector<std::string>& hints) {
  if (!cond.file_patterns.empty()) {
    bool any = false;
    for (const auto& pattern : cond.file_patterns) {
      for (const auto& file : eval.files) {
        if (::fnmatch(pattern.c_str(), file.c_str(), 0) == 0) {
          any = true;
          break;
        }
      }
      if (any) break;
    }
    if (!any) return false;
  }
  for (const auto& cap : cond.capabilities) {
    if (!has_item(eval.capabilities, cap)) return false;
  }
  if (!cond.risk_tiers.empty()) {
    if (!eval.risk_tier) return false;
    if (std::find(cond.risk_tiers.begin(), cond.risk_tiers.end(), *eval.risk_tier) == cond.risk_tiers.end()) {
      return false;
    }
  }
  if (!cond.context_hints.empty()) {
    const bool any = std::any_of(cond.context_hints.begin(), cond.context_hints.end(),
                                 [&](const std::string& h) { return has_item(hints, h); });
    if (!any) return false;
  }
  return true;
}

void ContextRegistry::add_context(LoadedContext entry) {
  // Matching compares lower-cased tokens, so every stored keyword is lower-cased
  // here whatever path the entry came through.
  std::set<std::string> keywords;
  for (const auto& k : entry.keywords) keywords.insert(lower(k));
  entry.keywords = std::move(keywords);
  std::string id = entry.pack_id;
  entries_[std::move(id)] = std::make_shared<const LoadedContext>(std::move(entry));
}

std::size_t ContextRegistry::remove_source(const std::string& atlas_id) {
  return std::erase_if(entries_, [&](const auto& kv) { return kv.second->source_atlas == atlas_id; });
}

std::vector<MatchResult> ContextRegistry::query(const std::string& goal_text,
                                                const std::vector<std::string>& hints,
                                                const EvalContext& eval,
                                                std::size_t max_results) const {
  std::set<std::string> tokens;
  for (auto& t : tokenize(goal_text)) tokens.insert(std::move(t));
  for (const auto& h : hints) {
    for (auto& t : tokenize(h)) tokens.insert(std::move(t));
  }

  std::vector<MatchResult> out;
  for (const auto& [id, entry] : entries_) {
    if (!eval.atlas_scope.empty() && !entry->source_atlas.empty() &&
        !has_item(eval.atlas_scope, entry->source_atlas)) {
      continue;
    }
    if (entry->condition && !condition_holds(*entry->condition, eval, hints)) continue;

    uint32_t score = 0;
    for (const auto& t : tokens) {
      if (entry->keywords.contains(t)) ++score;
    }

    switch (entry->inject_mode) {
      case InjectMode::on_match:
        if (score == 0) continue;
        break;
      case InjectMode::on_demand:
        if (!has_item(hints, id)) continue;
        break;
      case InjectMode::always:
        break;
    }
    out.push_back(MatchResult{id, score, entry});
  }

  std::sort(out.begin(), out.end(), [](const MatchResult& a, const MatchResult& b) {
    if (a.entry->priority != b.entry->priority) return a.entry->priority > b.entry->priority;
    if (a.score != b.score) return a.score > b.score;
    return a.pack_id < b.pack_id;
  });
  if (max_results > 0 && out.size() > max_results) out.resize(max_results);
  return out;
}

}  // namespace cra
