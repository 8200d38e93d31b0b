// assignment.cpp
#include "assignment.h"

namespace vp {

ProviderIndex index_providers(const std::vector<Provider>& providers) {
  ProviderIndex idx;
  idx.reserve(providers.size());
  // first record wins on duplicate ids; validation reports the duplicate
  for (const auto& p : providers) idx.emplace(p.id, &p);
  return idx;
}

const Provider* effective_provider(const Patient& p, const ProviderIndex& providers) {
  if (p.override_provider_id) {
    auto it = providers.find(*p.override_provider_id);
    if (it != providers.end()) return it->second;
  }
  if (p.primary_provider_id) {
    auto it = providers.find(*p.primary_provider_id);
    if (it != providers.end()) return it->second;
  }
  return nullptr;
}

const Provider* effective_provider(const Patient& p, const std::vector<Provider>& providers) {
  return effective_provider(p, index_providers(providers));
}

} // namespace vp
