// assignment.h
#pragma once
#include <unordered_map>
#include <vector>
#include "types.h"

namespace vp {

// id -> provider lookup; pointers stay valid as long as the source vector does.
using ProviderIndex = std::unordered_map<int, const Provider*>;

ProviderIndex index_providers(const std::vector<Provider>& providers);

// Override (when it resolves) wins regardless of override_permanent, then
// the primary provider. nullptr = unassigned, including dangling references.
const Provider* effective_provider(const Patient& p, const ProviderIndex& providers);
const Provider* effective_provider(const Patient& p, const std::vector<Provider>& providers);

} // namespace vp
