#include "magnet/key_rules.hpp"
#include <algorithm>
#include <stdexcept>

namespace magenc {
namespace magnet {

const char* role_to_string(FieldRole role) {
  switch (role) {
    case FieldRole::Topic:       return "topic";
    case FieldRole::Identifier:  return "identifier";
    case FieldRole::CdnBase:     return "cdn base";
    case FieldRole::ExactSource: return "exact source";
    case FieldRole::DisplayName: return "display name";
    case FieldRole::Signature:   return "signature";
    case FieldRole::Signer:      return "signer";
    default:                     return "unknown";
  }
}

const KeyRules& KeyRules::standard() {
  static const KeyRules rules = [] {
    KeyRules r;
    r.add("xt", FieldRole::Topic)
     .add("cid", FieldRole::Identifier)
     .add("cdn", FieldRole::CdnBase)
     .add("x.cdn", FieldRole::CdnBase)
     .add("xs", FieldRole::ExactSource)
     .add("as", FieldRole::ExactSource)
     .add("dn", FieldRole::DisplayName)
     .add("sig", FieldRole::Signature)
     .add("did", FieldRole::Signer);
    return r;
  }();
  return rules;
}

KeyRules& KeyRules::add(const std::string& key, FieldRole role) {
  auto it = std::find_if(rules_.begin(), rules_.end(),
                         [&key](const Rule& rule) { return rule.key == key; });
  if (it != rules_.end()) {
    it->role = role;
  } else {
    rules_.push_back({key, role});
  }
  return *this;
}

std::optional<FieldRole> KeyRules::role_of(const std::string& key) const {
  for (const auto& rule : rules_) {
    if (rule.key == key) {
      return rule.role;
    }
  }
  return std::nullopt;
}

const std::string& KeyRules::canonical_key(FieldRole role) const {
  for (const auto& rule : rules_) {
    if (rule.role == role) {
      return rule.key;
    }
  }
  throw std::out_of_range(std::string("Key rules: no key for role ") + role_to_string(role));
}

} // namespace magnet
} // namespace magenc
