#ifndef MAGENC_MAGNET_KEY_RULES_HPP
#define MAGENC_MAGNET_KEY_RULES_HPP

#include <optional>
#include <string>
#include <vector>

namespace magenc {
namespace magnet {

// Field of the normalized descriptor a link parameter feeds
enum class FieldRole {
  Topic,        // xt, urn-namespaced; urn:cid carries the identifier
  Identifier,   // bare CID
  CdnBase,
  ExactSource,
  DisplayName,
  Signature,
  Signer
};

const char* role_to_string(FieldRole role);

// Case-sensitive mapping from parameter names to roles. Several revisions of
// the link format use different names for the same role; the first name
// registered for a role is the one written on serialization.
class KeyRules {
public:
  struct Rule {
    std::string key;
    FieldRole role;
  };

  // Every name used by any revision of the format
  static const KeyRules& standard();

  KeyRules& add(const std::string& key, FieldRole role);

  std::optional<FieldRole> role_of(const std::string& key) const;
  // Throws std::out_of_range if no key is registered for role
  const std::string& canonical_key(FieldRole role) const;

  const std::vector<Rule>& rules() const { return rules_; }

private:
  std::vector<Rule> rules_;
};

} // namespace magnet
} // namespace magenc

#endif // MAGENC_MAGNET_KEY_RULES_HPP
