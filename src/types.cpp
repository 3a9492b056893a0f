#include "rn2xx3/types.hpp"
#include <string.h>

namespace rn2xx3 {

const char* to_string(Model m) {
  switch (m) {
    case Model::RN2483: return "RN2483";
    case Model::RN2903: return "RN2903";
  }
  return "unknown";
}

const char* to_string(JoinMode m) {
  return m == JoinMode::Otaa ? "otaa" : "abp";
}

const char* to_string(ConfirmationMode m) {
  return m == ConfirmationMode::Confirmed ? "cnf" : "uncnf";
}

// Banner starts with the model name followed by a space, e.g.
// "RN2483 1.0.3 Mar 22 2017 06:00:42".
bool model_from_version(const etl::istring& version, Model& out) {
  static const struct { const char* prefix; Model model; } KNOWN[] = {
    { "RN2483 ", Model::RN2483 },
    { "RN2903 ", Model::RN2903 },
  };
  for (const auto& k : KNOWN) {
    const size_t n = strlen(k.prefix);
    if (version.size() >= n && memcmp(version.data(), k.prefix, n) == 0) {
      out = k.model;
      return true;
    }
  }
  return false;
}

} // namespace rn2xx3
