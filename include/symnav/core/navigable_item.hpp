#pragma once

#include <string>

#include "symnav/core/document.hpp"
#include "symnav/utils/canonical_path.hpp"

namespace symnav {

// A resolved definition the host can display and navigate to
struct NavigableItem {
  DocumentId document;
  CanonicalPath file_path;
  TextSpan span;
  std::string display_string;
};

}  // namespace symnav
