#pragma once

#include <string>

#include "cvgen/DocumentTree.hpp"

namespace cvgen {

// Markdown-ish text view of a document tree, one line per paragraph:
//   # name              (centered heading)
//   ## Section          (heading with rule)
//   ### left | dates    (subheading; tab shown as " | ")
//   - bullet
//   **label** value     (bold runs)
// Spacer paragraphs become blank lines.
std::string render_outline(const DocumentTree& tree);

}  // namespace cvgen
