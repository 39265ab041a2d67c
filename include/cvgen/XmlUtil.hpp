#pragma once

#include <string>

namespace cvgen {

// Escapes &, <, >, " and ' for element text and attribute values. Control
// characters that XML 1.0 cannot represent (other than tab, LF and CR) are
// dropped.
std::string xml_escape(const std::string& s);

// Twentieths of a point, the unit of most OOXML lengths.
long to_twips_from_inches(double in);
long to_twips_from_points(double pt);

}  // namespace cvgen
