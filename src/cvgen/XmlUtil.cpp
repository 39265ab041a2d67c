#include "cvgen/XmlUtil.hpp"

#include <cmath>

namespace cvgen {

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 32);
    for (char c : s) {
        const unsigned char u = static_cast<unsigned char>(c);
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                if (u < 0x20 && c != '\t' && c != '\n' && c != '\r') break;
                out += c;
                break;
        }
    }
    return out;
}

long to_twips_from_inches(double in) {
    return std::lround(in * 1440.0);
}

long to_twips_from_points(double pt) {
    return std::lround(pt * 20.0);
}

}  // namespace cvgen
