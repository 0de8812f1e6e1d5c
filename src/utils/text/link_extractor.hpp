#pragma once
#include <string>
#include <vector>

namespace Wikipath {
namespace Utils {
namespace Text {

struct Anchor {
    std::string href;
    std::string text;
};

class LinkExtractor {
public:
    // Anchors in document order whose href starts with `prefix`.
    // An empty prefix keeps every anchor that carries an href.
    static std::vector<Anchor> extract(const std::string& html, const std::string& prefix);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Wikipath
