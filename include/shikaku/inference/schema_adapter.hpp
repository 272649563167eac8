// MIT License

// Copyright (c) 2026 ICHIRO ITS

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#ifndef SHIKAKU_SCHEMA_ADAPTER_HPP
#define SHIKAKU_SCHEMA_ADAPTER_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace shikaku {

enum class AttributeAction {
    Drop,
    Rename
};

// Matches <layer type="layer_type"><data attribute="..."/></layer>.
// A layer_type of "*" matches every layer.
struct AttributeRule {
    std::string layer_type;
    std::string attribute;
    AttributeAction action = AttributeAction::Drop;
    std::string rename_to;
};

struct AdaptResult {
    std::string xml;
    size_t dropped = 0;
    size_t renamed = 0;
};

/**
 * Rewrites an IR topology so that layer attributes written by newer export
 * tooling are removed or mapped to names the runtime knows before the runtime
 * parses the document. Only the <data> attributes named by a rule change;
 * every other element, attribute and text node is copied through.
 */
class SchemaAdapter {
public:
    static constexpr const char* kDefaultVersion = "1";

    SchemaAdapter(std::string version, std::vector<AttributeRule> rules);

    // Version 1 rules plus a Drop rule for each name in extra_ignored.
    static SchemaAdapter default_adapter(const std::vector<std::string>& extra_ignored = {});

    AdaptResult adapt(const std::string& xml) const;

    const std::string& version() const { return version_; }
    const std::vector<AttributeRule>& rules() const { return rules_; }

    const AttributeRule* find_rule(const std::string& layer_type,
                                   const std::string& attribute) const;

private:
    std::string version_;
    std::vector<AttributeRule> rules_;
};

} // namespace shikaku

#endif // SHIKAKU_SCHEMA_ADAPTER_HPP
