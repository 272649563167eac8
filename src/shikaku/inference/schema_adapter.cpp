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

#include "shikaku/inference/schema_adapter.hpp"
#include "shikaku/utils/errors.hpp"
#include <expat.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>
#include <utility>

namespace shikaku {

namespace {

// Attribute names every rule set version tolerates.
const char* const kVersion1Dropped[] = {
    "quantization_config",
};

void append_escaped(std::string& out, const XML_Char* s, size_t len, bool attribute) {
    for (size_t i = 0; i < len; ++i) {
        switch (s[i]) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"':
            if (attribute) { out += "&quot;"; } else { out += '"'; }
            break;
        case '\n':
            if (attribute) { out += "&#10;"; } else { out += '\n'; }
            break;
        case '\t':
            if (attribute) { out += "&#9;"; } else { out += '\t'; }
            break;
        default:
            out += s[i];
        }
    }
}

struct RewriteState {
    const SchemaAdapter* adapter = nullptr;
    AdaptResult result;

    // One entry per open element: its name and, for <layer>, its type.
    std::vector<std::pair<std::string, std::string>> stack;
    bool start_tag_open = false;

    void close_start_tag() {
        if (start_tag_open) {
            result.xml += '>';
            start_tag_open = false;
        }
    }

    const std::string* enclosing_layer_type() const {
        if (stack.empty() || stack.back().first != "layer") {
            return nullptr;
        }
        return &stack.back().second;
    }
};

void XMLCALL on_start(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* state = static_cast<RewriteState*>(user_data);
    state->close_start_tag();

    const std::string* layer_type = nullptr;
    if (std::strcmp(name, "data") == 0) {
        layer_type = state->enclosing_layer_type();
    }

    std::string& out = state->result.xml;
    out += '<';
    out += name;

    std::vector<std::string> written;
    std::string type_attr;
    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
        std::string attr_name = attrs[i];
        const XML_Char* value = attrs[i + 1];

        if (std::strcmp(name, "layer") == 0 && attr_name == "type") {
            type_attr = value;
        }

        if (layer_type != nullptr) {
            const AttributeRule* rule = state->adapter->find_rule(*layer_type, attr_name);
            if (rule != nullptr) {
                if (rule->action == AttributeAction::Drop) {
                    ++state->result.dropped;
                    continue;
                }
                // A renamed attribute never overrides one already present
                bool target_present = false;
                for (size_t j = 0; attrs[j] != nullptr; j += 2) {
                    if (rule->rename_to == attrs[j]) {
                        target_present = true;
                        break;
                    }
                }
                if (target_present) {
                    ++state->result.dropped;
                    continue;
                }
                attr_name = rule->rename_to;
                ++state->result.renamed;
            }
        }

        if (std::find(written.begin(), written.end(), attr_name) != written.end()) {
            continue;
        }
        written.push_back(attr_name);

        out += ' ';
        out += attr_name;
        out += "=\"";
        append_escaped(out, value, std::strlen(value), true);
        out += '"';
    }

    state->start_tag_open = true;
    state->stack.emplace_back(name, type_attr);
}

void XMLCALL on_end(void* user_data, const XML_Char* name) {
    auto* state = static_cast<RewriteState*>(user_data);
    if (state->start_tag_open) {
        state->result.xml += "/>";
        state->start_tag_open = false;
    } else {
        state->result.xml += "</";
        state->result.xml += name;
        state->result.xml += '>';
    }
    state->stack.pop_back();
}

void XMLCALL on_text(void* user_data, const XML_Char* s, int len) {
    auto* state = static_cast<RewriteState*>(user_data);
    state->close_start_tag();
    append_escaped(state->result.xml, s, static_cast<size_t>(len), false);
}

void XMLCALL on_comment(void* user_data, const XML_Char* data) {
    auto* state = static_cast<RewriteState*>(user_data);
    state->close_start_tag();
    state->result.xml += "<!--";
    state->result.xml += data;
    state->result.xml += "-->";
}

void XMLCALL on_processing_instruction(void* user_data, const XML_Char* target,
                                       const XML_Char* data) {
    auto* state = static_cast<RewriteState*>(user_data);
    state->close_start_tag();
    state->result.xml += "<?";
    state->result.xml += target;
    if (data != nullptr && *data != '\0') {
        state->result.xml += ' ';
        state->result.xml += data;
    }
    state->result.xml += "?>";
}

void XMLCALL on_xml_decl(void* user_data, const XML_Char* version,
                         const XML_Char* encoding, int standalone) {
    auto* state = static_cast<RewriteState*>(user_data);
    std::string& out = state->result.xml;
    out += "<?xml version=\"";
    out += version != nullptr ? version : "1.0";
    out += '"';
    if (encoding != nullptr) {
        out += " encoding=\"";
        out += encoding;
        out += '"';
    }
    if (standalone != -1) {
        out += standalone == 1 ? " standalone=\"yes\"" : " standalone=\"no\"";
    }
    out += "?>\n";
}

using ParserPtr = std::unique_ptr<std::remove_pointer<XML_Parser>::type, decltype(&XML_ParserFree)>;

} // namespace

SchemaAdapter::SchemaAdapter(std::string version, std::vector<AttributeRule> rules)
    : version_(std::move(version)), rules_(std::move(rules)) {
    for (const auto& rule : rules_) {
        if (rule.attribute.empty() || rule.layer_type.empty()) {
            throw std::invalid_argument("Schema rule needs a layer type and an attribute");
        }
        if (rule.action == AttributeAction::Rename && rule.rename_to.empty()) {
            throw std::invalid_argument("Rename rule for '" + rule.attribute + "' has no target");
        }
    }
}

SchemaAdapter SchemaAdapter::default_adapter(const std::vector<std::string>& extra_ignored) {
    std::vector<AttributeRule> rules;
    for (const char* attribute : kVersion1Dropped) {
        rules.push_back({"*", attribute, AttributeAction::Drop, ""});
    }
    for (const auto& attribute : extra_ignored) {
        rules.push_back({"*", attribute, AttributeAction::Drop, ""});
    }
    return SchemaAdapter(kDefaultVersion, std::move(rules));
}

const AttributeRule* SchemaAdapter::find_rule(const std::string& layer_type,
                                              const std::string& attribute) const {
    const AttributeRule* wildcard = nullptr;
    for (const auto& rule : rules_) {
        if (rule.attribute != attribute) continue;
        if (rule.layer_type == layer_type) return &rule;
        if (rule.layer_type == "*" && wildcard == nullptr) wildcard = &rule;
    }
    return wildcard;
}

AdaptResult SchemaAdapter::adapt(const std::string& xml) const {
    ParserPtr parser(XML_ParserCreate(nullptr), &XML_ParserFree);
    if (!parser) {
        throw ModelLoadError("Failed to create XML parser");
    }

    RewriteState state;
    state.adapter = this;
    state.result.xml.reserve(xml.size());

    XML_SetUserData(parser.get(), &state);
    XML_SetElementHandler(parser.get(), on_start, on_end);
    XML_SetCharacterDataHandler(parser.get(), on_text);
    XML_SetCommentHandler(parser.get(), on_comment);
    XML_SetProcessingInstructionHandler(parser.get(), on_processing_instruction);
    XML_SetXmlDeclHandler(parser.get(), on_xml_decl);

    const size_t chunk = 1 << 20;
    size_t offset = 0;
    do {
        size_t len = std::min(chunk, xml.size() - offset);
        bool last = offset + len >= xml.size();
        if (XML_Parse(parser.get(), xml.data() + offset, static_cast<int>(len),
                      last ? XML_TRUE : XML_FALSE) == XML_STATUS_ERROR) {
            throw ModelLoadError(
                std::string("Malformed model topology at line ") +
                std::to_string(XML_GetCurrentLineNumber(parser.get())) + ": " +
                XML_ErrorString(XML_GetErrorCode(parser.get())));
        }
        offset += len;
    } while (offset < xml.size());

    return std::move(state.result);
}

} // namespace shikaku
